/*
 * Copyright 2025 Waypoint Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Waypoint Admin Server - Implementation

#include "admin_server.hpp"

#include <httplib.h>

#include "../core/logging.hpp"

namespace waypoint::runtime {

namespace {

std::string error_body(std::string_view error, std::string_view details) {
    nlohmann::json body;
    body["error"] = error;
    body["details"] = details;
    return body.dump();
}

}  // namespace

AdminServer::AdminServer(const control::AdminConfig& config, merge::ConfigMerger& merger,
                         upstream::FetchCoordinator& coordinator,
                         std::chrono::milliseconds fetch_timeout)
    : config_(config),
      merger_(merger),
      coordinator_(coordinator),
      fetch_timeout_(fetch_timeout),
      server_(std::make_unique<httplib::Server>()) {
    auto route = [this](const httplib::Request& req, httplib::Response& res) {
        auto response = handle(req.method, req.path);
        res.status = response.status;
        res.set_content(response.body, response.content_type);
    };

    server_->Get("/api/traefik-config", route);
    server_->Post("/api/traefik-config/invalidate", route);
    server_->Get("/api/traefik-config/status", route);
    server_->Get("/health", route);
    server_->Get("/_health", route);
}

AdminServer::~AdminServer() {
    stop();
}

std::error_code AdminServer::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    if (!server_->bind_to_port(config_.listen_address, config_.port)) {
        auto* logger = logging::get_current_logger();
        LOG_ERROR(logger, "Admin server failed to bind {}:{}", config_.listen_address,
                  config_.port);
        return std::make_error_code(std::errc::address_in_use);
    }

    running_.store(true, std::memory_order_relaxed);
    return {};
}

void AdminServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    server_->stop();
}

void AdminServer::run() {
    auto* logger = logging::get_current_logger();
    LOG_INFO(logger, "Admin server listening on {}:{}", config_.listen_address, config_.port);

    if (!server_->listen_after_bind()) {
        if (running_.load(std::memory_order_relaxed)) {
            LOG_ERROR(logger, "Admin server stopped unexpectedly");
        }
    }
    running_.store(false, std::memory_order_relaxed);
}

AdminResponse AdminServer::handle(std::string_view method, std::string_view path) {
    if (method == "GET") {
        if (path == "/api/traefik-config") {
            return traefik_config();
        }
        if (path == "/api/traefik-config/status") {
            return config_status();
        }
        if (path == "/health" || path == "/_health") {
            return health();
        }
    }

    if (method == "POST" && path == "/api/traefik-config/invalidate") {
        return invalidate();
    }

    return AdminResponse{404, "text/plain", "Not Found"};
}

AdminResponse AdminServer::traefik_config() {
    core::FetchContext ctx(fetch_timeout_);
    auto result = merger_.get_merged_config(ctx);
    if (!result.ok()) {
        return AdminResponse{500, "application/json",
                             error_body("Failed to get Traefik configuration", result.error.message)};
    }
    return AdminResponse{200, "application/json", result.document->dump()};
}

AdminResponse AdminServer::invalidate() {
    merger_.invalidate_cache();

    auto* logger = logging::get_current_logger();
    LOG_INFO(logger, "Merged configuration cache invalidated");
    return AdminResponse{200, "application/json",
                         R"({"message":"Cache invalidated successfully"})"};
}

AdminResponse AdminServer::config_status() {
    core::FetchContext ctx(fetch_timeout_);
    auto result = merger_.get_merged_config(ctx);

    nlohmann::json body;
    body["status"] = result.ok() ? "healthy" : "unhealthy";
    body["message"] = "Config proxy is operational";
    if (result.stale) {
        body["stale"] = true;
    }
    if (!result.ok()) {
        body["error"] = result.error.message;
    }
    return AdminResponse{200, "application/json", body.dump()};
}

AdminResponse AdminServer::health() {
    auto fetch = coordinator_.status();
    auto merge = merger_.status();

    nlohmann::json body;
    body["status"] = fetch.last_success_unix_ms != 0 ? "healthy" : "starting";
    body["source_type"] = fetch.source_type;
    body["fetch"] = {
        {"has_snapshot", fetch.has_snapshot},
        {"in_flight", fetch.in_flight},
        {"fetch_count", fetch.fetch_count},
        {"last_success_unix_ms", fetch.last_success_unix_ms},
        {"last_attempt_unix_ms", fetch.last_attempt_unix_ms},
        {"last_error", fetch.last_error},
    };
    body["merge"] = {
        {"has_cache", merge.has_cache},
        {"cache_fresh", merge.cache_fresh},
        {"build_count", merge.build_count},
        {"last_build_unix_ms", merge.last_build_unix_ms},
        {"last_error", merge.last_error},
    };
    return AdminResponse{200, "application/json", body.dump()};
}

}  // namespace waypoint::runtime
