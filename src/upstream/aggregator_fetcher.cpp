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

// Waypoint Aggregator Fetcher - Implementation

#include "aggregator_fetcher.hpp"

#include <fmt/format.h>

#include <chrono>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "rule_parser.hpp"
#include "system_routers.hpp"

namespace waypoint::upstream {

namespace {

constexpr std::string_view kConfigPath = "/traefik-config";

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Collection member of a protocol section; absent, null or mistyped yields null
const model::Document* collection(const model::Document& plane, const char* key) {
    if (!plane.is_object()) {
        return nullptr;
    }
    auto it = plane.find(key);
    if (it == plane.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

void decode_plane(const model::Document& root, model::Protocol protocol,
                  model::ProtocolSection& out) {
    auto it = root.find(std::string(model::protocol_name(protocol)));
    if (it == root.end()) {
        return;
    }
    const auto& plane = *it;

    if (const auto* routers = collection(plane, "routers")) {
        for (const auto& [name, value] : routers->items()) {
            auto router = model::router_from_document(name, value);
            router.provider = kAggregatorProvider;
            router.status = "enabled";
            out.routers.push_back(std::move(router));
        }
    }

    if (const auto* services = collection(plane, "services")) {
        for (const auto& [name, value] : services->items()) {
            auto service = model::service_from_document(name, value);
            service.provider = kAggregatorProvider;
            out.services.push_back(std::move(service));
        }
    }

    if (const auto* middlewares = collection(plane, "middlewares")) {
        for (const auto& [name, value] : middlewares->items()) {
            auto middleware = model::middleware_from_document(name, value);
            middleware.provider = kAggregatorProvider;
            out.middlewares.push_back(std::move(middleware));
        }
    }
}

}  // namespace

AggregatorFetcher::AggregatorFetcher(control::UpstreamConfig config, core::HttpClient& http)
    : config_(std::move(config)), http_(http) {
    config_.url = trim_trailing_slash(config_.url);
    options_.username = config_.username;
    options_.password = config_.password;
    options_.skip_tls_verify = config_.skip_tls_verify;
    options_.timeout = std::chrono::milliseconds(config_.timeout_ms);
    options_.max_body_bytes = config_.max_body_bytes;
    options_.headers.emplace_back("Content-Type", "application/json");
}

FetchResult AggregatorFetcher::fetch(const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();
    const std::string url = config_.url + std::string(kConfigPath);
    auto start = std::chrono::steady_clock::now();

    auto response = http_.get(url, options_, ctx);
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

    if (response.error) {
        LOG_FETCH(logger, model::kSourcePangolin, url, "failed", duration_ms);
        LOG_ERROR_CTX(logger, "Aggregator request failed", "aggregator_fetcher",
                      response.error.code.value(), response.error.message);
        return FetchResult::failure(std::move(response.error));
    }

    if (response.status != 200) {
        LOG_FETCH(logger, model::kSourcePangolin, url, "failed", duration_ms);
        return FetchResult::failure(core::Error(
            core::Errc::unexpected_status, fmt::format("unexpected status code: {}", response.status)));
    }

    auto result = decode(response.body);
    if (!result.ok()) {
        LOG_ERROR_CTX(logger, "Aggregator response rejected", "aggregator_fetcher",
                      result.error.code.value(), result.error.message);
        return result;
    }

    LOG_FETCH(logger, model::kSourcePangolin, url, "succeeded", duration_ms);
    const auto& snapshot = *result.snapshot;
    LOG_INFO(logger,
             "Aggregator config: {} HTTP routers, {} HTTP services, {} HTTP middlewares, "
             "{} TCP routers, {} UDP routers",
             snapshot.http.routers.size(), snapshot.http.services.size(),
             snapshot.http.middlewares.size(), snapshot.tcp.routers.size(),
             snapshot.udp.routers.size());
    return result;
}

FetchResult AggregatorFetcher::decode(std::string_view body) {
    model::Document root;
    try {
        root = model::Document::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return FetchResult::failure(core::Error(
            core::Errc::decode_failed, fmt::format("failed to decode aggregator response: {}", e.what())));
    }

    if (root.is_null()) {
        root = model::Document::object();
    }
    if (!root.is_object()) {
        return FetchResult::failure(
            core::Error(core::Errc::decode_failed,
                        "failed to decode aggregator response: document is not an object"));
    }

    auto snapshot = std::make_shared<model::RoutingSnapshot>();
    snapshot->source_type = model::kSourcePangolin;

    for (auto protocol : {model::Protocol::Http, model::Protocol::Tcp, model::Protocol::Udp}) {
        decode_plane(root, protocol, snapshot->section(protocol));
    }

    if (auto tls = root.find("tls"); tls != root.end() && tls->is_object()) {
        snapshot->tls = *tls;
    }

    return FetchResult::success(std::move(snapshot));
}

std::vector<model::DiscoveredResource> AggregatorFetcher::surface_resources(
    const model::RoutingSnapshot& snapshot) const {
    std::vector<model::DiscoveredResource> resources;
    resources.reserve(snapshot.http.routers.size());

    for (const auto& router : snapshot.http.routers) {
        if (is_aggregator_system_router(router.name)) {
            continue;
        }

        auto host = extract_host(router.rule);
        if (host.empty()) {
            continue;
        }

        model::DiscoveredResource resource;
        resource.id = router.name;
        resource.host = std::move(host);
        resource.service_id = router.service;
        resource.entrypoints = core::join(router.entry_points, ",");
        resource.tls_domains = model::join_tls_domains(router.tls_domains);
        resource.router_priority =
            router.priority == 0 ? model::kDefaultRouterPriority : router.priority;
        resource.source_type = model::kSourcePangolin;
        resources.push_back(std::move(resource));
    }

    return resources;
}

}  // namespace waypoint::upstream
