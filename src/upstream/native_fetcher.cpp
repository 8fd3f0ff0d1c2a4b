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

// Waypoint Native Fetcher - Implementation

#include "native_fetcher.hpp"

#include <fmt/format.h>

#include <chrono>
#include <future>
#include <system_error>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "array_or_map.hpp"
#include "rule_parser.hpp"
#include "system_routers.hpp"

namespace waypoint::upstream {

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool is_collection(std::string_view name) {
    return name != "overview" && name != "version" && name != "entrypoints";
}

// Assign a decoded collection to its place in the snapshot
template <typename Item, typename Decode>
void fill(std::vector<Item>& out, const model::Document& payload, Decode decode) {
    auto decoded = decode_array_or_map(payload);
    out.reserve(decoded.items.size());
    for (auto& item : decoded.items) {
        out.push_back(decode(std::move(item.name), item.value));
    }
}

void assign(model::RoutingSnapshot& snapshot, std::string_view name,
            const model::Document& payload) {
    if (name == "http_routers") {
        fill(snapshot.http.routers, payload, model::router_from_document);
    } else if (name == "http_services") {
        fill(snapshot.http.services, payload, model::service_from_document);
    } else if (name == "http_middlewares") {
        fill(snapshot.http.middlewares, payload, model::middleware_from_document);
    } else if (name == "tcp_routers") {
        fill(snapshot.tcp.routers, payload, model::router_from_document);
    } else if (name == "tcp_services") {
        fill(snapshot.tcp.services, payload, model::service_from_document);
    } else if (name == "tcp_middlewares") {
        fill(snapshot.tcp.middlewares, payload, model::middleware_from_document);
    } else if (name == "udp_routers") {
        fill(snapshot.udp.routers, payload, model::router_from_document);
    } else if (name == "udp_services") {
        fill(snapshot.udp.services, payload, model::service_from_document);
    } else if (name == "overview") {
        snapshot.overview = payload;
    } else if (name == "version") {
        snapshot.version = payload;
    } else if (name == "entrypoints") {
        snapshot.entrypoints = payload;
    }
}

}  // namespace

NativeFetcher::NativeFetcher(control::UpstreamConfig config, core::HttpClient& http)
    : config_(std::move(config)), http_(http) {
    config_.url = trim_trailing_slash(config_.url);
    options_.username = config_.username;
    options_.password = config_.password;
    options_.skip_tls_verify = config_.skip_tls_verify;
    options_.timeout = std::chrono::milliseconds(config_.timeout_ms);
    options_.max_body_bytes = config_.max_body_bytes;
}

std::vector<std::string> NativeFetcher::fallback_candidates() const {
    std::vector<std::string> candidates;
    for (const auto& url : config_.fallback_urls) {
        auto trimmed = trim_trailing_slash(url);
        if (trimmed != config_.url) {
            candidates.push_back(std::move(trimmed));
        }
    }
    return candidates;
}

FetchResult NativeFetcher::fetch(const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();
    LOG_DEBUG(logger, "Fetching routing data from Traefik API at {}", config_.url);

    auto primary = fetch_from(config_.url, ctx);
    if (primary.result.ok() || !primary.connection_failed) {
        return std::move(primary.result);
    }

    LOG_WARNING(logger, "Failed to connect to primary Traefik API URL {}: {}", config_.url,
                primary.result.error.message);

    core::Error last_error = std::move(primary.result.error);
    for (const auto& url : fallback_candidates()) {
        if (ctx.done()) {
            last_error = core::Error(core::Errc::cancelled, "fetch deadline exceeded");
            break;
        }

        LOG_INFO(logger, "Trying fallback Traefik API URL: {}", url);
        auto attempt = fetch_from(url, ctx);
        if (attempt.result.ok()) {
            LOG_INFO(logger, "Successfully connected to Traefik API at {}", url);
            LOG_WARNING(logger,
                        "IMPORTANT: Consider updating the Traefik API URL to {} in the settings",
                        url);
            return std::move(attempt.result);
        }

        LOG_WARNING(logger, "Fallback URL {} failed: {}", url, attempt.result.error.message);
        last_error = std::move(attempt.result.error);
    }

    return FetchResult::failure(core::Error(
        core::Errc::all_urls_failed,
        fmt::format("all Traefik API connection attempts failed, last error: {}",
                    last_error.message)));
}

EndpointResult NativeFetcher::fetch_endpoint(const std::string& base, const EndpointSpec& spec,
                                             const core::FetchContext& ctx) {
    EndpointResult result;
    result.spec = &spec;

    auto response = http_.get(base + std::string(spec.path), options_, ctx);
    result.status = response.status;
    if (response.error) {
        result.error = std::move(response.error);
        return result;
    }

    if (response.status != 200) {
        result.error = core::Error(core::Errc::unexpected_status,
                                   fmt::format("unexpected status code: {}", response.status));
        return result;
    }

    try {
        result.payload = model::Document::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        result.error = core::Error(core::Errc::decode_failed, e.what());
        return result;
    }

    if (is_collection(spec.name)) {
        auto decoded = decode_array_or_map(result.payload);
        if (decoded.error) {
            result.error = std::move(decoded.error);
        }
    }
    return result;
}

NativeFetcher::Attempt NativeFetcher::fetch_from(const std::string& base,
                                                 const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();
    auto start = std::chrono::steady_clock::now();

    // Fan out: every endpoint runs to completion, none cancels another
    std::vector<std::future<EndpointResult>> pending;
    std::vector<EndpointResult> results;
    pending.reserve(kNativeEndpoints.size());
    results.reserve(kNativeEndpoints.size());

    for (const auto& spec : kNativeEndpoints) {
        try {
            pending.push_back(std::async(std::launch::async, [this, &base, &spec, &ctx] {
                return fetch_endpoint(base, spec, ctx);
            }));
        } catch (const std::system_error& e) {
            // Could not start a task; run this endpoint inline
            LOG_WARNING(logger, "Endpoint task for {} not started ({}), fetching inline",
                        spec.name, e.what());
            results.push_back(fetch_endpoint(base, spec, ctx));
        }
    }

    for (auto& future : pending) {
        results.push_back(future.get());
    }

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

    // Classify in endpoint declaration order so aggregated messages are stable
    std::vector<std::string> critical_errors;
    bool server_answered = false;
    bool transport_failed = false;
    auto snapshot = std::make_shared<model::RoutingSnapshot>();
    snapshot->source_type = model::kSourceTraefik;

    for (const auto& spec : kNativeEndpoints) {
        for (const auto& result : results) {
            if (result.spec != &spec) {
                continue;
            }

            if (!result.error) {
                assign(*snapshot, spec.name, result.payload);
                continue;
            }

            if (spec.critical) {
                critical_errors.push_back(fmt::format("{}: {}", spec.name, result.error.message));
                if (result.status != 0) {
                    server_answered = true;
                } else if (result.error.is(core::Errc::transport_failed)) {
                    transport_failed = true;
                }
            } else {
                LOG_WARNING(logger, "Non-critical endpoint failed: {}: {}", spec.name,
                            result.error.message);
            }
        }
    }

    Attempt attempt;
    if (!critical_errors.empty()) {
        LOG_FETCH(logger, model::kSourceTraefik, base, "failed", duration_ms);
        attempt.connection_failed = transport_failed && !server_answered;
        attempt.result = FetchResult::failure(
            core::Error(core::Errc::critical_endpoints_failed,
                        "critical endpoints failed: " + core::join(critical_errors, "; ")));
        return attempt;
    }

    LOG_FETCH(logger, model::kSourceTraefik, base, "succeeded", duration_ms);
    LOG_INFO(logger,
             "Fetched full data: {} HTTP routers, {} TCP routers, {} UDP routers, "
             "{} services, {} middlewares",
             snapshot->http.routers.size(), snapshot->tcp.routers.size(),
             snapshot->udp.routers.size(),
             snapshot->http.services.size() + snapshot->tcp.services.size() +
                 snapshot->udp.services.size(),
             snapshot->http.middlewares.size() + snapshot->tcp.middlewares.size());

    attempt.result = FetchResult::success(std::move(snapshot));
    return attempt;
}

std::vector<model::DiscoveredResource> NativeFetcher::surface_resources(
    const model::RoutingSnapshot& snapshot) const {
    auto* logger = logging::get_current_logger();
    std::vector<model::DiscoveredResource> resources;
    resources.reserve(snapshot.http.routers.size());

    for (const auto& router : snapshot.http.routers) {
        if (router.provider == "internal") {
            continue;
        }

        if (config_.require_cert_resolver && router.cert_resolver.empty()) {
            continue;
        }

        if (is_traefik_system_router(router.name)) {
            continue;
        }

        auto host = extract_host(router.rule);
        if (host.empty()) {
            LOG_DEBUG(logger, "Could not extract host from rule: {}", router.rule);
            continue;
        }

        model::DiscoveredResource resource;
        resource.id = router.name;
        resource.host = std::move(host);
        resource.service_id = router.service;
        resource.entrypoints = core::join(router.entry_points, ",");
        resource.tls_domains = model::join_tls_domains(router.tls_domains);
        resource.router_priority = router.priority;
        resource.source_type = model::kSourceTraefik;
        resources.push_back(std::move(resource));
    }

    return resources;
}

}  // namespace waypoint::upstream
