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

// Waypoint Native Fetcher - Header
// Builds a routing snapshot from the Traefik management API (/api/...)

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/http_client.hpp"
#include "fetcher.hpp"

namespace waypoint::upstream {

/// One Traefik API endpoint of the fan-out
struct EndpointSpec {
    std::string_view name;
    std::string_view path;
    bool critical;
};

/// Endpoints queried on every fetch; a critical failure aborts the fetch
inline constexpr std::array<EndpointSpec, 11> kNativeEndpoints{{
    {"http_routers", "/api/http/routers", true},
    {"http_services", "/api/http/services", false},
    {"http_middlewares", "/api/http/middlewares", false},
    {"tcp_routers", "/api/tcp/routers", false},
    {"tcp_services", "/api/tcp/services", false},
    {"tcp_middlewares", "/api/tcp/middlewares", false},
    {"udp_routers", "/api/udp/routers", false},
    {"udp_services", "/api/udp/services", false},
    {"overview", "/api/overview", false},
    {"version", "/api/version", true},
    {"entrypoints", "/api/entrypoints", false},
}};

/// Outcome of one endpoint request within a single fetch pass
struct EndpointResult {
    const EndpointSpec* spec = nullptr;
    int status = 0;  // 0 when the server never answered
    model::Document payload;
    core::Error error;
};

/// Fetcher for the Traefik API with concurrent endpoint fan-out and fallback base URLs
class NativeFetcher final : public UpstreamFetcher {
public:
    NativeFetcher(control::UpstreamConfig config, core::HttpClient& http);

    NativeFetcher(const NativeFetcher&) = delete;
    NativeFetcher& operator=(const NativeFetcher&) = delete;

    /// Fetch from the configured URL; on a connection failure try each fallback once
    [[nodiscard]] FetchResult fetch(const core::FetchContext& ctx) override;

    [[nodiscard]] std::vector<model::DiscoveredResource> surface_resources(
        const model::RoutingSnapshot& snapshot) const override;

    [[nodiscard]] std::string_view source_type() const noexcept override {
        return model::kSourceTraefik;
    }

    [[nodiscard]] std::string base_url() const override { return config_.url; }

    /// Fallback URLs that would be tried after a primary connection failure
    [[nodiscard]] std::vector<std::string> fallback_candidates() const;

private:
    struct Attempt {
        FetchResult result;
        bool connection_failed = false;
    };

    /// Fan out every endpoint against one base URL and assemble the snapshot
    [[nodiscard]] Attempt fetch_from(const std::string& base, const core::FetchContext& ctx);

    [[nodiscard]] EndpointResult fetch_endpoint(const std::string& base, const EndpointSpec& spec,
                                                const core::FetchContext& ctx);

    control::UpstreamConfig config_;
    core::HttpClient& http_;
    core::HttpRequestOptions options_;
};

}  // namespace waypoint::upstream
