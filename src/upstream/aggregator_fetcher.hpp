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

// Waypoint Aggregator Fetcher - Header
// Reads the complete routing document from the Pangolin aggregator API

#pragma once

#include "../control/config.hpp"
#include "../core/http_client.hpp"
#include "fetcher.hpp"

namespace waypoint::upstream {

/// Provider tag given to every item received from the aggregator
inline constexpr std::string_view kAggregatorProvider = "pangolin";

/// Fetcher for `GET {url}/traefik-config`
class AggregatorFetcher final : public UpstreamFetcher {
public:
    AggregatorFetcher(control::UpstreamConfig config, core::HttpClient& http);

    AggregatorFetcher(const AggregatorFetcher&) = delete;
    AggregatorFetcher& operator=(const AggregatorFetcher&) = delete;

    [[nodiscard]] FetchResult fetch(const core::FetchContext& ctx) override;

    [[nodiscard]] std::vector<model::DiscoveredResource> surface_resources(
        const model::RoutingSnapshot& snapshot) const override;

    [[nodiscard]] std::string_view source_type() const noexcept override {
        return model::kSourcePangolin;
    }

    [[nodiscard]] std::string base_url() const override { return config_.url; }

    /// Decode an aggregator document. Missing or null collections become empty.
    [[nodiscard]] static FetchResult decode(std::string_view body);

private:
    control::UpstreamConfig config_;
    core::HttpClient& http_;
    core::HttpRequestOptions options_;
};

}  // namespace waypoint::upstream
