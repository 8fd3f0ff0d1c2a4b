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

// Waypoint Upstream Fetcher - Header
// Capability shared by the aggregator and native Traefik API fetchers

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/errors.hpp"
#include "../core/fetch_context.hpp"
#include "../model/routing.hpp"

namespace waypoint::upstream {

/// Outcome of one fetch: a snapshot or an error, never both
struct FetchResult {
    std::shared_ptr<const model::RoutingSnapshot> snapshot;
    core::Error error;

    [[nodiscard]] bool ok() const noexcept { return snapshot != nullptr && !error; }

    [[nodiscard]] static FetchResult success(std::shared_ptr<const model::RoutingSnapshot> s) {
        FetchResult result;
        result.snapshot = std::move(s);
        return result;
    }

    [[nodiscard]] static FetchResult failure(core::Error e) {
        FetchResult result;
        result.error = std::move(e);
        return result;
    }
};

/// Source of routing snapshots (implementations are safe for concurrent fetch() calls)
class UpstreamFetcher {
public:
    virtual ~UpstreamFetcher() = default;

    /// Retrieve a complete snapshot within the context deadline
    [[nodiscard]] virtual FetchResult fetch(const core::FetchContext& ctx) = 0;

    /// Routes worth tracking as resources, after host extraction and system-router filtering
    [[nodiscard]] virtual std::vector<model::DiscoveredResource> surface_resources(
        const model::RoutingSnapshot& snapshot) const = 0;

    /// "pangolin_api" or "traefik_api"
    [[nodiscard]] virtual std::string_view source_type() const noexcept = 0;

    /// Base URL used for logging and status reporting
    [[nodiscard]] virtual std::string base_url() const = 0;
};

}  // namespace waypoint::upstream
