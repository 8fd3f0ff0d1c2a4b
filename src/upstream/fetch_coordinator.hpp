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

// Waypoint Fetch Coordinator - Header
// Request deduplication, minimum-interval throttling and last-known-good caching

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "fetcher.hpp"

namespace waypoint::upstream {

/// Key shared by every caller that wants the full routing snapshot
inline constexpr std::string_view kSnapshotKey = "routing-snapshot";

/// Items projected out of a snapshot, or the fetch error
template <typename T>
struct Projection {
    std::vector<T> items;
    core::Error error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

/// Coordinator state exposed by the health endpoint
struct CoordinatorStatus {
    bool has_snapshot = false;
    bool in_flight = false;
    uint64_t fetch_count = 0;          // Upstream round trips started
    uint64_t last_success_unix_ms = 0;  // 0 when never succeeded
    uint64_t last_attempt_unix_ms = 0;
    std::string last_error;
    std::string source_type;
};

/// Wraps an UpstreamFetcher so that:
///  - concurrent callers with the same key share one in-flight fetch and its result;
///  - a fetch completing less than `min_interval` ago is not repeated: the cached snapshot
///    is returned, or a `throttled` error when nothing is cached yet;
///  - the last successful snapshot is kept until a newer success replaces it.
class FetchCoordinator {
public:
    FetchCoordinator(std::shared_ptr<UpstreamFetcher> fetcher,
                     std::chrono::milliseconds min_interval);

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    /// Snapshot for `key`. The in-flight fetch runs with the first caller's context.
    [[nodiscard]] FetchResult fetch(const core::FetchContext& ctx,
                                    std::string_view key = kSnapshotKey);

    [[nodiscard]] Projection<model::Router> routers(const core::FetchContext& ctx,
                                                    model::Protocol protocol);
    [[nodiscard]] Projection<model::Service> services(const core::FetchContext& ctx,
                                                      model::Protocol protocol);
    [[nodiscard]] Projection<model::Middleware> middlewares(const core::FetchContext& ctx,
                                                            model::Protocol protocol);

    /// Routes surfaced by the current fetcher's filtering rules
    [[nodiscard]] Projection<model::DiscoveredResource> resources(const core::FetchContext& ctx);

    /// Last successful snapshot, or null
    [[nodiscard]] std::shared_ptr<const model::RoutingSnapshot> cached() const;

    /// Swap the underlying fetcher (configuration reload); drops the cache and throttle state
    void replace_fetcher(std::shared_ptr<UpstreamFetcher> fetcher);

    /// Forget the throttle window so the next call reaches the upstream
    void invalidate();

    [[nodiscard]] std::shared_ptr<UpstreamFetcher> fetcher() const;

    [[nodiscard]] CoordinatorStatus status() const;

private:
    using clock = std::chrono::steady_clock;

    /// Run the fetch and publish the result (called by the in-flight owner only)
    [[nodiscard]] FetchResult execute(const core::FetchContext& ctx,
                                      const std::shared_ptr<UpstreamFetcher>& fetcher,
                                      uint64_t generation);

    std::chrono::milliseconds min_interval_;

    // Dedup registry: key -> in-flight result
    mutable std::mutex inflight_mutex_;
    core::fast_map<std::string, std::shared_future<FetchResult>> inflight_;

    // Cache and throttle state (read-mostly)
    mutable std::shared_mutex state_mutex_;
    std::shared_ptr<UpstreamFetcher> fetcher_;
    std::shared_ptr<const model::RoutingSnapshot> snapshot_;
    std::optional<clock::time_point> last_completed_;
    uint64_t last_success_unix_ms_ = 0;
    uint64_t last_attempt_unix_ms_ = 0;
    std::string last_error_;
    uint64_t generation_ = 0;  // Bumped by replace_fetcher; stale results are discarded

    std::atomic<uint64_t> fetch_count_{0};
};

}  // namespace waypoint::upstream
