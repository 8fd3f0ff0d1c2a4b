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


// Waypoint Config Merger - Header
// Upstream snapshot plus stored overrides, published as one Traefik dynamic configuration

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "../control/config.hpp"
#include "../core/errors.hpp"
#include "../core/fetch_context.hpp"
#include "../store/certificate_authority.hpp"
#include "../store/sqlite_store.hpp"
#include "../upstream/fetch_coordinator.hpp"

namespace waypoint::merge {

struct MergeResult {
    std::shared_ptr<const model::Document> document;
    core::Error error;
    bool stale = false;  // Served from an expired cache after a failed fetch

    [[nodiscard]] bool ok() const noexcept { return document != nullptr; }
};

struct MergeStatus {
    bool has_cache = false;
    bool cache_fresh = false;
    uint64_t build_count = 0;
    uint64_t last_build_unix_ms = 0;
    std::string last_error;
};

/// Builds the published document and caches it for `cache_ttl_ms`.
///
/// Readers of a fresh cache only take the shared lock. One caller at a time rebuilds on a
/// miss; the exclusive lock is held only to swap the new document in.
class ConfigMerger {
public:
    ConfigMerger(upstream::FetchCoordinator& coordinator, store::SqliteStore& store,
                 store::CertificateAuthority& authority, control::MergeConfig config);

    ConfigMerger(const ConfigMerger&) = delete;
    ConfigMerger& operator=(const ConfigMerger&) = delete;

    /// Cached document, or a fresh merge. On a failed fetch the previous document is served
    /// when there is one.
    [[nodiscard]] MergeResult get_merged_config(const core::FetchContext& ctx);

    /// Expire the cache and the fetch throttle so the next call reaches the upstream
    void invalidate_cache();

    /// Apply a reloaded merge section; takes effect from the next rebuild
    void update_config(const control::MergeConfig& config);

    /// Merge `snapshot` with the current storage contents. Throws StoreError.
    [[nodiscard]] model::Document build(const model::RoutingSnapshot& snapshot);

    [[nodiscard]] MergeStatus status() const;

private:
    using clock = std::chrono::steady_clock;

    /// Cached document when still fresh, else null
    [[nodiscard]] std::shared_ptr<const model::Document> fresh_cache() const;

    void record_error(const std::string& message);

    upstream::FetchCoordinator& coordinator_;
    store::SqliteStore& store_;
    store::CertificateAuthority& authority_;

    // Serializes rebuilds
    std::mutex build_mutex_;

    mutable std::shared_mutex cache_mutex_;
    control::MergeConfig config_;
    std::shared_ptr<const model::Document> cache_;
    clock::time_point expiry_{};
    uint64_t last_build_unix_ms_ = 0;
    std::string last_error_;

    std::atomic<uint64_t> build_count_{0};
};

}  // namespace waypoint::merge
