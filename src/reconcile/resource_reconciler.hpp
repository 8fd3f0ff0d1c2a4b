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


// Waypoint Resource Reconciler - Header
// Mirror the routes surfaced by the upstream into the resources table

#pragma once

#include <cstddef>
#include <string>

#include "../core/errors.hpp"
#include "../core/fetch_context.hpp"
#include "../store/sqlite_store.hpp"
#include "../upstream/fetch_coordinator.hpp"

namespace waypoint::reconcile {

/// Counters for one reconciliation cycle
struct ReconcileSummary {
    size_t observed = 0;
    size_t created = 0;
    size_t updated = 0;
    size_t skipped = 0;   // Routes without host or service
    size_t failed = 0;    // Per-item transactions rolled back
    size_t disabled = 0;
};

struct ReconcileOutcome {
    ReconcileSummary summary;
    core::Error error;  // Set only when the fetch or the initial listing failed

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

/// Keeps one stored resource per observed host. Stored rows keep their internal id when
/// the upstream renames a router; rows whose route disappeared are disabled, never deleted.
class ResourceReconciler {
public:
    ResourceReconciler(upstream::FetchCoordinator& coordinator, store::SqliteStore& store);

    ResourceReconciler(const ResourceReconciler&) = delete;
    ResourceReconciler& operator=(const ResourceReconciler&) = delete;

    /// One cycle. A fetch failure leaves storage untouched.
    [[nodiscard]] ReconcileOutcome reconcile(const core::FetchContext& ctx);

private:
    enum class Upsert { Created, Updated };

    /// Match by upstream id, then host, then legacy id, else create. Throws StoreError.
    Upsert upsert(const model::DiscoveredResource& observed, std::string& internal_id);

    upstream::FetchCoordinator& coordinator_;
    store::SqliteStore& store_;
};

}  // namespace waypoint::reconcile
