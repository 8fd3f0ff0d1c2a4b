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


// Waypoint Resource Reconciler - Implementation

#include "resource_reconciler.hpp"

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../core/uuid.hpp"
#include "id_normalizer.hpp"

namespace waypoint::reconcile {

ResourceReconciler::ResourceReconciler(upstream::FetchCoordinator& coordinator,
                                       store::SqliteStore& store)
    : coordinator_(coordinator), store_(store) {}

ReconcileOutcome ResourceReconciler::reconcile(const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();
    ReconcileOutcome outcome;
    auto& summary = outcome.summary;

    auto fetched = coordinator_.resources(ctx);
    if (!fetched.ok()) {
        LOG_ERROR_CTX(logger, "Resource reconciliation skipped", "resource_reconciler",
                      fetched.error.code.message(), fetched.error.message);
        outcome.error = std::move(fetched.error);
        return outcome;
    }

    std::vector<std::string> previously_active;
    try {
        previously_active = store_.active_resource_ids();
    } catch (const store::StoreError& e) {
        LOG_ERROR(logger, "Failed to list active resources: {}", e.what());
        outcome.error = core::Error(core::Errc::storage_failed, e.what());
        return outcome;
    }

    summary.observed = fetched.items.size();
    if (fetched.items.empty()) {
        LOG_INFO(logger, "No resources found upstream; disabling {} active resources",
                 previously_active.size());
    }

    core::fast_set<std::string> touched;
    for (const auto& observed : fetched.items) {
        if (observed.host.empty() || observed.service_id.empty()) {
            ++summary.skipped;
            continue;
        }

        std::string internal_id;
        try {
            if (upsert(observed, internal_id) == Upsert::Created) {
                ++summary.created;
            } else {
                ++summary.updated;
            }
            touched.insert(std::move(internal_id));
        } catch (const store::StoreError& e) {
            ++summary.failed;
            LOG_ERROR(logger, "Error processing resource {}: {}", observed.id, e.what());
        }
    }

    for (const auto& id : previously_active) {
        if (touched.contains(id)) {
            continue;
        }
        try {
            if (store_.disable_resource(id)) {
                ++summary.disabled;
                LOG_INFO(logger, "Resource {} no longer exists upstream, marked disabled", id);
            }
        } catch (const store::StoreError& e) {
            LOG_ERROR(logger, "Error marking resource {} as disabled: {}", id, e.what());
        }
    }

    LOG_INFO(logger,
             "Resource reconciliation: {} observed, {} created, {} updated, {} skipped, "
             "{} failed, {} disabled",
             summary.observed, summary.created, summary.updated, summary.skipped, summary.failed,
             summary.disabled);
    return outcome;
}

ResourceReconciler::Upsert ResourceReconciler::upsert(const model::DiscoveredResource& observed,
                                                      std::string& internal_id) {
    auto* logger = logging::get_current_logger();
    auto upstream_id = normalize_id(observed.id);

    auto tx = store_.begin();

    auto existing = store_.find_active_by_upstream_id(*tx, upstream_id);
    if (!existing) {
        existing = store_.find_active_by_host(*tx, observed.host);
        if (existing) {
            LOG_INFO(logger, "Resource {} for host {} now reported as {}", existing->id,
                     observed.host, upstream_id);
        }
    }
    if (!existing) {
        existing = store_.find_legacy(*tx, upstream_id, observed.host);
        if (existing) {
            LOG_INFO(logger, "Adopting legacy resource {} for host {}", existing->id,
                     observed.host);
        }
    }

    if (existing) {
        store_.update_resource(*tx, existing->id, upstream_id, observed);
        tx->commit();
        internal_id = existing->id;
        return Upsert::Updated;
    }

    internal_id = core::generate_uuid();
    store_.insert_resource(*tx, internal_id, upstream_id, observed);
    tx->commit();
    LOG_INFO(logger, "Added new resource {} (internal: {}, upstream: {})", observed.host,
             internal_id, upstream_id);
    return Upsert::Created;
}

}  // namespace waypoint::reconcile
