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


// Waypoint Service Reconciler - Implementation

#include "service_reconciler.hpp"

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "id_normalizer.hpp"

namespace waypoint::reconcile {

namespace {

// Key order is not significant when comparing stored and observed bodies
bool same_config(const model::Document& a, const model::Document& b) {
    return nlohmann::json::parse(a.dump()) == nlohmann::json::parse(b.dump());
}

}  // namespace

std::optional<store::StoredService> service_record(const model::Service& service,
                                                   model::Protocol protocol,
                                                   std::string_view source_type) {
    if (service.provider == "internal" || service.type.empty()) {
        return std::nullopt;
    }

    auto body = service.config.find(service.type);
    if (body == service.config.end() || !body->is_object()) {
        return std::nullopt;
    }

    store::StoredService record;
    record.id = normalize_id(service.name);
    record.name = format_service_name(service.name);
    record.type = service.type;
    record.config = *body;
    if (protocol == model::Protocol::Udp) {
        record.config["protocol"] = "udp";
    }
    record.source_type = std::string(source_type);
    return record;
}

ServiceReconciler::ServiceReconciler(upstream::FetchCoordinator& coordinator,
                                     store::SqliteStore& store)
    : coordinator_(coordinator), store_(store) {}

ReconcileOutcome ServiceReconciler::reconcile(const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();
    ReconcileOutcome outcome;
    auto& summary = outcome.summary;

    auto fetched = coordinator_.fetch(ctx);
    if (!fetched.ok()) {
        LOG_ERROR_CTX(logger, "Service reconciliation skipped", "service_reconciler",
                      fetched.error.code.message(), fetched.error.message);
        outcome.error = std::move(fetched.error);
        return outcome;
    }

    const auto& snapshot = *fetched.snapshot;
    core::fast_set<std::string> seen;

    for (auto protocol : {model::Protocol::Http, model::Protocol::Tcp, model::Protocol::Udp}) {
        for (const auto& service : snapshot.section(protocol).services) {
            ++summary.observed;

            auto record = service_record(service, protocol, snapshot.source_type);
            if (!record || record->id.empty()) {
                ++summary.skipped;
                continue;
            }
            if (!seen.insert(record->id).second) {
                continue;
            }

            try {
                auto tx = store_.begin();
                auto existing = store_.find_service(*tx, record->id);
                if (!existing) {
                    store_.insert_service(*tx, *record);
                    tx->commit();
                    ++summary.created;
                    LOG_INFO(logger, "Added new service {} ({})", record->id, record->type);
                    continue;
                }

                if (existing->type != record->type || !same_config(existing->config, record->config) ||
                    existing->status != store::kStatusActive) {
                    store_.update_service(*tx, *record);
                    tx->commit();
                    ++summary.updated;
                    LOG_INFO(logger, "Updated service {}", record->id);
                }
            } catch (const store::StoreError& e) {
                ++summary.failed;
                LOG_ERROR(logger, "Error processing service {}: {}", record->id, e.what());
            }
        }
    }

    std::vector<store::StoredService> stored;
    try {
        stored = store_.list_services();
    } catch (const store::StoreError& e) {
        LOG_ERROR(logger, "Failed to list services: {}", e.what());
        outcome.error = core::Error(core::Errc::storage_failed, e.what());
        return outcome;
    }

    for (const auto& service : stored) {
        if (service.status != store::kStatusActive || seen.contains(service.id)) {
            continue;
        }
        if (service.source_type.empty() || service.source_type == "manual") {
            continue;
        }
        try {
            if (store_.disable_service(service.id)) {
                ++summary.disabled;
                LOG_INFO(logger, "Service {} no longer exists upstream, marked disabled",
                         service.id);
            }
        } catch (const store::StoreError& e) {
            LOG_ERROR(logger, "Error marking service {} as disabled: {}", service.id, e.what());
        }
    }

    LOG_INFO(logger,
             "Service reconciliation: {} observed, {} created, {} updated, {} skipped, "
             "{} failed, {} disabled",
             summary.observed, summary.created, summary.updated, summary.skipped, summary.failed,
             summary.disabled);
    return outcome;
}

}  // namespace waypoint::reconcile
