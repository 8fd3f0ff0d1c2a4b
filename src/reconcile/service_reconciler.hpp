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


// Waypoint Service Reconciler - Header
// Mirror upstream service definitions into the services table

#pragma once

#include <optional>

#include "../store/sqlite_store.hpp"
#include "../upstream/fetch_coordinator.hpp"
#include "resource_reconciler.hpp"

namespace waypoint::reconcile {

/// Stored form of an upstream service: id normalized, body taken from under its type key.
/// Nullopt for internal services and services of no known type.
[[nodiscard]] std::optional<store::StoredService> service_record(const model::Service& service,
                                                                 model::Protocol protocol,
                                                                 std::string_view source_type);

/// Keeps the services table in step with the upstream. Rows change only when the type or
/// the configuration differ; rows owned by an operator (`manual` or no source) are never
/// disabled.
class ServiceReconciler {
public:
    ServiceReconciler(upstream::FetchCoordinator& coordinator, store::SqliteStore& store);

    ServiceReconciler(const ServiceReconciler&) = delete;
    ServiceReconciler& operator=(const ServiceReconciler&) = delete;

    [[nodiscard]] ReconcileOutcome reconcile(const core::FetchContext& ctx);

private:
    upstream::FetchCoordinator& coordinator_;
    store::SqliteStore& store_;
};

}  // namespace waypoint::reconcile
