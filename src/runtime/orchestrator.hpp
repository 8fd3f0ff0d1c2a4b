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


// Waypoint Runtime Orchestrator - Header
// Composition root: owns the HTTP client, storage, caches, background loops and admin server

#pragma once

#include <memory>
#include <system_error>
#include <thread>
#include <utility>

#include "../control/config.hpp"
#include "../core/http_client.hpp"
#include "../merge/config_merger.hpp"
#include "../reconcile/resource_reconciler.hpp"
#include "../reconcile/service_reconciler.hpp"
#include "../reconcile/watcher.hpp"
#include "../store/certificate_authority.hpp"
#include "../store/sqlite_store.hpp"
#include "../upstream/fetch_coordinator.hpp"
#include "admin_server.hpp"

namespace waypoint::runtime {

class Orchestrator {
public:
    explicit Orchestrator(std::shared_ptr<const control::Config> config);
    ~Orchestrator();

    // Non-copyable, non-movable (owns threads)
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Open storage, build the fetcher, start the reconcilers and the admin server
    [[nodiscard]] std::error_code start();

    /// Stop background loops and the admin server (idempotent)
    void stop();

    /// Apply a reloaded configuration. A changed upstream section rebuilds the fetcher and
    /// invalidates both caches.
    void apply_config(std::shared_ptr<const control::Config> config);

    [[nodiscard]] upstream::FetchCoordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] merge::ConfigMerger& merger() noexcept { return *merger_; }
    [[nodiscard]] store::SqliteStore& store() noexcept { return *store_; }

private:
    void start_watchers();
    void stop_watchers();

    std::shared_ptr<const control::Config> config_;

    std::unique_ptr<core::HttplibClient> http_;
    std::unique_ptr<store::SqliteStore> store_;
    std::unique_ptr<store::StoredCertificateAuthority> authority_;
    std::unique_ptr<upstream::FetchCoordinator> coordinator_;
    std::unique_ptr<merge::ConfigMerger> merger_;
    std::unique_ptr<reconcile::ResourceReconciler> resource_reconciler_;
    std::unique_ptr<reconcile::ServiceReconciler> service_reconciler_;
    std::unique_ptr<reconcile::Watcher> resource_watcher_;
    std::unique_ptr<reconcile::Watcher> service_watcher_;
    std::unique_ptr<AdminServer> admin_;
    std::thread admin_thread_;
};

}  // namespace waypoint::runtime
