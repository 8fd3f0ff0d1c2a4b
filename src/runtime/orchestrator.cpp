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


// Waypoint Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include "../core/logging.hpp"
#include "../upstream/factory.hpp"

namespace waypoint::runtime {

namespace {

std::chrono::milliseconds fetch_timeout(const control::Config& config) {
    return std::chrono::milliseconds(config.upstream.timeout_ms);
}

bool same_upstream(const control::UpstreamConfig& a, const control::UpstreamConfig& b) {
    nlohmann::json left = a;
    nlohmann::json right = b;
    return left == right;
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<const control::Config> config)
    : config_(std::move(config)) {}

Orchestrator::~Orchestrator() {
    stop();
}

std::error_code Orchestrator::start() {
    auto* logger = logging::get_current_logger();
    const auto& config = *config_;

    try {
        store_ = std::make_unique<store::SqliteStore>(config.storage.path);
    } catch (const store::StoreError& e) {
        LOG_ERROR(logger, "Failed to open storage {}: {}", config.storage.path, e.what());
        return core::make_error_code(core::Errc::storage_failed);
    }
    authority_ = std::make_unique<store::StoredCertificateAuthority>(*store_);

    http_ = std::make_unique<core::HttplibClient>();
    auto fetcher = upstream::build_fetcher(config.upstream, *http_);
    if (!fetcher) {
        return core::make_error_code(core::Errc::invalid_config);
    }

    coordinator_ = std::make_unique<upstream::FetchCoordinator>(
        std::move(fetcher), std::chrono::milliseconds(config.coordinator.min_interval_ms));
    merger_ = std::make_unique<merge::ConfigMerger>(*coordinator_, *store_, *authority_,
                                                    config.merge);
    resource_reconciler_ = std::make_unique<reconcile::ResourceReconciler>(*coordinator_, *store_);
    service_reconciler_ = std::make_unique<reconcile::ServiceReconciler>(*coordinator_, *store_);

    start_watchers();

    if (config.admin.enabled) {
        admin_ = std::make_unique<AdminServer>(config.admin, *merger_, *coordinator_,
                                               fetch_timeout(config));
        if (auto ec = admin_->start()) {
            stop_watchers();
            return ec;
        }
        admin_thread_ = std::thread([this] { admin_->run(); });
    }

    LOG_INFO(logger, "Waypoint started: upstream {} ({}), storage {}", config.upstream.url,
             config.upstream.type, config.storage.path);
    return {};
}

void Orchestrator::start_watchers() {
    const auto& reconciler = config_->reconciler;
    if (!reconciler.enabled) {
        return;
    }

    auto interval = std::chrono::seconds(reconciler.interval_seconds);
    auto timeout = std::chrono::milliseconds(reconciler.cycle_timeout_ms);

    resource_watcher_ = std::make_unique<reconcile::Watcher>(
        "Resource",
        [this](const core::FetchContext& ctx) { return resource_reconciler_->reconcile(ctx); },
        interval, timeout);
    resource_watcher_->start();

    if (reconciler.services_enabled) {
        service_watcher_ = std::make_unique<reconcile::Watcher>(
            "Service",
            [this](const core::FetchContext& ctx) { return service_reconciler_->reconcile(ctx); },
            interval, timeout);
        service_watcher_->start();
    }
}

void Orchestrator::stop_watchers() {
    if (resource_watcher_) {
        resource_watcher_->stop();
        resource_watcher_.reset();
    }
    if (service_watcher_) {
        service_watcher_->stop();
        service_watcher_.reset();
    }
}

void Orchestrator::stop() {
    stop_watchers();

    if (admin_) {
        admin_->stop();
    }
    if (admin_thread_.joinable()) {
        admin_thread_.join();
    }
    admin_.reset();
}

void Orchestrator::apply_config(std::shared_ptr<const control::Config> config) {
    auto* logger = logging::get_current_logger();
    if (!config || !coordinator_) {
        return;
    }

    auto previous = std::exchange(config_, std::move(config));
    const auto& next = *config_;

    if (!same_upstream(previous->upstream, next.upstream)) {
        auto fetcher = upstream::build_fetcher(next.upstream, *http_);
        if (fetcher) {
            coordinator_->replace_fetcher(std::move(fetcher));
            merger_->invalidate_cache();
            LOG_INFO(logger, "Upstream changed, fetcher rebuilt for {}", next.upstream.url);
        } else {
            LOG_ERROR(logger, "Keeping previous upstream: could not build fetcher for type '{}'",
                      next.upstream.type);
        }
    }

    merger_->update_config(next.merge);

    // Interval and enable flags are read when a loop starts
    stop_watchers();
    start_watchers();
}

}  // namespace waypoint::runtime
