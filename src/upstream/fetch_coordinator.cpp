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

// Waypoint Fetch Coordinator - Implementation

#include "fetch_coordinator.hpp"

#include <fmt/format.h>

#include <exception>

#include "../core/logging.hpp"

namespace waypoint::upstream {

namespace {

uint64_t unix_ms_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

template <typename T, typename Select>
Projection<T> project(const FetchResult& result, Select select) {
    Projection<T> out;
    if (!result.ok()) {
        out.error = result.error;
        return out;
    }
    out.items = select(*result.snapshot);
    return out;
}

}  // namespace

FetchCoordinator::FetchCoordinator(std::shared_ptr<UpstreamFetcher> fetcher,
                                   std::chrono::milliseconds min_interval)
    : min_interval_(min_interval), fetcher_(std::move(fetcher)) {}

FetchResult FetchCoordinator::fetch(const core::FetchContext& ctx, std::string_view key) {
    auto* logger = logging::get_current_logger();
    std::string key_str(key);

    std::promise<FetchResult> promise;
    std::shared_ptr<UpstreamFetcher> fetcher;
    uint64_t generation = 0;

    {
        std::unique_lock lock(inflight_mutex_);

        if (auto it = inflight_.find(key_str); it != inflight_.end()) {
            auto shared = it->second;
            lock.unlock();
            LOG_DEBUG(logger, "Joining in-flight fetch for {}", key_str);
            return shared.get();
        }

        {
            std::shared_lock state(state_mutex_);
            if (last_completed_ && clock::now() - *last_completed_ < min_interval_) {
                if (snapshot_) {
                    LOG_DEBUG(logger, "Rate limiting: using cached snapshot for {}", key_str);
                    return FetchResult::success(snapshot_);
                }
                return FetchResult::failure(core::Error(
                    core::Errc::throttled,
                    fmt::format("rate limited: minimum interval of {}ms has not elapsed",
                                min_interval_.count())));
            }
            fetcher = fetcher_;
            generation = generation_;
        }

        inflight_.emplace(key_str, promise.get_future().share());
    }

    FetchResult result = execute(ctx, fetcher, generation);

    promise.set_value(result);
    {
        std::lock_guard lock(inflight_mutex_);
        inflight_.erase(key_str);
    }
    return result;
}

FetchResult FetchCoordinator::execute(const core::FetchContext& ctx,
                                      const std::shared_ptr<UpstreamFetcher>& fetcher,
                                      uint64_t generation) {
    auto* logger = logging::get_current_logger();
    fetch_count_.fetch_add(1, std::memory_order_relaxed);

    FetchResult result;
    if (!fetcher) {
        result = FetchResult::failure(
            core::Error(core::Errc::invalid_config, "no upstream fetcher configured"));
    } else {
        try {
            result = fetcher->fetch(ctx);
        } catch (const std::exception& e) {
            LOG_ERROR(logger, "Upstream fetcher raised: {}", e.what());
            result = FetchResult::failure(
                core::Error(core::Errc::transport_failed, fmt::format("fetch failed: {}", e.what())));
        }
    }

    std::unique_lock state(state_mutex_);
    if (generation != generation_) {
        // Fetcher was replaced while this fetch ran; its result describes the old upstream
        return result;
    }

    last_completed_ = clock::now();
    last_attempt_unix_ms_ = unix_ms_now();
    if (result.ok()) {
        snapshot_ = result.snapshot;
        last_success_unix_ms_ = last_attempt_unix_ms_;
        last_error_.clear();
    } else {
        last_error_ = result.error.message;
    }
    return result;
}

Projection<model::Router> FetchCoordinator::routers(const core::FetchContext& ctx,
                                                    model::Protocol protocol) {
    return project<model::Router>(fetch(ctx), [protocol](const model::RoutingSnapshot& s) {
        return s.section(protocol).routers;
    });
}

Projection<model::Service> FetchCoordinator::services(const core::FetchContext& ctx,
                                                      model::Protocol protocol) {
    return project<model::Service>(fetch(ctx), [protocol](const model::RoutingSnapshot& s) {
        return s.section(protocol).services;
    });
}

Projection<model::Middleware> FetchCoordinator::middlewares(const core::FetchContext& ctx,
                                                            model::Protocol protocol) {
    return project<model::Middleware>(fetch(ctx), [protocol](const model::RoutingSnapshot& s) {
        return s.section(protocol).middlewares;
    });
}

Projection<model::DiscoveredResource> FetchCoordinator::resources(const core::FetchContext& ctx) {
    auto surfacing = fetcher();
    return project<model::DiscoveredResource>(
        fetch(ctx), [&surfacing](const model::RoutingSnapshot& s) {
            return surfacing ? surfacing->surface_resources(s)
                             : std::vector<model::DiscoveredResource>{};
        });
}

std::shared_ptr<const model::RoutingSnapshot> FetchCoordinator::cached() const {
    std::shared_lock state(state_mutex_);
    return snapshot_;
}

void FetchCoordinator::replace_fetcher(std::shared_ptr<UpstreamFetcher> fetcher) {
    std::unique_lock state(state_mutex_);
    fetcher_ = std::move(fetcher);
    snapshot_.reset();
    last_completed_.reset();
    last_error_.clear();
    ++generation_;
}

void FetchCoordinator::invalidate() {
    std::unique_lock state(state_mutex_);
    last_completed_.reset();
}

std::shared_ptr<UpstreamFetcher> FetchCoordinator::fetcher() const {
    std::shared_lock state(state_mutex_);
    return fetcher_;
}

CoordinatorStatus FetchCoordinator::status() const {
    CoordinatorStatus out;
    {
        std::lock_guard lock(inflight_mutex_);
        out.in_flight = !inflight_.empty();
    }

    std::shared_lock state(state_mutex_);
    out.has_snapshot = snapshot_ != nullptr;
    out.fetch_count = fetch_count_.load(std::memory_order_relaxed);
    out.last_success_unix_ms = last_success_unix_ms_;
    out.last_attempt_unix_ms = last_attempt_unix_ms_;
    out.last_error = last_error_;
    if (fetcher_) {
        out.source_type = std::string(fetcher_->source_type());
    }
    return out;
}

}  // namespace waypoint::upstream
