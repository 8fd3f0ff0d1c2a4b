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


// Waypoint Watcher - Implementation

#include "watcher.hpp"

#include <exception>

#include "../core/logging.hpp"

namespace waypoint::reconcile {

Watcher::Watcher(std::string name, Cycle cycle, std::chrono::seconds interval,
                 std::chrono::milliseconds cycle_timeout)
    : name_(std::move(name)),
      cycle_(std::move(cycle)),
      interval_(interval),
      cycle_timeout_(cycle_timeout) {}

Watcher::~Watcher() {
    stop();
}

void Watcher::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    auto* logger = logging::get_current_logger();
    LOG_INFO(logger, "{} watcher started, checking every {}s", name_, interval_.count());

    thread_ = std::make_unique<std::thread>(&Watcher::watch_loop, this);
}

void Watcher::stop() {
    {
        std::lock_guard lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();

    auto* logger = logging::get_current_logger();
    LOG_INFO(logger, "{} watcher stopped", name_);
}

ReconcileOutcome Watcher::run_once() {
    core::FetchContext ctx(cycle_timeout_);
    auto outcome = cycle_(ctx);
    cycles_.fetch_add(1, std::memory_order_relaxed);
    return outcome;
}

void Watcher::watch_loop() {
    auto* logger = logging::get_current_logger();

    while (running_) {
        try {
            auto outcome = run_once();
            if (!outcome.ok()) {
                LOG_WARNING(logger, "{} check failed: {}", name_, outcome.error.message);
            }
        } catch (const std::exception& e) {
            LOG_ERROR(logger, "{} check raised: {}", name_, e.what());
        }

        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

}  // namespace waypoint::reconcile
