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


// Waypoint Watcher - Header
// Background thread running one reconciliation cycle per interval

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "resource_reconciler.hpp"

namespace waypoint::reconcile {

/// Periodic driver for a reconciler. The first cycle runs immediately on start().
class Watcher {
public:
    using Cycle = std::function<ReconcileOutcome(const core::FetchContext&)>;

    Watcher(std::string name, Cycle cycle, std::chrono::seconds interval,
            std::chrono::milliseconds cycle_timeout);
    ~Watcher();

    // Non-copyable, non-movable (owns thread)
    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;
    Watcher(Watcher&&) = delete;
    Watcher& operator=(Watcher&&) = delete;

    void start();

    /// Wake the thread and join it; an in-progress cycle finishes first
    void stop();

    /// Run one cycle on the calling thread
    ReconcileOutcome run_once();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void watch_loop();

    std::string name_;
    Cycle cycle_;
    std::chrono::seconds interval_;
    std::chrono::milliseconds cycle_timeout_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
};

}  // namespace waypoint::reconcile
