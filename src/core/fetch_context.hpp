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

// Waypoint Fetch Context - Header
// Deadline plus cancellation flag carried through every network call

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace waypoint::core {

/// Caller-supplied bound on a fetch. Copies share the cancellation flag.
class FetchContext {
public:
    using clock = std::chrono::steady_clock;

    explicit FetchContext(std::chrono::milliseconds timeout)
        : deadline_(clock::now() + timeout), cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /// Time left before the deadline (zero once expired)
    [[nodiscard]] std::chrono::milliseconds remaining() const noexcept {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    /// True when the deadline passed or cancel() was called
    [[nodiscard]] bool done() const noexcept {
        return cancelled_->load(std::memory_order_acquire) || clock::now() >= deadline_;
    }

    void cancel() const noexcept { cancelled_->store(true, std::memory_order_release); }

    [[nodiscard]] clock::time_point deadline() const noexcept { return deadline_; }

private:
    clock::time_point deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace waypoint::core
