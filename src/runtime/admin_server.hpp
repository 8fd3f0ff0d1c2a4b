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


// Waypoint Admin Server - Header
// Serves the merged Traefik configuration and health state over HTTP

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../merge/config_merger.hpp"
#include "../upstream/fetch_coordinator.hpp"

namespace httplib {
class Server;
}

namespace waypoint::runtime {

/// Response produced by a route handler
struct AdminResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/// Blocking HTTP server for the Traefik HTTP provider and operators.
///
/// Routes:
///   GET  /api/traefik-config             merged document (500 with {error, details})
///   POST /api/traefik-config/invalidate  expire the merge cache
///   GET  /api/traefik-config/status      healthy/unhealthy plus error
///   GET  /health                         fetch coordinator state
class AdminServer {
public:
    AdminServer(const control::AdminConfig& config, merge::ConfigMerger& merger,
                upstream::FetchCoordinator& coordinator, std::chrono::milliseconds fetch_timeout);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Bind the listen address
    [[nodiscard]] std::error_code start();

    /// Stop accepting; run() returns
    void stop();

    /// Serve requests until stop() (blocking, call in separate thread)
    void run();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Route one request; used by the HTTP handlers and directly by tests
    [[nodiscard]] AdminResponse handle(std::string_view method, std::string_view path);

private:
    [[nodiscard]] AdminResponse traefik_config();
    [[nodiscard]] AdminResponse invalidate();
    [[nodiscard]] AdminResponse config_status();
    [[nodiscard]] AdminResponse health();

    control::AdminConfig config_;
    merge::ConfigMerger& merger_;
    upstream::FetchCoordinator& coordinator_;
    std::chrono::milliseconds fetch_timeout_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
};

}  // namespace waypoint::runtime
