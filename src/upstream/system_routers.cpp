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

// Waypoint System Routers - Implementation

#include "system_routers.hpp"

#include <array>

namespace waypoint::upstream {

namespace {

constexpr std::array<std::string_view, 3> kAggregatorSystemIds{"api-router", "next-router",
                                                               "ws-router"};

constexpr std::array<std::string_view, 4> kTraefikSystemNames{
    "api@internal", "dashboard@internal", "acme-http@internal", "noop@internal"};

constexpr std::array<std::string_view, 3> kTraefikSystemPrefixes{"api@", "dashboard@",
                                                                 "traefik@"};

}  // namespace

bool is_aggregator_system_router(std::string_view router_id) noexcept {
    for (auto id : kAggregatorSystemIds) {
        if (router_id.find(id) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

bool is_traefik_system_router(std::string_view router_name) noexcept {
    // api-router@file, next-router@file and friends are user routers
    if (router_name.find("-router") != std::string_view::npos) {
        return false;
    }

    for (auto name : kTraefikSystemNames) {
        if (router_name == name) {
            return true;
        }
    }

    for (auto prefix : kTraefikSystemPrefixes) {
        if (router_name.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

}  // namespace waypoint::upstream
