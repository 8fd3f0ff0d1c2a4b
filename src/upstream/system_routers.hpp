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

// Waypoint System Routers - Header
// Classification of routers that belong to the proxy or aggregator itself

#pragma once

#include <string_view>

namespace waypoint::upstream {

/// Aggregator-internal routers (dashboard API, Next.js frontend, websocket endpoint)
[[nodiscard]] bool is_aggregator_system_router(std::string_view router_id) noexcept;

/// Traefik built-in routers (api@internal, dashboard@..., traefik@...).
/// User-defined names containing "-router" are never treated as system routers.
[[nodiscard]] bool is_traefik_system_router(std::string_view router_name) noexcept;

}  // namespace waypoint::upstream
