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


// Waypoint Identifier Normalization - Header

#pragma once

#include <string>
#include <string_view>

namespace waypoint::reconcile {

/// Canonical id for an upstream object: drops the `@provider` qualifier and collapses
/// repeated `-auth` suffixes ("svc-auth-auth@docker" -> "svc-auth",
/// "router-redirect-auth" -> "router-redirect")
[[nodiscard]] std::string normalize_id(std::string_view id);

/// Display name for a service id ("my_service@docker" -> "My Service")
[[nodiscard]] std::string format_service_name(std::string_view id);

}  // namespace waypoint::reconcile
