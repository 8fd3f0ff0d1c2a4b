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


// Waypoint Document Canonicalization - Header
// Stable, pruned form of the merged document

#pragma once

#include "../model/document.hpp"

namespace waypoint::merge {

/// Router with `entryPoints, middlewares, service, rule, priority, tls` first, in that
/// order, then the remaining fields in their current order
[[nodiscard]] model::Document order_router_fields(const model::Document& router);

/// Copy of `object` with keys in ascending order (not recursive)
[[nodiscard]] model::Document sort_keys(const model::Document& object);

/// Turn an mTLS whitelist `requestHeaders` value into a name -> template string map.
/// Accepts an object, an array of `{name, value}` objects or an array of "Name: value"
/// strings. Returns an empty object when nothing usable remains.
[[nodiscard]] model::Document sanitize_request_headers(const model::Document& headers);

/// Prune empty tcp, udp and tls sections, sort every section's keys, order router
/// fields, sort flat middleware bodies and sanitize mTLS request headers. In place.
void canonicalize(model::Document& doc);

}  // namespace waypoint::merge
