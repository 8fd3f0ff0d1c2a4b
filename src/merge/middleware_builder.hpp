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


// Waypoint Middleware Builder - Header
// Middlewares, TLS references and services injected into the published document

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../model/document.hpp"
#include "../model/routing.hpp"
#include "../model/settings.hpp"

namespace waypoint::merge {

/// `{"plugin": {"mtlswhitelist": {...}}}` built from the global settings, with the
/// resource's overrides (when given) applied on a copy
[[nodiscard]] model::Document mtls_middleware(const model::MtlsSettings& settings,
                                              std::string_view ca_cert_path,
                                              const model::ResourceMtls* overrides = nullptr);

/// Name of the mTLS middleware a resource references
[[nodiscard]] std::string mtls_middleware_name(const model::ResourceOverrides& resource);

/// `{"headers": {"customRequestHeaders": {...}}}`, or nullopt for an empty header map
[[nodiscard]] std::optional<model::Document> custom_headers_middleware(
    const model::Document& headers);

[[nodiscard]] std::string custom_headers_middleware_name(std::string_view resource_id);

/// Plane a stored service belongs to: servers with `address` are TCP, a `"protocol": "udp"`
/// marker is UDP, everything else is HTTP
[[nodiscard]] model::Protocol service_plane(std::string_view type, const model::Document& config);

/// Stored record as `{type: config}`, without the protocol marker
[[nodiscard]] model::Document wrap_override(const model::OverrideRecord& record);

/// String entries of a router's `middlewares` list
[[nodiscard]] std::vector<std::string> router_middlewares(const model::Document& router);

/// `injected` followed by every entry of `existing` not already present
[[nodiscard]] std::vector<std::string> merge_chain(std::vector<std::string> injected,
                                                   const std::vector<std::string>& existing);

/// Point the router's `tls.options` at `option`, keeping other TLS settings
void set_tls_option(model::Document& router, std::string_view option);

}  // namespace waypoint::merge
