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

// Waypoint Routing Model - Header
// Typed view over a fetched Traefik routing snapshot

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "document.hpp"

namespace waypoint::model {

/// Traefik protocol plane
enum class Protocol : uint8_t { Http, Tcp, Udp };

[[nodiscard]] std::string_view protocol_name(Protocol protocol) noexcept;

/// Source tags written to resources.source_type
inline constexpr std::string_view kSourcePangolin = "pangolin_api";
inline constexpr std::string_view kSourceTraefik = "traefik_api";

/// Router priority treated as "not customised"
inline constexpr int kDefaultRouterPriority = 100;

/// TLS domain entry of a router (main + SANs)
struct TlsDomain {
    std::string main;
    std::vector<std::string> sans;
};

/// Comma-joined list of every main and SAN in order; empty mains are skipped
[[nodiscard]] std::string join_tls_domains(const std::vector<TlsDomain>& domains);

/// Router as reported upstream. `config` holds the publishable router object
/// (runtime-only fields removed).
struct Router {
    std::string name;
    std::string rule;
    std::string service;
    std::string provider;
    std::string status;
    std::vector<std::string> entry_points;
    std::vector<std::string> middlewares;
    int priority = 0;
    std::string cert_resolver;
    std::vector<TlsDomain> tls_domains;
    Document config = Document::object();
};

struct Service {
    std::string name;
    std::string provider;
    std::string type;
    Document config = Document::object();
};

struct Middleware {
    std::string name;
    std::string provider;
    std::string type;
    Document config = Document::object();
};

/// Collections of one protocol plane
struct ProtocolSection {
    std::vector<Router> routers;
    std::vector<Service> services;
    std::vector<Middleware> middlewares;

    [[nodiscard]] bool empty() const noexcept {
        return routers.empty() && services.empty() && middlewares.empty();
    }
};

/// Immutable result of one upstream fetch
struct RoutingSnapshot {
    ProtocolSection http;
    ProtocolSection tcp;
    ProtocolSection udp;

    /// `tls` object as received (aggregator) or empty (native)
    Document tls = Document::object();

    /// Native metadata endpoints; null when not fetched or failed
    Document overview;
    Document version;
    Document entrypoints;

    std::string source_type;

    [[nodiscard]] const ProtocolSection& section(Protocol protocol) const noexcept;
    [[nodiscard]] ProtocolSection& section(Protocol protocol) noexcept;

    /// Project the snapshot to the Traefik dynamic configuration shape:
    /// {http:{routers,services,middlewares}, tcp:{...}, udp:{...}, tls:{options,...}}.
    /// Every collection is present (possibly empty) and keyed by name in sorted order.
    /// Routers and services from the `internal` provider are never published and an
    /// `@provider` suffix is removed from keys.
    [[nodiscard]] Document to_document() const;
};

/// Route surfaced for reconciliation
struct DiscoveredResource {
    std::string id;
    std::string host;
    std::string service_id;
    std::string status = "active";
    std::string entrypoints;
    std::string tls_domains;
    int router_priority = 0;
    std::string source_type;
};

/// Strip a trailing `@provider` qualifier ("whoami@docker" -> "whoami")
[[nodiscard]] std::string strip_provider(std::string_view name);

/// First known middleware type key present in `config`, or "unknown"
[[nodiscard]] std::string detect_middleware_type(const Document& config);

/// First of loadBalancer|weighted|mirroring|failover present in `config`, or ""
[[nodiscard]] std::string detect_service_type(const Document& config);

/// Decode a router object. `name` wins over any "name" field in `doc`.
[[nodiscard]] Router router_from_document(std::string name, const Document& doc);

[[nodiscard]] Service service_from_document(std::string name, const Document& doc);

[[nodiscard]] Middleware middleware_from_document(std::string name, const Document& doc);

/// Remove the fields the Traefik API adds at runtime (status, provider, usedBy, ...)
/// so the object can be republished as dynamic configuration
[[nodiscard]] Document strip_runtime_fields(const Document& doc);

}  // namespace waypoint::model
