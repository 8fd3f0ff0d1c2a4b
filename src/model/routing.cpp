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

// Waypoint Routing Model - Implementation

#include "routing.hpp"

#include <algorithm>
#include <array>
#include <map>

namespace waypoint::model {

namespace {

constexpr std::string_view kInternalProvider = "internal";

constexpr std::array<std::string_view, 24> kMiddlewareTypeKeys{
    "basicAuth",        "digestAuth",     "forwardAuth",      "ipAllowList",
    "rateLimit",        "headers",        "stripPrefix",      "stripPrefixRegex",
    "addPrefix",        "redirectRegex",  "redirectScheme",   "replacePath",
    "replacePathRegex", "chain",          "plugin",           "buffering",
    "circuitBreaker",   "compress",       "contentType",      "errors",
    "grpcWeb",          "inFlightReq",    "passTLSClientCert", "retry",
};

constexpr std::array<std::string_view, 4> kServiceTypeKeys{
    "loadBalancer", "weighted", "mirroring", "failover"};

constexpr std::array<std::string_view, 8> kRuntimeFields{
    "status", "using", "provider", "name", "error", "serverStatus", "usedBy", "type"};

std::vector<TlsDomain> decode_tls_domains(const Document& tls) {
    std::vector<TlsDomain> domains;
    if (!tls.is_object()) {
        return domains;
    }
    auto it = tls.find("domains");
    if (it == tls.end() || !it->is_array()) {
        return domains;
    }
    for (const auto& entry : *it) {
        TlsDomain domain;
        domain.main = string_field(entry, "main");
        domain.sans = string_list(entry, "sans");
        domains.push_back(std::move(domain));
    }
    return domains;
}

// Sorted by published key; the first item wins when two names collapse to one key
template <typename Item>
Document collection_to_document(const std::vector<Item>& items) {
    std::map<std::string, const Item*> sorted;
    for (const auto& item : items) {
        if (item.provider == kInternalProvider) {
            continue;
        }
        sorted.try_emplace(strip_provider(item.name), &item);
    }

    Document out = Document::object();
    for (const auto& [key, item] : sorted) {
        out[key] = item->config;
    }
    return out;
}

}  // namespace

std::string_view protocol_name(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Http:
            return "http";
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
    }
    return "http";
}

std::string join_tls_domains(const std::vector<TlsDomain>& domains) {
    std::string out;
    auto append = [&out](const std::string& value) {
        if (value.empty()) {
            return;
        }
        if (!out.empty()) {
            out += ',';
        }
        out += value;
    };

    for (const auto& domain : domains) {
        append(domain.main);
        for (const auto& san : domain.sans) {
            append(san);
        }
    }
    return out;
}

const ProtocolSection& RoutingSnapshot::section(Protocol protocol) const noexcept {
    switch (protocol) {
        case Protocol::Tcp:
            return tcp;
        case Protocol::Udp:
            return udp;
        case Protocol::Http:
            break;
    }
    return http;
}

ProtocolSection& RoutingSnapshot::section(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Tcp:
            return tcp;
        case Protocol::Udp:
            return udp;
        case Protocol::Http:
            break;
    }
    return http;
}

Document RoutingSnapshot::to_document() const {
    Document doc = Document::object();

    for (auto protocol : {Protocol::Http, Protocol::Tcp, Protocol::Udp}) {
        const auto& plane = section(protocol);
        Document out = Document::object();
        out["routers"] = collection_to_document(plane.routers);
        out["services"] = collection_to_document(plane.services);
        // Traefik has no UDP middlewares
        if (protocol != Protocol::Udp) {
            out["middlewares"] = collection_to_document(plane.middlewares);
        }
        doc[std::string(protocol_name(protocol))] = std::move(out);
    }

    Document tls_out = tls.is_object() ? tls : Document::object();
    if (!tls_out.contains("options") || !tls_out["options"].is_object()) {
        tls_out["options"] = Document::object();
    }
    doc["tls"] = std::move(tls_out);

    return doc;
}

std::string strip_provider(std::string_view name) {
    auto at = name.find('@');
    if (at == std::string_view::npos) {
        return std::string(name);
    }
    return std::string(name.substr(0, at));
}

std::string detect_middleware_type(const Document& config) {
    if (config.is_object()) {
        for (auto key : kMiddlewareTypeKeys) {
            if (config.contains(std::string(key))) {
                return std::string(key);
            }
        }
    }
    return "unknown";
}

std::string detect_service_type(const Document& config) {
    if (config.is_object()) {
        for (auto key : kServiceTypeKeys) {
            if (config.contains(std::string(key))) {
                return std::string(key);
            }
        }
    }
    return "";
}

Document strip_runtime_fields(const Document& doc) {
    if (!doc.is_object()) {
        return Document::object();
    }
    Document out = doc;
    for (auto field : kRuntimeFields) {
        out.erase(std::string(field));
    }
    return out;
}

Router router_from_document(std::string name, const Document& doc) {
    Router router;
    router.name = name.empty() ? string_field(doc, "name") : std::move(name);
    router.rule = string_field(doc, "rule");
    router.service = string_field(doc, "service");
    router.provider = string_field(doc, "provider");
    router.status = string_field(doc, "status");
    router.entry_points = string_list(doc, "entryPoints");
    router.middlewares = string_list(doc, "middlewares");
    router.priority = int_field(doc, "priority");

    if (doc.is_object()) {
        if (auto tls = doc.find("tls"); tls != doc.end() && tls->is_object()) {
            router.cert_resolver = string_field(*tls, "certResolver");
            router.tls_domains = decode_tls_domains(*tls);
        }
    }

    router.config = strip_runtime_fields(doc);
    return router;
}

Service service_from_document(std::string name, const Document& doc) {
    Service service;
    service.name = name.empty() ? string_field(doc, "name") : std::move(name);
    service.provider = string_field(doc, "provider");
    service.config = strip_runtime_fields(doc);
    service.type = detect_service_type(service.config);
    if (service.type.empty()) {
        service.type = string_field(doc, "type");
    }
    return service;
}

Middleware middleware_from_document(std::string name, const Document& doc) {
    Middleware middleware;
    middleware.name = name.empty() ? string_field(doc, "name") : std::move(name);
    middleware.provider = string_field(doc, "provider");
    middleware.config = strip_runtime_fields(doc);
    middleware.type = detect_middleware_type(middleware.config);
    if (middleware.type == "unknown") {
        if (auto reported = string_field(doc, "type"); !reported.empty()) {
            middleware.type = std::move(reported);
        }
    }
    return middleware;
}

}  // namespace waypoint::model
