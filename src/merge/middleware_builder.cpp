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


// Waypoint Middleware Builder - Implementation

#include "middleware_builder.hpp"

#include <algorithm>

namespace waypoint::merge {

model::Document mtls_middleware(const model::MtlsSettings& settings, std::string_view ca_cert_path,
                                const model::ResourceMtls* overrides) {
    model::Document plugin = model::Document::object();
    plugin["caFiles"] = model::Document::array({std::string(ca_cert_path)});

    // Copies: overriding a resource must never touch the global settings
    model::Document rules = settings.rules;
    model::Document headers = settings.request_headers;
    std::string reject_message = settings.reject_message;
    int refresh_interval = settings.refresh_interval;

    if (overrides) {
        if (overrides->rules && overrides->rules->is_array()) {
            rules = *overrides->rules;
        }
        if (overrides->request_headers && overrides->request_headers->is_object()) {
            if (!headers.is_object()) {
                headers = model::Document::object();
            }
            for (const auto& [name, value] : overrides->request_headers->items()) {
                headers[name] = value;
            }
        }
        if (overrides->reject_message) {
            reject_message = *overrides->reject_message;
        }
        if (overrides->refresh_interval) {
            refresh_interval = *overrides->refresh_interval;
        }
    }

    if (rules.is_array() && !rules.empty()) {
        plugin["rules"] = std::move(rules);
    }
    if (headers.is_object() && !headers.empty()) {
        plugin["requestHeaders"] = std::move(headers);
    }
    if (!reject_message.empty()) {
        plugin["rejectMessage"] = reject_message;
    }
    if (overrides && overrides->reject_code) {
        plugin["rejectCode"] = *overrides->reject_code;
    }
    if (refresh_interval > 0) {
        plugin["refreshInterval"] = refresh_interval;
    }
    if (overrides && overrides->external_data) {
        plugin["externalData"] = *overrides->external_data;
    }

    model::Document body = model::Document::object();
    body[std::string(model::kMtlsPluginName)] = std::move(plugin);

    model::Document middleware = model::Document::object();
    middleware["plugin"] = std::move(body);
    return middleware;
}

std::string mtls_middleware_name(const model::ResourceOverrides& resource) {
    if (resource.mtls.has_overrides()) {
        return resource.id + "-" + std::string(model::kMtlsMiddleware);
    }
    return std::string(model::kMtlsMiddleware);
}

std::optional<model::Document> custom_headers_middleware(const model::Document& headers) {
    if (!headers.is_object() || headers.empty()) {
        return std::nullopt;
    }

    model::Document body = model::Document::object();
    body["customRequestHeaders"] = headers;

    model::Document middleware = model::Document::object();
    middleware["headers"] = std::move(body);
    return middleware;
}

std::string custom_headers_middleware_name(std::string_view resource_id) {
    return std::string(resource_id) + "-customheaders";
}

model::Protocol service_plane(std::string_view type, const model::Document& config) {
    if (model::string_field(config, "protocol") == "udp") {
        return model::Protocol::Udp;
    }

    if (type != "loadBalancer" || !config.is_object()) {
        return model::Protocol::Http;
    }

    auto servers = config.find("servers");
    if (servers == config.end() || !servers->is_array()) {
        return model::Protocol::Http;
    }

    for (const auto& server : *servers) {
        if (!server.is_object()) {
            continue;
        }
        if (server.contains("address")) {
            return model::Protocol::Tcp;
        }
        if (server.contains("url")) {
            return model::Protocol::Http;
        }
    }
    return model::Protocol::Http;
}

model::Document wrap_override(const model::OverrideRecord& record) {
    model::Document body = record.config;
    if (body.is_object()) {
        body.erase("protocol");
    }

    model::Document wrapped = model::Document::object();
    wrapped[record.type] = std::move(body);
    return wrapped;
}

std::vector<std::string> router_middlewares(const model::Document& router) {
    std::vector<std::string> out;
    if (!router.is_object()) {
        return out;
    }
    auto it = router.find("middlewares");
    if (it == router.end() || !it->is_array()) {
        return out;
    }
    for (const auto& entry : *it) {
        if (entry.is_string()) {
            out.push_back(entry.get<std::string>());
        }
    }
    return out;
}

std::vector<std::string> merge_chain(std::vector<std::string> injected,
                                     const std::vector<std::string>& existing) {
    std::vector<std::string> chain;
    chain.reserve(injected.size() + existing.size());

    auto append_unique = [&chain](std::string name) {
        if (std::find(chain.begin(), chain.end(), name) == chain.end()) {
            chain.push_back(std::move(name));
        }
    };

    for (auto& name : injected) {
        append_unique(std::move(name));
    }
    for (const auto& name : existing) {
        append_unique(name);
    }
    return chain;
}

void set_tls_option(model::Document& router, std::string_view option) {
    auto tls = router.find("tls");
    if (tls == router.end() || !tls->is_object()) {
        router["tls"] = model::Document::object();
    }
    router["tls"]["options"] = std::string(option);
}

}  // namespace waypoint::merge
