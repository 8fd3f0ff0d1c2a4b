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


// Waypoint Document Canonicalization - Implementation

#include "canonicalize.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <string_view>

#include "../core/string_utils.hpp"
#include "../model/settings.hpp"

namespace waypoint::merge {

namespace {

constexpr std::array<std::string_view, 6> kRouterFieldOrder = {
    "entryPoints", "middlewares", "service", "rule", "priority", "tls"};

bool is_empty_collection(const model::Document& plane, const char* key) {
    auto it = plane.find(key);
    return it == plane.end() || !it->is_object() || it->empty();
}

bool is_empty_plane(const model::Document& doc, const char* name) {
    auto plane = doc.find(name);
    if (plane == doc.end()) {
        return true;
    }
    if (!plane->is_object()) {
        return false;
    }
    return is_empty_collection(*plane, "routers") && is_empty_collection(*plane, "services") &&
           is_empty_collection(*plane, "middlewares");
}

bool is_flat(const model::Document& body) {
    return std::none_of(body.begin(), body.end(), [](const model::Document& value) {
        return value.is_structured();
    });
}

// A middleware `{type: body}` whose body holds only scalars gets its body keys sorted
void sort_simple_middleware(model::Document& middleware) {
    if (!middleware.is_object() || middleware.size() != 1) {
        return;
    }
    auto& body = middleware.begin().value();
    if (body.is_object() && is_flat(body)) {
        body = sort_keys(body);
    }
}

void sanitize_mtls_middleware(model::Document& middleware) {
    auto plugin = middleware.find("plugin");
    if (plugin == middleware.end() || !plugin->is_object()) {
        return;
    }
    auto whitelist = plugin->find(std::string(model::kMtlsPluginName));
    if (whitelist == plugin->end() || !whitelist->is_object()) {
        return;
    }
    auto headers = whitelist->find("requestHeaders");
    if (headers == whitelist->end()) {
        return;
    }

    auto sanitized = sanitize_request_headers(*headers);
    if (sanitized.empty()) {
        whitelist->erase("requestHeaders");
    } else {
        *headers = std::move(sanitized);
    }
}

void canonicalize_plane(model::Document& plane) {
    if (!plane.is_object()) {
        return;
    }

    for (const char* key : {"routers", "services", "middlewares"}) {
        auto it = plane.find(key);
        if (it != plane.end() && it->is_object()) {
            *it = sort_keys(*it);
        }
    }

    if (auto routers = plane.find("routers"); routers != plane.end() && routers->is_object()) {
        for (auto& router : *routers) {
            if (router.is_object()) {
                router = order_router_fields(router);
            }
        }
    }

    if (auto middlewares = plane.find("middlewares");
        middlewares != plane.end() && middlewares->is_object()) {
        for (auto& middleware : *middlewares) {
            sanitize_mtls_middleware(middleware);
            sort_simple_middleware(middleware);
        }
    }
}

}  // namespace

model::Document order_router_fields(const model::Document& router) {
    model::Document ordered = model::Document::object();
    for (auto field : kRouterFieldOrder) {
        std::string key(field);
        if (auto it = router.find(key); it != router.end()) {
            ordered[key] = *it;
        }
    }
    for (const auto& [key, value] : router.items()) {
        if (!ordered.contains(key)) {
            ordered[key] = value;
        }
    }
    return ordered;
}

model::Document sort_keys(const model::Document& object) {
    std::map<std::string, const model::Document*> sorted;
    for (const auto& [key, value] : object.items()) {
        sorted.emplace(key, &value);
    }

    model::Document out = model::Document::object();
    for (const auto& [key, value] : sorted) {
        out[key] = *value;
    }
    return out;
}

model::Document sanitize_request_headers(const model::Document& headers) {
    model::Document out = model::Document::object();

    if (headers.is_object()) {
        for (const auto& [name, value] : headers.items()) {
            if (name.empty() || value.is_null()) {
                continue;
            }
            out[name] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        return out;
    }

    if (!headers.is_array()) {
        return out;
    }

    for (const auto& entry : headers) {
        if (entry.is_object()) {
            auto name = model::string_field(entry, "name");
            if (name.empty()) {
                name = model::string_field(entry, "key");
            }
            if (!name.empty()) {
                out[name] = model::string_field(entry, "value");
            }
        } else if (entry.is_string()) {
            auto text = entry.get<std::string>();
            auto colon = text.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            auto name = core::trim(std::string_view(text).substr(0, colon));
            auto value = core::trim(std::string_view(text).substr(colon + 1));
            if (!name.empty()) {
                out[std::string(name)] = std::string(value);
            }
        }
    }
    return out;
}

void canonicalize(model::Document& doc) {
    for (const char* plane : {"tcp", "udp"}) {
        if (doc.contains(plane) && is_empty_plane(doc, plane)) {
            doc.erase(std::string(plane));
        }
    }

    if (auto tls = doc.find("tls"); tls != doc.end()) {
        if (tls->is_object()) {
            if (auto options = tls->find("options");
                options != tls->end() && (!options->is_object() || options->empty())) {
                tls->erase("options");
            }
        }
        if (!tls->is_object() || tls->empty()) {
            doc.erase("tls");
        }
    }

    for (const char* plane : {"http", "tcp", "udp"}) {
        if (auto it = doc.find(plane); it != doc.end()) {
            canonicalize_plane(*it);
        }
    }

    if (auto tls = doc.find("tls"); tls != doc.end()) {
        if (auto options = tls->find("options"); options != tls->end()) {
            *options = sort_keys(*options);
        }
    }
}

}  // namespace waypoint::merge
