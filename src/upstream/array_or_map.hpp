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

// Waypoint Array-or-Map Decoder
// Traefik API collections arrive either as [{name,...}] or as {name: {...}}

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../core/errors.hpp"
#include "../model/document.hpp"

namespace waypoint::upstream {

/// One decoded collection item; `value` always carries a "name" member
struct NamedItem {
    std::string name;
    model::Document value;
};

struct DecodedCollection {
    std::vector<NamedItem> items;
    core::Error error;
};

/// Decode a parsed collection: array of objects first, then an object keyed by name
/// (the key is written into each item's "name"). null decodes to an empty collection.
[[nodiscard]] inline DecodedCollection decode_array_or_map(const model::Document& doc) {
    DecodedCollection result;

    if (doc.is_null()) {
        return result;
    }

    if (doc.is_array()) {
        bool all_objects = true;
        for (const auto& item : doc) {
            if (!item.is_object()) {
                all_objects = false;
                break;
            }
        }
        if (all_objects) {
            result.items.reserve(doc.size());
            for (const auto& item : doc) {
                result.items.push_back({model::string_field(item, "name"), item});
            }
            return result;
        }
    }

    if (doc.is_object()) {
        bool all_objects = true;
        for (const auto& [key, value] : doc.items()) {
            if (!value.is_object()) {
                all_objects = false;
                break;
            }
        }
        if (all_objects) {
            result.items.reserve(doc.size());
            for (const auto& [key, value] : doc.items()) {
                NamedItem item{key, value};
                item.value["name"] = key;
                result.items.push_back(std::move(item));
            }
            return result;
        }
    }

    result.error = core::Error(core::Errc::decode_failed, "failed to parse as array or map");
    return result;
}

/// Parse `body` and decode it as an array-or-map collection
[[nodiscard]] inline DecodedCollection parse_array_or_map(std::string_view body) {
    auto doc = model::Document::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        DecodedCollection result;
        result.error =
            core::Error(core::Errc::decode_failed, "failed to parse as array or map: invalid JSON");
        return result;
    }
    return decode_array_or_map(doc);
}

}  // namespace waypoint::upstream
