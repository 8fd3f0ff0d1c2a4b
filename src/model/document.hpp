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

// Waypoint Document - Header
// Open JSON value type for Traefik configuration fragments

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace waypoint::model {

/// Weakly typed configuration value. Keys keep insertion order so unknown fields and
/// upstream ordering survive a parse/dump cycle unchanged.
using Document = nlohmann::ordered_json;

/// String member of an object, or "" when absent or not a string
[[nodiscard]] inline std::string string_field(const Document& doc, std::string_view key) {
    if (!doc.is_object()) {
        return "";
    }
    auto it = doc.find(std::string(key));
    if (it == doc.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

/// Integer member of an object, or fallback when absent or not a number
[[nodiscard]] inline int int_field(const Document& doc, std::string_view key, int fallback = 0) {
    if (!doc.is_object()) {
        return fallback;
    }
    auto it = doc.find(std::string(key));
    if (it == doc.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<int>();
}

/// String elements of an array member (non-strings skipped)
[[nodiscard]] inline std::vector<std::string> string_list(const Document& doc,
                                                          std::string_view key) {
    std::vector<std::string> out;
    if (!doc.is_object()) {
        return out;
    }
    auto it = doc.find(std::string(key));
    if (it == doc.end() || !it->is_array()) {
        return out;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

/// Empty JSON object (ordered)
[[nodiscard]] inline Document empty_object() {
    return Document::object();
}

}  // namespace waypoint::model
