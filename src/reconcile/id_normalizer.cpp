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


// Waypoint Identifier Normalization - Implementation

#include "id_normalizer.hpp"

#include <cctype>

#include "../model/routing.hpp"

namespace waypoint::reconcile {

namespace {

constexpr std::string_view kAuthSuffix = "-auth";
constexpr std::string_view kRedirectAuthSuffix = "-redirect-auth";

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

std::string normalize_id(std::string_view id) {
    std::string out = model::strip_provider(id);

    while (ends_with(out, "-auth-auth")) {
        out.resize(out.size() - kAuthSuffix.size());
    }
    if (ends_with(out, kRedirectAuthSuffix)) {
        out.resize(out.size() - kAuthSuffix.size());
    }
    return out;
}

std::string format_service_name(std::string_view id) {
    std::string base = model::strip_provider(id);

    std::string out;
    out.reserve(base.size());
    bool word_start = true;
    for (char c : base) {
        if (c == '-' || c == '_') {
            if (!out.empty() && out.back() != ' ') {
                out.push_back(' ');
            }
            word_start = true;
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        out.push_back(word_start ? static_cast<char>(std::toupper(uc)) : c);
        word_start = false;
    }

    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

}  // namespace waypoint::reconcile
