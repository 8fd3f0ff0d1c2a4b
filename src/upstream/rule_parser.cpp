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

// Waypoint Rule Parser - Implementation

#include "rule_parser.hpp"

#include <array>
#include <utility>

#include "../core/regex.hpp"
#include "../core/string_utils.hpp"

namespace waypoint::upstream {

namespace {

// Lazy match up to the first closing "`)" after the opening matcher
const core::Regex& host_matcher() {
    static const core::Regex re = core::Regex::compile(R"(Host\(`(.*?)`\))").value();
    return re;
}

const core::Regex& host_regexp_matcher() {
    static const core::Regex re = core::Regex::compile(R"(HostRegexp\(`(.*?)`\))").value();
    return re;
}

const core::Regex& host_sni_matcher() {
    static const core::Regex re = core::Regex::compile(R"(HostSNI\(`(.*?)`\))").value();
    return re;
}

const core::Regex& host_sni_regexp_matcher() {
    static const core::Regex re = core::Regex::compile(R"(HostSNIRegexp\(`(.*?)`\))").value();
    return re;
}

// Ordered: longer character classes must be rewritten before their suffixes
constexpr std::array<std::pair<std::string_view, std::string_view>, 24> kPatternRewrites{{
    {R"(\d+)", "N"},
    {"[0-9]+", "N"},
    {"[a-z0-9]+", "x"},
    {"[a-zA-Z0-9]+", "x"},
    {"[a-z]+", "x"},
    {"[A-Z]+", "X"},
    {"[a-zA-Z]+", "X"},
    {R"(\w+)", "x"},
    {"[^/]+", "x"},
    {".*", "x"},
    {".+", "x"},
    {"^", ""},
    {"$", ""},
    {"\\", ""},
    {"(", ""},
    {")", ""},
    {"{", ""},
    {"}", ""},
    {"[", ""},
    {"]", ""},
    {"?", ""},
    {"*", ""},
    {"+", ""},
    {"|", "-"},
}};

std::string extract_legacy_host(std::string_view rule) {
    constexpr std::string_view prefix = "Host:";
    size_t start = rule.find(prefix);
    if (start == std::string_view::npos) {
        return "";
    }
    start += prefix.size();

    size_t end = rule.find_first_of(" ,)", start);
    if (end == std::string_view::npos) {
        end = rule.size();
    }
    if (start >= end) {
        return "";
    }
    return std::string(rule.substr(start, end - start));
}

}  // namespace

std::string simplify_host_pattern(std::string_view pattern) {
    std::string result(pattern);
    for (const auto& [from, to] : kPatternRewrites) {
        result = core::replace_all(std::move(result), from, to);
    }
    return result;
}

std::string extract_host(std::string_view rule) {
    if (auto host = host_matcher().first_capture(rule)) {
        return std::string(*host);
    }

    if (auto pattern = host_regexp_matcher().first_capture(rule)) {
        if (*pattern == ".+") {
            return std::string(kAnyHost);
        }
        return simplify_host_pattern(*pattern);
    }

    if (auto legacy = extract_legacy_host(rule); !legacy.empty()) {
        return legacy;
    }

    if (rule.find("&&") != std::string_view::npos) {
        for (const auto& part : core::split(rule, "&&")) {
            if (auto host = extract_host(core::trim(part)); !host.empty()) {
                return host;
            }
        }
    }

    return "";
}

std::string extract_host_sni(std::string_view rule) {
    if (auto host = host_sni_matcher().first_capture(rule)) {
        return std::string(*host);
    }
    return "";
}

std::string extract_host_sni_regexp(std::string_view rule) {
    if (auto pattern = host_sni_regexp_matcher().first_capture(rule)) {
        return simplify_host_pattern(*pattern);
    }
    return "";
}

std::string extract_sni(std::string_view rule) {
    if (auto host = extract_host_sni(rule); !host.empty()) {
        return host;
    }
    return extract_host_sni_regexp(rule);
}

}  // namespace waypoint::upstream
