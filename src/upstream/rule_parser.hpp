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

// Waypoint Rule Parser - Header
// Extract the routable host from Traefik router rule expressions

#pragma once

#include <string>
#include <string_view>

namespace waypoint::upstream {

/// Host reported for HostRegexp(`.+`)
inline constexpr std::string_view kAnyHost = "any-host";

/// Extract the host from an HTTP router rule.
/// Tried in order: Host(`h`), HostRegexp(`p`), legacy Host:h, then each operand of an
/// `&&` expression. Never throws; returns "" when no host can be found.
[[nodiscard]] std::string extract_host(std::string_view rule);

/// Literal value of HostSNI(`h`) in a TCP rule, or ""
[[nodiscard]] std::string extract_host_sni(std::string_view rule);

/// Readable form of the pattern in HostSNIRegexp(`p`), or ""
[[nodiscard]] std::string extract_host_sni_regexp(std::string_view rule);

/// HostSNI first, then HostSNIRegexp
[[nodiscard]] std::string extract_sni(std::string_view rule);

/// Turn a host regex into a readable approximation: character classes become a
/// placeholder letter, anchors and grouping are dropped, alternation becomes '-'.
/// The output is cosmetic and only stable for the patterns exercised in tests.
[[nodiscard]] std::string simplify_host_pattern(std::string_view pattern);

}  // namespace waypoint::upstream
