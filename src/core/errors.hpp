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

// Waypoint Errors - Header
// Error category shared by the fetch, merge and storage layers

#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace waypoint::core {

/// Error conditions raised by Waypoint components
enum class Errc {
    transport_failed = 1,       // Connection refused, DNS failure, TLS failure, timeout
    unexpected_status,          // Server answered with a non-200 status
    body_too_large,             // Response exceeded the configured body limit
    decode_failed,              // Payload is not the expected JSON shape
    critical_endpoints_failed,  // One or more critical native endpoints failed
    all_urls_failed,            // Primary and every fallback base URL failed
    throttled,                  // Minimum fetch interval not elapsed and nothing cached
    cancelled,                  // Caller deadline passed or context cancelled
    storage_failed,             // SQLite error while reading overrides
    invalid_config              // Configuration rejected by validation
};

/// Waypoint error category for std::error_code
class ErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "waypoint"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get Waypoint error category instance
[[nodiscard]] const ErrorCategory& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

/// Error code plus a human readable detail message
struct Error {
    std::error_code code;
    std::string message;

    Error() = default;
    Error(Errc e, std::string msg) : code(make_error_code(e)), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code); }

    [[nodiscard]] bool is(Errc e) const noexcept { return code == make_error_code(e); }
};

}  // namespace waypoint::core

template <>
struct std::is_error_code_enum<waypoint::core::Errc> : std::true_type {};
