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

// Waypoint Errors - Implementation

#include "errors.hpp"

namespace waypoint::core {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<Errc>(ev)) {
        case Errc::transport_failed:
            return "transport failed";
        case Errc::unexpected_status:
            return "unexpected status code";
        case Errc::body_too_large:
            return "response body too large";
        case Errc::decode_failed:
            return "decode failed";
        case Errc::critical_endpoints_failed:
            return "critical endpoints failed";
        case Errc::all_urls_failed:
            return "all connection attempts failed";
        case Errc::throttled:
            return "rate limited";
        case Errc::cancelled:
            return "cancelled";
        case Errc::storage_failed:
            return "storage failed";
        case Errc::invalid_config:
            return "invalid configuration";
    }
    return "unknown waypoint error";
}

const ErrorCategory& error_category() noexcept {
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), error_category());
}

}  // namespace waypoint::core
