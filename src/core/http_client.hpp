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

// Waypoint HTTP Client - Header
// Blocking GET client used by the upstream fetchers

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "fetch_context.hpp"

namespace waypoint::core {

/// Per-request options
struct HttpRequestOptions {
    std::string username;  // Basic auth (sent only when non-empty)
    std::string password;
    bool skip_tls_verify = false;
    std::chrono::milliseconds timeout{10000};  // Upper bound, clipped to the context deadline
    size_t max_body_bytes = 10 * 1024 * 1024;   // 10 MiB
    std::vector<std::pair<std::string, std::string>> headers;
};

/// GET outcome. `error` is set for transport failures and oversized bodies; a non-200
/// status from a reachable server is reported through `status` with no error.
struct HttpResponse {
    int status = 0;
    std::string body;
    Error error;

    [[nodiscard]] bool ok() const noexcept { return !error && status == 200; }
};

/// Split "scheme://host:port/path?q" into {"scheme://host:port", "/path?q"}
[[nodiscard]] std::pair<std::string, std::string> split_url(std::string_view url);

/// HTTP client capability (implementations must be safe for concurrent get() calls)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HttpResponse get(const std::string& url,
                                           const HttpRequestOptions& options,
                                           const FetchContext& ctx) = 0;
};

/// cpp-httplib backed client (one httplib::Client per request)
class HttplibClient final : public HttpClient {
public:
    explicit HttplibClient(std::string user_agent = "waypoint/0.1.0");

    HttplibClient(const HttplibClient&) = delete;
    HttplibClient& operator=(const HttplibClient&) = delete;

    [[nodiscard]] HttpResponse get(const std::string& url, const HttpRequestOptions& options,
                                   const FetchContext& ctx) override;

private:
    std::string user_agent_;
};

}  // namespace waypoint::core
