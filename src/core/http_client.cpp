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

// Waypoint HTTP Client - Implementation

#include "http_client.hpp"

#include <httplib.h>

#include <algorithm>
#include <exception>

#include <fmt/format.h>

namespace waypoint::core {

std::pair<std::string, std::string> split_url(std::string_view url) {
    size_t scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;

    size_t path_start = url.find('/', host_start);
    if (path_start == std::string_view::npos) {
        return {std::string(url), "/"};
    }
    return {std::string(url.substr(0, path_start)), std::string(url.substr(path_start))};
}

HttplibClient::HttplibClient(std::string user_agent) : user_agent_(std::move(user_agent)) {}

HttpResponse HttplibClient::get(const std::string& url, const HttpRequestOptions& options,
                                const FetchContext& ctx) {
    HttpResponse response;

    if (ctx.done()) {
        response.error = Error(Errc::cancelled, "request cancelled before start: " + url);
        return response;
    }

    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        response.error = Error(Errc::transport_failed, "unsupported URL scheme: " + url);
        return response;
    }

    auto [base, path] = split_url(url);
    auto timeout = std::min(options.timeout, ctx.remaining());

    try {
        httplib::Client client(base);
        if (!client.is_valid()) {
            response.error = Error(Errc::transport_failed, "invalid base URL: " + base);
            return response;
        }

        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_follow_location(true);

        if (!options.username.empty()) {
            client.set_basic_auth(options.username, options.password);
        }
        if (options.skip_tls_verify) {
            client.enable_server_certificate_verification(false);
        }

        httplib::Headers headers{{"User-Agent", user_agent_}};
        for (const auto& [name, value] : options.headers) {
            headers.emplace(name, value);
        }

        bool too_large = false;
        auto res = client.Get(
            path, headers, [](const httplib::Response&) { return true; },
            [&](const char* data, size_t length) {
                if (response.body.size() + length > options.max_body_bytes) {
                    too_large = true;
                    return false;
                }
                if (ctx.done()) {
                    return false;
                }
                response.body.append(data, length);
                return true;
            });

        if (too_large) {
            response.body.clear();
            response.error = Error(Errc::body_too_large,
                                   fmt::format("response body exceeds {} bytes limit",
                                               options.max_body_bytes));
            return response;
        }

        if (!res) {
            response.body.clear();
            if (ctx.done()) {
                response.error = Error(Errc::cancelled, "request cancelled: " + url);
            } else {
                response.error = Error(Errc::transport_failed,
                                       fmt::format("HTTP request failed: {}",
                                                   httplib::to_string(res.error())));
            }
            return response;
        }

        response.status = res->status;
    } catch (const std::exception& e) {
        response.body.clear();
        response.error = Error(Errc::transport_failed, fmt::format("HTTP request failed: {}", e.what()));
    }

    return response;
}

}  // namespace waypoint::core
