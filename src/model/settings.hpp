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

// Waypoint Settings - Header
// Global mTLS and security settings plus the stored override records

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "document.hpp"
#include "routing.hpp"

namespace waypoint::model {

/// Names of the objects Waypoint injects into the published document
inline constexpr std::string_view kMtlsVerifyOption = "mtls-verify";
inline constexpr std::string_view kTlsHardenedOption = "tls-hardened";
inline constexpr std::string_view kMtlsMiddleware = "mtls-auth";
inline constexpr std::string_view kMtlsPluginName = "mtlswhitelist";
inline constexpr std::string_view kSecureHeadersMiddleware = "waypoint-secure-headers";

/// Global mTLS configuration (singleton mtls_config row)
struct MtlsSettings {
    bool enabled = false;
    std::string ca_cert_path;
    std::string certs_base_path = "/etc/traefik/certs";
    /// Whitelist rules (array), request-header templates (object)
    Document rules = Document::array();
    Document request_headers = Document::object();
    std::string reject_message = "Access denied: Valid client certificate required";
    int refresh_interval = 300;
};

/// Response headers applied by the secure-headers middleware; empty values are omitted
struct SecureHeaders {
    std::string x_content_type_options = "nosniff";
    std::string x_frame_options = "SAMEORIGIN";
    std::string x_xss_protection = "1; mode=block";
    std::string hsts = "max-age=31536000; includeSubDomains";
    std::string referrer_policy = "strict-origin-when-cross-origin";
    std::string csp;
    std::string permissions_policy;

    [[nodiscard]] bool any_set() const noexcept;
};

/// Global security configuration (singleton security_config row)
struct SecuritySettings {
    bool tls_hardening_enabled = false;
    bool secure_headers_enabled = false;
    SecureHeaders headers;
};

/// State reported by the certificate authority collaborator
struct CertificateConfig {
    bool enabled = false;
    bool has_ca = false;
    std::string ca_cert_path;
};

/// Stored middleware or service override record
struct OverrideRecord {
    std::string id;
    std::string name;
    std::string type;
    Document config = Document::object();
    std::string source_type;
};

/// Middleware assigned to a resource, with its ordering priority
struct MiddlewareAssignment {
    std::string middleware_id;
    int priority = 100;
};

/// Per-resource mTLS overrides; unset fields inherit the global settings
struct ResourceMtls {
    bool enabled = false;
    std::optional<Document> rules;
    std::optional<Document> request_headers;
    std::optional<std::string> reject_message;
    std::optional<int> reject_code;
    std::optional<int> refresh_interval;
    std::optional<Document> external_data;

    [[nodiscard]] bool has_overrides() const noexcept {
        return rules || request_headers || reject_message || reject_code || refresh_interval ||
               external_data;
    }
};

/// Active resource with everything the merge engine applies to its router
struct ResourceOverrides {
    std::string id;
    std::string host;
    std::string service_id;
    std::string entrypoints;
    std::string tls_domains;
    std::string source_type;
    int router_priority = kDefaultRouterPriority;
    /// Header name -> value; empty when unset or unparsable
    Document custom_headers = Document::object();
    ResourceMtls mtls;
    bool tls_hardening_enabled = false;
    bool secure_headers_enabled = false;
    /// Sorted by descending priority, stable
    std::vector<MiddlewareAssignment> middlewares;
    std::string custom_service_id;
};

/// Hardened TLS option (TLS 1.2-1.3, ECDHE suites, modern curves)
[[nodiscard]] Document tls_hardening_options();

/// Client-certificate verification option for the given CA file
[[nodiscard]] Document mtls_verify_options(std::string_view ca_cert_path);

/// `headers` middleware carrying every non-empty secure header
[[nodiscard]] Document secure_headers_middleware(const SecureHeaders& headers);

}  // namespace waypoint::model
