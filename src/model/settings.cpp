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

// Waypoint Settings - Implementation

#include "settings.hpp"

namespace waypoint::model {

bool SecureHeaders::any_set() const noexcept {
    return !x_content_type_options.empty() || !x_frame_options.empty() ||
           !x_xss_protection.empty() || !hsts.empty() || !referrer_policy.empty() ||
           !csp.empty() || !permissions_policy.empty();
}

Document tls_hardening_options() {
    Document options = Document::object();
    options["minVersion"] = "VersionTLS12";
    options["maxVersion"] = "VersionTLS13";
    options["sniStrict"] = true;
    options["cipherSuites"] = Document::array({
        "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256",
        "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",
        "TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384",
        "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384",
        "TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256",
        "TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256",
    });
    options["curvePreferences"] = Document::array({"X25519", "CurveP384", "CurveP521"});
    return options;
}

Document mtls_verify_options(std::string_view ca_cert_path) {
    Document client_auth = Document::object();
    client_auth["caFiles"] = Document::array({std::string(ca_cert_path)});
    client_auth["clientAuthType"] = "VerifyClientCertIfGiven";

    Document options = Document::object();
    options["clientAuth"] = std::move(client_auth);
    options["minVersion"] = "VersionTLS12";
    options["sniStrict"] = true;
    return options;
}

Document secure_headers_middleware(const SecureHeaders& headers) {
    Document response = Document::object();
    auto put = [&response](const char* name, const std::string& value) {
        if (!value.empty()) {
            response[name] = value;
        }
    };

    put("X-Content-Type-Options", headers.x_content_type_options);
    put("X-Frame-Options", headers.x_frame_options);
    put("X-XSS-Protection", headers.x_xss_protection);
    put("Strict-Transport-Security", headers.hsts);
    put("Referrer-Policy", headers.referrer_policy);
    put("Content-Security-Policy", headers.csp);
    put("Permissions-Policy", headers.permissions_policy);

    Document body = Document::object();
    body["customResponseHeaders"] = std::move(response);

    Document middleware = Document::object();
    middleware["headers"] = std::move(body);
    return middleware;
}

}  // namespace waypoint::model
