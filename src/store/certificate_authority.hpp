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


// Waypoint Certificate Authority - Header
// State of the CA that issues client certificates for mTLS

#pragma once

#include "../model/settings.hpp"
#include "sqlite_store.hpp"

namespace waypoint::store {

/// Reports whether mTLS is enabled and where the CA certificate lives
class CertificateAuthority {
public:
    virtual ~CertificateAuthority() = default;

    /// May throw StoreError
    [[nodiscard]] virtual model::CertificateConfig get_config() = 0;
};

/// Reads the CA state kept in the mtls_config row
class StoredCertificateAuthority final : public CertificateAuthority {
public:
    explicit StoredCertificateAuthority(SqliteStore& store) : store_(store) {}

    [[nodiscard]] model::CertificateConfig get_config() override {
        return store_.load_certificate_config();
    }

private:
    SqliteStore& store_;
};

}  // namespace waypoint::store
