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


// Waypoint Storage Schema - Implementation

#include "schema.hpp"

#include <fmt/format.h>

#include <array>

#include "../core/logging.hpp"

namespace waypoint::store {

namespace {

constexpr const char* kTables = R"sql(
CREATE TABLE IF NOT EXISTS middlewares (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    type TEXT NOT NULL,
    config TEXT NOT NULL,
    source_type TEXT DEFAULT '',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS resources (
    id TEXT PRIMARY KEY,
    pangolin_router_id TEXT,
    host TEXT NOT NULL,
    service_id TEXT NOT NULL,
    org_id TEXT NOT NULL DEFAULT 'unknown',
    site_id TEXT NOT NULL DEFAULT 'unknown',
    status TEXT NOT NULL DEFAULT 'active',
    entrypoints TEXT DEFAULT 'websecure',
    tls_domains TEXT DEFAULT '',
    custom_headers TEXT DEFAULT '',
    mtls_enabled INTEGER DEFAULT 0,
    mtls_rules TEXT DEFAULT '',
    mtls_request_headers TEXT DEFAULT '',
    mtls_reject_message TEXT DEFAULT '',
    mtls_reject_code INTEGER DEFAULT 403,
    mtls_refresh_interval TEXT DEFAULT '',
    mtls_external_data TEXT DEFAULT '',
    tls_hardening_enabled INTEGER DEFAULT 0,
    secure_headers_enabled INTEGER DEFAULT 0,
    router_priority INTEGER DEFAULT 100,
    router_priority_manual INTEGER DEFAULT 0,
    source_type TEXT DEFAULT '',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS resource_middlewares (
    resource_id TEXT NOT NULL,
    middleware_id TEXT NOT NULL,
    priority INTEGER NOT NULL DEFAULT 100,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (resource_id, middleware_id),
    FOREIGN KEY (resource_id) REFERENCES resources(id) ON DELETE CASCADE,
    FOREIGN KEY (middleware_id) REFERENCES middlewares(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS services (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    type TEXT NOT NULL,
    config TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'active',
    source_type TEXT DEFAULT '',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS resource_services (
    resource_id TEXT NOT NULL,
    service_id TEXT NOT NULL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (resource_id, service_id),
    FOREIGN KEY (resource_id) REFERENCES resources(id) ON DELETE CASCADE,
    FOREIGN KEY (service_id) REFERENCES services(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS mtls_config (
    id INTEGER PRIMARY KEY CHECK (id = 1),
    enabled INTEGER DEFAULT 0,
    ca_cert TEXT DEFAULT '',
    ca_cert_path TEXT DEFAULT '',
    certs_base_path TEXT DEFAULT '/etc/traefik/certs',
    middleware_rules TEXT DEFAULT '',
    middleware_request_headers TEXT DEFAULT '',
    middleware_reject_message TEXT DEFAULT 'Access denied: Valid client certificate required',
    middleware_refresh_interval INTEGER DEFAULT 300,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

INSERT OR IGNORE INTO mtls_config (id) VALUES (1);

CREATE TABLE IF NOT EXISTS security_config (
    id INTEGER PRIMARY KEY CHECK (id = 1),
    tls_hardening_enabled INTEGER DEFAULT 0,
    secure_headers_enabled INTEGER DEFAULT 0,
    secure_headers_x_content_type_options TEXT DEFAULT 'nosniff',
    secure_headers_x_frame_options TEXT DEFAULT 'SAMEORIGIN',
    secure_headers_x_xss_protection TEXT DEFAULT '1; mode=block',
    secure_headers_hsts TEXT DEFAULT 'max-age=31536000; includeSubDomains',
    secure_headers_referrer_policy TEXT DEFAULT 'strict-origin-when-cross-origin',
    secure_headers_csp TEXT DEFAULT '',
    secure_headers_permissions_policy TEXT DEFAULT '',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

INSERT OR IGNORE INTO security_config (id) VALUES (1);

CREATE INDEX IF NOT EXISTS idx_resources_host_status ON resources(host, status);
)sql";

struct ColumnMigration {
    const char* table;
    const char* column;
    const char* definition;
};

// Columns added after the first released schema
constexpr std::array kColumnMigrations = {
    ColumnMigration{"resources", "pangolin_router_id", "TEXT"},
    ColumnMigration{"resources", "mtls_enabled", "INTEGER DEFAULT 0"},
    ColumnMigration{"resources", "mtls_rules", "TEXT DEFAULT ''"},
    ColumnMigration{"resources", "mtls_request_headers", "TEXT DEFAULT ''"},
    ColumnMigration{"resources", "mtls_reject_message", "TEXT DEFAULT ''"},
    ColumnMigration{"resources", "mtls_reject_code", "INTEGER DEFAULT 403"},
    ColumnMigration{"resources", "mtls_refresh_interval", "TEXT DEFAULT ''"},
    ColumnMigration{"resources", "mtls_external_data", "TEXT DEFAULT ''"},
    ColumnMigration{"resources", "tls_hardening_enabled", "INTEGER DEFAULT 0"},
    ColumnMigration{"resources", "secure_headers_enabled", "INTEGER DEFAULT 0"},
    ColumnMigration{"resources", "router_priority", "INTEGER DEFAULT 100"},
    ColumnMigration{"resources", "router_priority_manual", "INTEGER DEFAULT 0"},
    ColumnMigration{"resources", "source_type", "TEXT DEFAULT ''"},
    ColumnMigration{"middlewares", "source_type", "TEXT DEFAULT ''"},
    ColumnMigration{"services", "status", "TEXT NOT NULL DEFAULT 'active'"},
    ColumnMigration{"services", "source_type", "TEXT DEFAULT ''"},
};

}  // namespace

bool has_column(SqliteDb& db, std::string_view table, std::string_view column) {
    auto stmt = db.prepare(fmt::format("PRAGMA table_info({});", table));
    while (stmt.step()) {
        // cid, name, type, notnull, dflt_value, pk
        if (stmt.text(1) == column) {
            return true;
        }
    }
    return false;
}

void bootstrap_schema(SqliteDb& db) {
    auto* logger = logging::get_current_logger();

    db.exec(kTables);

    int added = 0;
    for (const auto& migration : kColumnMigrations) {
        if (has_column(db, migration.table, migration.column)) {
            continue;
        }
        db.exec(fmt::format("ALTER TABLE {} ADD COLUMN {} {};", migration.table, migration.column,
                            migration.definition));
        LOG_INFO(logger, "Added column {}.{}", migration.table, migration.column);
        ++added;
    }

    LOG_DEBUG(logger, "Schema ready at {} ({} columns migrated)", db.path(), added);
}

}  // namespace waypoint::store
