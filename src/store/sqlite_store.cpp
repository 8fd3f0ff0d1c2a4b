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


// Waypoint Store - Implementation

#include "sqlite_store.hpp"

#include <fmt/format.h>

#include <charconv>

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "schema.hpp"

namespace waypoint::store {

namespace {

constexpr std::string_view kResourceColumns =
    "SELECT id, COALESCE(pangolin_router_id, ''), host, service_id, status, "
    "COALESCE(entrypoints, ''), COALESCE(source_type, ''), COALESCE(router_priority, 100), "
    "COALESCE(router_priority_manual, 0) FROM resources ";

StoredResource read_resource(const Statement& stmt) {
    StoredResource r;
    r.id = stmt.text(0);
    r.upstream_id = stmt.text(1);
    r.host = stmt.text(2);
    r.service_id = stmt.text(3);
    r.status = stmt.text(4);
    r.entrypoints = stmt.text(5);
    r.source_type = stmt.text(6);
    r.router_priority = static_cast<int>(stmt.integer(7));
    r.router_priority_manual = stmt.integer(8) != 0;
    return r;
}

std::optional<StoredResource> first_resource(Statement& stmt) {
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_resource(stmt);
}

/// JSON column value; "" or "null" placeholders and unparsable text yield nullopt
std::optional<model::Document> json_column(std::string_view text, std::string_view what,
                                           std::string_view owner) {
    if (text.empty() || text == "null") {
        return std::nullopt;
    }
    auto doc = model::Document::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        auto* logger = logging::get_current_logger();
        LOG_WARNING(logger, "Ignoring unparsable {} for {}: {}", what, owner, text);
        return std::nullopt;
    }
    return doc;
}

std::optional<int> int_column(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

int64_t priority_for_insert(const model::DiscoveredResource& observed) {
    return observed.router_priority > 0 ? observed.router_priority
                                        : model::kDefaultRouterPriority;
}

}  // namespace

SqliteStore::SqliteStore(const std::string& path) : db_(path) {
    db_.configure();
    bootstrap_schema(db_);
}

std::unique_ptr<SqliteStore::Transaction> SqliteStore::begin() {
    return std::unique_ptr<Transaction>(new Transaction(mutex_, db_));
}

void SqliteStore::exec(const std::string& sql) {
    std::lock_guard lock(mutex_);
    db_.exec(sql);
}

// ============================================================================
// Resources
// ============================================================================

std::optional<StoredResource> SqliteStore::find_active_by_upstream_id(
    Transaction& tx, std::string_view upstream_id) {
    auto stmt = tx.db_.prepare(fmt::format(
        "{} WHERE pangolin_router_id = ?1 AND status = 'active' LIMIT 1", kResourceColumns));
    stmt.bind(1, upstream_id);
    return first_resource(stmt);
}

std::optional<StoredResource> SqliteStore::find_active_by_host(Transaction& tx,
                                                               std::string_view host) {
    auto stmt = tx.db_.prepare(
        fmt::format("{} WHERE host = ?1 AND status = 'active' LIMIT 1", kResourceColumns));
    stmt.bind(1, host);
    return first_resource(stmt);
}

std::optional<StoredResource> SqliteStore::find_legacy(Transaction& tx,
                                                       std::string_view upstream_id,
                                                       std::string_view host) {
    auto stmt = tx.db_.prepare(fmt::format(
        "{} WHERE id = ?1 OR (pangolin_router_id IS NULL AND host = ?2) LIMIT 1",
        kResourceColumns));
    stmt.bind(1, upstream_id).bind(2, host);
    return first_resource(stmt);
}

void SqliteStore::update_resource(Transaction& tx, const std::string& id,
                                  const std::string& upstream_id,
                                  const model::DiscoveredResource& observed) {
    auto stmt = tx.db_.prepare(
        "UPDATE resources SET pangolin_router_id = ?1, host = ?2, service_id = ?3, "
        "status = 'active', source_type = ?4, "
        "router_priority = CASE WHEN ?5 > 0 AND COALESCE(router_priority_manual, 0) = 0 "
        "THEN ?5 ELSE router_priority END, "
        "updated_at = CURRENT_TIMESTAMP WHERE id = ?6");
    stmt.bind(1, upstream_id)
        .bind(2, observed.host)
        .bind(3, observed.service_id)
        .bind(4, observed.source_type)
        .bind(5, static_cast<int64_t>(observed.router_priority))
        .bind(6, id);
    stmt.run();
}

void SqliteStore::insert_resource(Transaction& tx, const std::string& id,
                                  const std::string& upstream_id,
                                  const model::DiscoveredResource& observed) {
    auto stmt = tx.db_.prepare(
        "INSERT INTO resources (id, pangolin_router_id, host, service_id, org_id, site_id, "
        "status, source_type, entrypoints, tls_domains, router_priority, "
        "router_priority_manual) "
        "VALUES (?1, ?2, ?3, ?4, 'unknown', 'unknown', 'active', ?5, ?6, ?7, ?8, 0)");
    stmt.bind(1, id)
        .bind(2, upstream_id)
        .bind(3, observed.host)
        .bind(4, observed.service_id)
        .bind(5, observed.source_type)
        .bind(6, observed.entrypoints.empty() ? std::string_view("websecure")
                                              : std::string_view(observed.entrypoints))
        .bind(7, observed.tls_domains)
        .bind(8, priority_for_insert(observed));
    stmt.run();
}

std::vector<std::string> SqliteStore::active_resource_ids() {
    std::lock_guard lock(mutex_);
    auto* logger = logging::get_current_logger();

    std::vector<std::string> ids;
    auto stmt = db_.prepare("SELECT id FROM resources WHERE status = 'active' ORDER BY id");
    while (stmt.step()) {
        if (stmt.is_null(0)) {
            LOG_WARNING(logger, "Skipping resource row without id");
            continue;
        }
        ids.push_back(stmt.text(0));
    }
    return ids;
}

bool SqliteStore::disable_resource(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE resources SET status = 'disabled', updated_at = CURRENT_TIMESTAMP "
        "WHERE id = ?1 AND status != 'disabled'");
    stmt.bind(1, id);
    stmt.run();
    return db_.changes() > 0;
}

std::optional<StoredResource> SqliteStore::resource(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(fmt::format("{} WHERE id = ?1", kResourceColumns));
    stmt.bind(1, id);
    return first_resource(stmt);
}

// ============================================================================
// Services
// ============================================================================

std::optional<StoredService> SqliteStore::query_service(SqliteDb& db, std::string_view id) {
    auto stmt = db.prepare(
        "SELECT id, name, type, config, status, COALESCE(source_type, '') FROM services "
        "WHERE id = ?1");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    StoredService service;
    service.id = stmt.text(0);
    service.name = stmt.text(1);
    service.type = stmt.text(2);
    service.config = json_column(stmt.text(3), "service config", service.id)
                         .value_or(model::Document::object());
    service.status = stmt.text(4);
    service.source_type = stmt.text(5);
    return service;
}

std::optional<StoredService> SqliteStore::find_service(Transaction& tx, std::string_view id) {
    return query_service(tx.db_, id);
}

void SqliteStore::insert_service(Transaction& tx, const StoredService& service) {
    auto stmt = tx.db_.prepare(
        "INSERT INTO services (id, name, type, config, status, source_type) "
        "VALUES (?1, ?2, ?3, ?4, 'active', ?5)");
    stmt.bind(1, service.id)
        .bind(2, service.name)
        .bind(3, service.type)
        .bind(4, service.config.dump())
        .bind(5, service.source_type);
    stmt.run();
}

void SqliteStore::update_service(Transaction& tx, const StoredService& service) {
    auto stmt = tx.db_.prepare(
        "UPDATE services SET type = ?1, config = ?2, status = 'active', "
        "updated_at = CURRENT_TIMESTAMP WHERE id = ?3");
    stmt.bind(1, service.type).bind(2, service.config.dump()).bind(3, service.id);
    stmt.run();
}

std::vector<StoredService> SqliteStore::list_services() {
    std::lock_guard lock(mutex_);
    std::vector<StoredService> services;

    auto stmt = db_.prepare(
        "SELECT id, name, type, config, status, COALESCE(source_type, '') FROM services "
        "ORDER BY id");
    while (stmt.step()) {
        StoredService service;
        service.id = stmt.text(0);
        service.name = stmt.text(1);
        service.type = stmt.text(2);
        service.config = json_column(stmt.text(3), "service config", service.id)
                             .value_or(model::Document::object());
        service.status = stmt.text(4);
        service.source_type = stmt.text(5);
        services.push_back(std::move(service));
    }
    return services;
}

bool SqliteStore::disable_service(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE services SET status = 'disabled', updated_at = CURRENT_TIMESTAMP "
        "WHERE id = ?1 AND status != 'disabled'");
    stmt.bind(1, id);
    stmt.run();
    return db_.changes() > 0;
}

// ============================================================================
// Merge engine reads
// ============================================================================

std::vector<model::OverrideRecord> SqliteStore::load_middlewares() {
    std::lock_guard lock(mutex_);
    auto* logger = logging::get_current_logger();
    std::vector<model::OverrideRecord> records;

    auto stmt = db_.prepare(
        "SELECT id, name, type, config, COALESCE(source_type, '') FROM middlewares ORDER BY id");
    while (stmt.step()) {
        model::OverrideRecord record;
        record.id = stmt.text(0);
        record.name = stmt.text(1);
        record.type = stmt.text(2);

        auto config = json_column(stmt.text(3), "middleware config", record.id);
        if (!config) {
            LOG_WARNING(logger, "Skipping middleware {} without usable config", record.id);
            continue;
        }
        record.config = std::move(*config);
        record.source_type = stmt.text(4);
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<model::OverrideRecord> SqliteStore::load_services() {
    std::lock_guard lock(mutex_);
    auto* logger = logging::get_current_logger();
    std::vector<model::OverrideRecord> records;

    auto stmt = db_.prepare(
        "SELECT id, name, type, config, COALESCE(source_type, '') FROM services "
        "WHERE status = 'active' ORDER BY id");
    while (stmt.step()) {
        model::OverrideRecord record;
        record.id = stmt.text(0);
        record.name = stmt.text(1);
        record.type = stmt.text(2);

        auto config = json_column(stmt.text(3), "service config", record.id);
        if (!config) {
            LOG_WARNING(logger, "Skipping service {} without usable config", record.id);
            continue;
        }
        record.config = std::move(*config);
        record.source_type = stmt.text(4);
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<model::ResourceOverrides> SqliteStore::load_active_resources() {
    std::lock_guard lock(mutex_);
    auto* logger = logging::get_current_logger();

    std::vector<model::ResourceOverrides> resources;
    core::fast_map<std::string, size_t> index;

    auto stmt = db_.prepare(
        "SELECT id, host, service_id, COALESCE(entrypoints, ''), COALESCE(tls_domains, ''), "
        "COALESCE(source_type, ''), COALESCE(router_priority, 100), "
        "COALESCE(custom_headers, ''), COALESCE(mtls_enabled, 0), COALESCE(mtls_rules, ''), "
        "COALESCE(mtls_request_headers, ''), COALESCE(mtls_reject_message, ''), "
        "COALESCE(mtls_reject_code, 403), COALESCE(mtls_refresh_interval, ''), "
        "COALESCE(mtls_external_data, ''), COALESCE(tls_hardening_enabled, 0), "
        "COALESCE(secure_headers_enabled, 0) "
        "FROM resources WHERE status = 'active' ORDER BY id");

    while (stmt.step()) {
        if (stmt.is_null(0) || stmt.is_null(1)) {
            LOG_WARNING(logger, "Skipping resource row with missing id or host");
            continue;
        }

        model::ResourceOverrides r;
        r.id = stmt.text(0);
        r.host = stmt.text(1);
        r.service_id = stmt.text(2);
        r.entrypoints = stmt.text(3);
        r.tls_domains = stmt.text(4);
        r.source_type = stmt.text(5);
        r.router_priority = static_cast<int>(stmt.integer(6));

        if (auto headers = json_column(stmt.text(7), "custom headers", r.id)) {
            if (headers->is_object()) {
                r.custom_headers = std::move(*headers);
            } else {
                LOG_WARNING(logger, "Ignoring non-object custom headers for {}", r.id);
            }
        }

        r.mtls.enabled = stmt.integer(8) != 0;
        r.mtls.rules = json_column(stmt.text(9), "mTLS rules", r.id);
        r.mtls.request_headers = json_column(stmt.text(10), "mTLS request headers", r.id);
        if (auto message = stmt.text(11); !message.empty()) {
            r.mtls.reject_message = std::move(message);
        }
        if (auto code = static_cast<int>(stmt.integer(12)); code > 0 && code != 403) {
            r.mtls.reject_code = code;
        }
        if (auto interval = stmt.text(13); !interval.empty()) {
            r.mtls.refresh_interval = int_column(interval);
            if (!r.mtls.refresh_interval) {
                LOG_WARNING(logger, "Ignoring invalid mTLS refresh interval for {}: {}", r.id,
                            interval);
            }
        }
        r.mtls.external_data = json_column(stmt.text(14), "mTLS external data", r.id);
        r.tls_hardening_enabled = stmt.integer(15) != 0;
        r.secure_headers_enabled = stmt.integer(16) != 0;

        index.emplace(r.id, resources.size());
        resources.push_back(std::move(r));
    }

    // Ties keep assignment order
    auto assignments = db_.prepare(
        "SELECT rm.resource_id, rm.middleware_id, rm.priority FROM resource_middlewares rm "
        "JOIN resources r ON r.id = rm.resource_id WHERE r.status = 'active' "
        "ORDER BY rm.resource_id, rm.priority DESC, rm.rowid");
    while (assignments.step()) {
        auto it = index.find(assignments.text(0));
        if (it == index.end()) {
            continue;
        }
        resources[it->second].middlewares.push_back(model::MiddlewareAssignment{
            assignments.text(1), static_cast<int>(assignments.integer(2))});
    }

    auto custom_services = db_.prepare(
        "SELECT rs.resource_id, rs.service_id FROM resource_services rs "
        "JOIN resources r ON r.id = rs.resource_id WHERE r.status = 'active' "
        "ORDER BY rs.resource_id, rs.rowid");
    while (custom_services.step()) {
        auto it = index.find(custom_services.text(0));
        if (it == index.end()) {
            continue;
        }
        auto& target = resources[it->second].custom_service_id;
        if (target.empty()) {
            target = custom_services.text(1);
        }
    }

    return resources;
}

model::MtlsSettings SqliteStore::load_mtls_settings() {
    std::lock_guard lock(mutex_);
    model::MtlsSettings settings;

    auto stmt = db_.prepare(
        "SELECT COALESCE(enabled, 0), COALESCE(ca_cert_path, ''), COALESCE(certs_base_path, ''), "
        "COALESCE(middleware_rules, ''), COALESCE(middleware_request_headers, ''), "
        "COALESCE(middleware_reject_message, ''), COALESCE(middleware_refresh_interval, 300) "
        "FROM mtls_config WHERE id = 1");
    if (!stmt.step()) {
        return settings;
    }

    settings.enabled = stmt.integer(0) != 0;
    settings.ca_cert_path = stmt.text(1);
    if (auto base = stmt.text(2); !base.empty()) {
        settings.certs_base_path = std::move(base);
    }
    if (auto rules = json_column(stmt.text(3), "mTLS rules", "mtls_config");
        rules && rules->is_array()) {
        settings.rules = std::move(*rules);
    }
    if (auto headers = json_column(stmt.text(4), "mTLS request headers", "mtls_config");
        headers && headers->is_object()) {
        settings.request_headers = std::move(*headers);
    }
    if (auto message = stmt.text(5); !message.empty()) {
        settings.reject_message = std::move(message);
    }
    settings.refresh_interval = static_cast<int>(stmt.integer(6));
    return settings;
}

model::SecuritySettings SqliteStore::load_security_settings() {
    std::lock_guard lock(mutex_);
    model::SecuritySettings settings;

    auto stmt = db_.prepare(
        "SELECT COALESCE(tls_hardening_enabled, 0), COALESCE(secure_headers_enabled, 0), "
        "COALESCE(secure_headers_x_content_type_options, ''), "
        "COALESCE(secure_headers_x_frame_options, ''), "
        "COALESCE(secure_headers_x_xss_protection, ''), COALESCE(secure_headers_hsts, ''), "
        "COALESCE(secure_headers_referrer_policy, ''), COALESCE(secure_headers_csp, ''), "
        "COALESCE(secure_headers_permissions_policy, '') FROM security_config WHERE id = 1");
    if (!stmt.step()) {
        return settings;
    }

    settings.tls_hardening_enabled = stmt.integer(0) != 0;
    settings.secure_headers_enabled = stmt.integer(1) != 0;
    settings.headers.x_content_type_options = stmt.text(2);
    settings.headers.x_frame_options = stmt.text(3);
    settings.headers.x_xss_protection = stmt.text(4);
    settings.headers.hsts = stmt.text(5);
    settings.headers.referrer_policy = stmt.text(6);
    settings.headers.csp = stmt.text(7);
    settings.headers.permissions_policy = stmt.text(8);
    return settings;
}

model::CertificateConfig SqliteStore::load_certificate_config() {
    std::lock_guard lock(mutex_);
    model::CertificateConfig config;

    auto stmt = db_.prepare(
        "SELECT COALESCE(enabled, 0), COALESCE(ca_cert, ''), COALESCE(ca_cert_path, '') "
        "FROM mtls_config WHERE id = 1");
    if (!stmt.step()) {
        return config;
    }

    config.enabled = stmt.integer(0) != 0;
    config.ca_cert_path = stmt.text(2);
    config.has_ca = !stmt.text(1).empty() || !config.ca_cert_path.empty();
    return config;
}

}  // namespace waypoint::store
