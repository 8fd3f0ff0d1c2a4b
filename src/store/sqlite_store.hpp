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


// Waypoint Store - Header
// Resource, service and override persistence on SQLite

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../model/routing.hpp"
#include "../model/settings.hpp"
#include "sqlite_db.hpp"

namespace waypoint::store {

inline constexpr std::string_view kStatusActive = "active";
inline constexpr std::string_view kStatusDisabled = "disabled";

/// Identity columns of a stored resource
struct StoredResource {
    std::string id;           // Internal id, stable across upstream renames
    std::string upstream_id;  // Router id last reported by the upstream
    std::string host;
    std::string service_id;
    std::string status;
    std::string entrypoints;
    std::string source_type;
    int router_priority = model::kDefaultRouterPriority;
    bool router_priority_manual = false;
};

/// Service row; `config` is the body under the `type` key
struct StoredService {
    std::string id;
    std::string name;
    std::string type;
    model::Document config = model::Document::object();
    std::string status{kStatusActive};
    std::string source_type;
};

/// Thread-safe access to the Waypoint database.
///
/// Every public method serializes on one connection mutex. Methods taking a Transaction
/// run on the caller's open transaction, which already holds that mutex; calling any
/// other method while a Transaction is alive on the same thread deadlocks.
class SqliteStore {
public:
    /// Holds the connection lock and an IMMEDIATE transaction; rolled back unless committed
    class Transaction {
    public:
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit() { tx_.commit(); }

    private:
        friend class SqliteStore;
        Transaction(std::mutex& mutex, SqliteDb& db) : lock_(mutex), db_(db), tx_(db) {}

        std::unique_lock<std::mutex> lock_;
        SqliteDb& db_;
        SqliteTransaction tx_;
    };

    /// Open `path`, apply connection pragmas and bootstrap the schema
    explicit SqliteStore(const std::string& path);

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    [[nodiscard]] std::unique_ptr<Transaction> begin();

    /// Run raw SQL (seeding, administrative edits)
    void exec(const std::string& sql);

    // ------------------------------------------------------------------------
    // Resource reconciliation
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<StoredResource> find_active_by_upstream_id(
        Transaction& tx, std::string_view upstream_id);
    [[nodiscard]] std::optional<StoredResource> find_active_by_host(Transaction& tx,
                                                                    std::string_view host);
    /// Rows from before internal ids: id equal to the upstream id, or no upstream id and
    /// the same host. Matches disabled rows too.
    [[nodiscard]] std::optional<StoredResource> find_legacy(Transaction& tx,
                                                            std::string_view upstream_id,
                                                            std::string_view host);

    /// Re-point an existing row at the observed route and mark it active. The router
    /// priority is taken only when positive and not manually pinned.
    void update_resource(Transaction& tx, const std::string& id, const std::string& upstream_id,
                         const model::DiscoveredResource& observed);

    void insert_resource(Transaction& tx, const std::string& id, const std::string& upstream_id,
                         const model::DiscoveredResource& observed);

    [[nodiscard]] std::vector<std::string> active_resource_ids();

    /// Returns false when no row changed
    bool disable_resource(const std::string& id);

    [[nodiscard]] std::optional<StoredResource> resource(const std::string& id);

    // ------------------------------------------------------------------------
    // Service reconciliation
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<StoredService> find_service(Transaction& tx, std::string_view id);
    void insert_service(Transaction& tx, const StoredService& service);
    /// Replace type and config and mark the service active
    void update_service(Transaction& tx, const StoredService& service);

    [[nodiscard]] std::vector<StoredService> list_services();

    bool disable_service(const std::string& id);

    // ------------------------------------------------------------------------
    // Merge engine reads
    // ------------------------------------------------------------------------

    [[nodiscard]] std::vector<model::OverrideRecord> load_middlewares();

    /// Active services only
    [[nodiscard]] std::vector<model::OverrideRecord> load_services();

    /// Active resources with their middleware assignments and custom service
    [[nodiscard]] std::vector<model::ResourceOverrides> load_active_resources();

    [[nodiscard]] model::MtlsSettings load_mtls_settings();
    [[nodiscard]] model::SecuritySettings load_security_settings();
    [[nodiscard]] model::CertificateConfig load_certificate_config();

private:
    [[nodiscard]] std::optional<StoredService> query_service(SqliteDb& db, std::string_view id);

    std::mutex mutex_;
    SqliteDb db_;
};

}  // namespace waypoint::store
