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


// Waypoint SQLite - Implementation

#include "sqlite_db.hpp"

#include <fmt/format.h>

#include <utility>

#include "../core/logging.hpp"

namespace waypoint::store {

namespace {

[[noreturn]] void raise(sqlite3* db, std::string_view what) {
    throw StoreError(fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : "out of memory"));
}

}  // namespace

// ============================================================================
// Statement
// ============================================================================

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind(int index, std::string_view value) {
    if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        raise(db_, "bind text");
    }
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        raise(db_, "bind integer");
    }
    return *this;
}

Statement& Statement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        raise(db_, "bind null");
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    raise(db_, "step");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::text(int column) const {
    const auto* value = sqlite3_column_text(stmt_, column);
    if (!value) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(value),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

int64_t Statement::integer(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// ============================================================================
// SqliteDb
// ============================================================================

SqliteDb::SqliteDb(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(fmt::format("failed to open database {}: {}", path, message));
    }
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDb::configure() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA temp_store=MEMORY;");
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        raise(db_, "busy timeout");
    }
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError(fmt::format("exec failed: {} (sql: {})", message, sql));
    }
}

Statement SqliteDb::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) !=
        SQLITE_OK) {
        raise(db_, fmt::format("prepare '{}'", sql));
    }
    return Statement(db_, stmt);
}

int SqliteDb::changes() const noexcept {
    return sqlite3_changes(db_);
}

// ============================================================================
// SqliteTransaction
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
    active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
    if (!active_) {
        return;
    }
    try {
        rollback();
    } catch (const StoreError& e) {
        auto* logger = logging::get_current_logger();
        LOG_ERROR(logger, "Transaction rollback failed: {}", e.what());
    }
}

void SqliteTransaction::commit() {
    if (!active_) {
        throw StoreError("commit on inactive transaction");
    }
    db_.exec("COMMIT;");
    active_ = false;
}

void SqliteTransaction::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    db_.exec("ROLLBACK;");
}

}  // namespace waypoint::store
