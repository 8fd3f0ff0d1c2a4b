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


// Waypoint SQLite - Header
// RAII connection, prepared statement and transaction wrappers

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace waypoint::store {

/// Raised by every storage operation that SQLite rejects
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Prepared statement; finalized on destruction
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Parameters are 1-based, as in sqlite3_bind_*
    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, int64_t value);
    Statement& bind_null(int index);

    /// Advance to the next row. Returns false when the statement is done.
    [[nodiscard]] bool step();

    /// Run a statement that returns no rows
    void run();

    void reset();

    // Columns are 0-based; NULL reads as "" / 0
    [[nodiscard]] std::string text(int column) const;
    [[nodiscard]] int64_t integer(int column) const;
    [[nodiscard]] bool is_null(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/// Owns one sqlite3 connection
class SqliteDb {
public:
    /// Open (creating if needed) the database at `path`; ":memory:" for a private in-memory db
    explicit SqliteDb(const std::string& path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    /// WAL journal, NORMAL sync, foreign keys, 5s busy timeout
    void configure();

    void exec(const std::string& sql);

    [[nodiscard]] Statement prepare(std::string_view sql);

    /// Rows changed by the most recent statement
    [[nodiscard]] int changes() const noexcept;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
};

/// BEGIN IMMEDIATE on construction; rolled back on destruction unless committed
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDb& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();
    void rollback();

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    SqliteDb& db_;
    bool active_ = false;
};

}  // namespace waypoint::store
