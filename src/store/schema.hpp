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


// Waypoint Storage Schema - Header

#pragma once

#include "sqlite_db.hpp"

namespace waypoint::store {

/// Create every table and singleton row, then add columns missing from databases
/// created by older versions. Safe to run on every start.
void bootstrap_schema(SqliteDb& db);

/// True when `table` already has `column`
[[nodiscard]] bool has_column(SqliteDb& db, std::string_view table, std::string_view column);

}  // namespace waypoint::store
