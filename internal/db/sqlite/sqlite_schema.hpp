#pragma once

#include <memory>
#include <string>

#include "sqlite_db.hpp"

namespace normbalance::db::sqlite {

// Creates every reference and per-period table if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

// Runs a SQL script file inside one write transaction (seed data).
void RunScript(const std::shared_ptr<SqliteDB>& db, const std::string& path);

} // namespace normbalance::db::sqlite
