#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace normbalance::db::sqlite {

enum class OpenMode {
  kReadWrite,
  kReadOnly,
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  bool IsReadOnly() const {
    return mode_ == OpenMode::kReadOnly;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string; may hold several statements (schema, seed scripts)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize, or wrap in Statement)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, etc.); journal settings only when writable
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

// Owns a prepared statement for the scope of one query.
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql) : db_(db.Handle()), stmt_(db.Prepare(sql)) {
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  // True while rows remain; throws std::runtime_error on step failure.
  bool Step();

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_;
};

} // namespace normbalance::db::sqlite
