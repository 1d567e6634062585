#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace normbalance::db::sqlite {

/*
  SQLite transaction wrapper.

  kRead uses a deferred BEGIN: all queries of one snapshot load see the same
  database state.
  kWrite uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Destructor rolls back unless Commit() ran.
*/
class SqliteTransaction {
 public:
  enum class Kind { kRead, kWrite };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Kind kind);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  SqliteDB& DB() const {
    return *db_;
  }

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace normbalance::db::sqlite
