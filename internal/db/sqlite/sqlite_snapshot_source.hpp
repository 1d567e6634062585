#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/snapshot_source.hpp"
#include "sqlite_db.hpp"

namespace normbalance::db::sqlite {

/*
  SnapshotSource over the reference schema.

  Each Load* call runs inside its own read transaction. The connection is
  shared, so calls are serialised on an internal mutex.
*/
class SqliteSnapshotSource final : public db::SnapshotSource {
 public:
  explicit SqliteSnapshotSource(std::shared_ptr<SqliteDB> db);

  ReferenceData                LoadReference() override;
  std::vector<model::Period>   ListPeriods() override;
  std::optional<model::Period> FindPeriod(const model::PeriodId& id) override;
  PeriodInputs                 LoadPeriod(const model::PeriodId& id) override;

 private:
  std::optional<model::Period> QueryPeriod(const model::PeriodId& id);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace normbalance::db::sqlite
