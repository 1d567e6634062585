#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/snapshot_source.hpp"

namespace normbalance::db::memory {

/*
  In-memory SnapshotSource.

  Filled programmatically (tests, embedding). Periods are kept in the order
  ListPeriods() promises regardless of insertion order.
*/
class MemorySnapshotSource final : public db::SnapshotSource {
 public:
  MemorySnapshotSource() = default;
  explicit MemorySnapshotSource(ReferenceData reference);

  void SetReference(ReferenceData reference);

  // Replaces any inputs stored for the same period id.
  void PutPeriod(PeriodInputs inputs);

  ReferenceData                 LoadReference() override;
  std::vector<model::Period>    ListPeriods() override;
  std::optional<model::Period>  FindPeriod(const model::PeriodId& id) override;
  PeriodInputs                  LoadPeriod(const model::PeriodId& id) override;

 private:
  mutable std::mutex                        mutex_;
  ReferenceData                             reference_;
  std::map<model::PeriodId, PeriodInputs>   periods_;
};

} // namespace normbalance::db::memory
