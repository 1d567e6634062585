#include "memory_snapshot_source.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace normbalance::db::memory {

MemorySnapshotSource::MemorySnapshotSource(ReferenceData reference) : reference_(std::move(reference)) {
}

void MemorySnapshotSource::SetReference(ReferenceData reference) {
  std::lock_guard<std::mutex> lock(mutex_);
  reference_ = std::move(reference);
}

void MemorySnapshotSource::PutPeriod(PeriodInputs inputs) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        id = inputs.period.id;
  periods_[id]                   = std::move(inputs);
}

ReferenceData MemorySnapshotSource::LoadReference() {
  std::lock_guard<std::mutex> lock(mutex_);
  return reference_;
}

std::vector<model::Period> MemorySnapshotSource::ListPeriods() {
  std::vector<model::Period> periods;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    periods.reserve(periods_.size());
    for (const auto& [id, inputs] : periods_) {
      periods.push_back(inputs.period);
    }
  }

  std::stable_sort(periods.begin(), periods.end(), [](const model::Period& a, const model::Period& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.id < b.id;
  });
  return periods;
}

std::optional<model::Period> MemorySnapshotSource::FindPeriod(const model::PeriodId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = periods_.find(id);
  if (it == periods_.end()) {
    return std::nullopt;
  }
  return it->second.period;
}

PeriodInputs MemorySnapshotSource::LoadPeriod(const model::PeriodId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = periods_.find(id);
  if (it == periods_.end()) {
    throw util::NotFound("unknown period: " + id);
  }
  return it->second;
}

} // namespace normbalance::db::memory
