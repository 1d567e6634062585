#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "period_task.hpp"

namespace normbalance::batch {

/*
  Fixed work list of one batch, shared by its workers.

  Every period is known up front, so Next() never blocks: it hands out the
  next unclaimed period together with its result slot, and nullopt once all
  periods are claimed. Workers report back through Complete(); TakeResults()
  returns the slots in input order after the workers have joined.
*/
class PeriodQueue {
 public:
  explicit PeriodQueue(std::vector<model::PeriodId> periods);

  std::optional<PeriodTask> Next();

  // Throws std::out_of_range for a slot this queue never handed out.
  void Complete(std::size_t slot, BatchResult result);

  std::size_t Size() const {
    return periods_.size();
  }
  std::size_t Completed() const;

  std::vector<BatchResult> TakeResults();

 private:
  const std::vector<model::PeriodId> periods_;

  mutable std::mutex       mutex_;
  std::size_t              next_      = 0;
  std::size_t              completed_ = 0;
  std::vector<BatchResult> results_;
};

} // namespace normbalance::batch
