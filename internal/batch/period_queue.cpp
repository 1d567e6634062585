#include "period_queue.hpp"

#include <stdexcept>
#include <string>

namespace normbalance::batch {

PeriodQueue::PeriodQueue(std::vector<model::PeriodId> periods) : periods_(std::move(periods)), results_(periods_.size()) {
}

std::optional<PeriodTask> PeriodQueue::Next() {
  std::lock_guard lock(mutex_);
  if (next_ == periods_.size()) return std::nullopt;

  const std::size_t slot = next_++;
  return PeriodTask{slot, periods_[slot]};
}

void PeriodQueue::Complete(std::size_t slot, BatchResult result) {
  std::lock_guard lock(mutex_);
  if (slot >= next_) {
    throw std::out_of_range("period slot " + std::to_string(slot) + " was not handed out");
  }
  results_[slot] = std::move(result);
  ++completed_;
}

std::size_t PeriodQueue::Completed() const {
  std::lock_guard lock(mutex_);
  return completed_;
}

std::vector<BatchResult> PeriodQueue::TakeResults() {
  std::lock_guard lock(mutex_);
  return std::move(results_);
}

} // namespace normbalance::batch
