#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/period_inputs.hpp"
#include "period_task.hpp"

namespace normbalance::service {
class ResolutionService;
}

namespace normbalance::batch {

/*
  Resolves a set of periods on a fixed worker pool.

  Each period is an independent ResolutionService call with its own
  snapshot. Results come back in the order the periods were given,
  whatever order the workers finish in.
*/
class PeriodBatchRunner {
 public:
  PeriodBatchRunner(std::shared_ptr<service::ResolutionService> service, std::uint32_t threads);

  std::vector<BatchResult> Run(const std::vector<model::PeriodId>& periods);

  // Every period the source knows about, in period order.
  std::vector<BatchResult> RunAll();

 private:
  std::shared_ptr<service::ResolutionService> service_;
  std::uint32_t                               threads_;
};

} // namespace normbalance::batch
