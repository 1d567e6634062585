#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "internal/model/period_inputs.hpp"
#include "normbalance/report/v1/report.pb.h"

namespace normbalance::batch {

/*
  One period to resolve. `slot` is the position of its result in the batch.
*/
struct PeriodTask {
  std::size_t     slot = 0;
  model::PeriodId period;
};

struct BatchResult {
  model::PeriodId period;

  // Unset when the period could not be loaded or validated.
  std::optional<report::v1::BalanceReport> report;
  std::string                              error;

  bool Ok() const {
    return report.has_value() && report->status() == report::v1::RESOLUTION_STATUS_CONVERGED;
  }
};

} // namespace normbalance::batch
