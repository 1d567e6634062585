#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/period_inputs.hpp"
#include "normbalance/report/v1/report.pb.h"
#include "service_context.hpp"

namespace normbalance::service {

struct ValidationSummary {
  std::size_t utilities    = 0;
  std::size_t norms        = 0;
  std::size_t steam_assets = 0;
  std::size_t power_assets = 0;
  std::size_t periods      = 0;
};

/*
  Loads one period snapshot, resolves it and returns the report.

  Every call builds its own graph and availability view from a fresh load,
  so concurrent calls share nothing but the source and the formula registry.

  Resolution failures (convergence, capacity, supply) are returned as
  non-authoritative reports. ValidationError, NotFound and loader errors
  propagate.
*/
class ResolutionService {
 public:
  explicit ResolutionService(ServiceContext ctx);

  // Builds graph and availability for the reference data; throws util::ValidationError.
  ValidationSummary Validate();

  report::v1::BalanceReport Resolve(const model::PeriodId& period);

  std::vector<model::Period> Periods();

 private:
  ServiceContext ctx_;
};

} // namespace normbalance::service
