#pragma once

#include <optional>
#include <vector>

#include "internal/model/assets.hpp"
#include "internal/model/norm_edge.hpp"
#include "internal/model/period_inputs.hpp"
#include "internal/model/utility.hpp"

namespace normbalance::db {

// Period-independent master data.
struct ReferenceData {
  std::vector<model::Utility>          utilities;
  std::vector<model::NormEdge>         norms;
  std::vector<model::SteamAsset>       steam_assets;
  std::vector<model::PowerAsset>       power_assets;
  std::vector<model::UtilityAssetLink> links;
};

struct PeriodInputs {
  model::Period                          period;
  model::DemandMap                       demand;
  std::vector<model::AvailabilityRecord> availability;
  model::CoefficientMap                  coefficients;
  model::BenchmarkMap                    benchmarks;
};

/*
  Read-only snapshot loader.

  CRITICAL GUARANTEES:

  - Every call returns an owned copy; nothing returned aliases the source
  - Implementations are safe to call from several worker threads
  - Norm edges come back in NormId order, utilities in UtilityId order

  Formula bindings are already applied: a bound CONVERSION edge carries a
  FormulaFactor whose fallback is the stored plain factor.

  Backend failures surface as std::runtime_error.
*/
class SnapshotSource {
 public:
  virtual ~SnapshotSource() = default;

  virtual ReferenceData LoadReference() = 0;

  // Ordered by (year, month).
  virtual std::vector<model::Period> ListPeriods() = 0;

  virtual std::optional<model::Period> FindPeriod(const model::PeriodId& id) = 0;

  // Throws util::NotFound for an unknown period.
  virtual PeriodInputs LoadPeriod(const model::PeriodId& id) = 0;
};

} // namespace normbalance::db
