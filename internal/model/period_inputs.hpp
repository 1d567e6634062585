#pragma once

#include <map>
#include <string>

#include "internal/model/assets.hpp"
#include "internal/model/utility.hpp"

namespace normbalance::model {

// FinancialYearMonthId
using PeriodId = std::string;

struct Period {
  PeriodId    id;
  int         month = 0;
  int         year = 0;
  std::string label;
};

struct DemandRecord {
  double process = 0.0;
  double fixed = 0.0;

  double Total() const {
    return process + fixed;
  }
};

// Per-period, per-asset formula inputs.
struct AssetCoefficients {
  double heat_rate = 0.0;         // kcal/kWh
  double free_steam_factor = 0.0;
};

using DemandMap = std::map<UtilityId, DemandRecord>;
using CoefficientMap = std::map<AssetId, AssetCoefficients>;

// Reference quantity per utility, used only for reporting deviation.
using BenchmarkMap = std::map<UtilityId, double>;

using QuantityMap = std::map<UtilityId, double>;

} // namespace normbalance::model
