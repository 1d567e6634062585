#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/period_inputs.hpp"

namespace normbalance::formula {

// (resolved generation quantity, period coefficients of the asset) -> supplier requirement
using FormulaFn = std::function<double(double, const model::AssetCoefficients&)>;

/*
  Registry of named physical formulas.

  Formulas must be pure. The registry is filled before a resolution starts and
  only read afterwards, so one instance can be shared across concurrent
  resolutions.
*/
class FormulaEvaluator {
 public:
  // Registry with the built-in formulas (gas_turbine_net_fuel).
  static FormulaEvaluator WithBuiltins();

  // Throws util::InvalidArgument on an empty or duplicate name.
  void Register(const std::string& name, FormulaFn fn);

  bool Has(std::string_view name) const;

  // Throws util::NotFound for an unknown formula.
  double Evaluate(std::string_view name, double generation, const model::AssetCoefficients& coefficients) const;

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, FormulaFn, std::less<>> formulas_;
};

} // namespace normbalance::formula
