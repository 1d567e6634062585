#include "formula_evaluator.hpp"

#include "internal/formula/gas_turbine.hpp"
#include "internal/util/errors.hpp"

namespace normbalance::formula {

FormulaEvaluator FormulaEvaluator::WithBuiltins() {
  FormulaEvaluator evaluator;
  evaluator.Register(kGasTurbineNetFuel, [](double kwh, const model::AssetCoefficients& coefficients) {
    return GasTurbineNetFuel(kwh, coefficients).net_mmbtu;
  });
  return evaluator;
}

void FormulaEvaluator::Register(const std::string& name, FormulaFn fn) {
  if (name.empty()) {
    throw util::InvalidArgument("formula name must not be empty");
  }
  if (!fn) {
    throw util::InvalidArgument("formula " + name + " has no function");
  }
  if (!formulas_.emplace(name, std::move(fn)).second) {
    throw util::InvalidArgument("formula already registered: " + name);
  }
}

bool FormulaEvaluator::Has(std::string_view name) const {
  return formulas_.find(name) != formulas_.end();
}

double FormulaEvaluator::Evaluate(std::string_view name, double generation, const model::AssetCoefficients& coefficients) const {
  auto it = formulas_.find(name);
  if (it == formulas_.end()) {
    throw util::NotFound("unknown formula: " + std::string(name));
  }
  return it->second(generation, coefficients);
}

std::vector<std::string> FormulaEvaluator::Names() const {
  std::vector<std::string> names;
  names.reserve(formulas_.size());
  for (const auto& [name, fn] : formulas_) {
    names.push_back(name);
  }
  return names;
}

} // namespace normbalance::formula
