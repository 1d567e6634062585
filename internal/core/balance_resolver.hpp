#pragma once

#include "internal/availability/availability_view.hpp"
#include "internal/core/resolution.hpp"
#include "internal/formula/formula_evaluator.hpp"
#include "internal/graph/norms_graph.hpp"
#include "internal/model/period_inputs.hpp"

namespace normbalance::core {

/*
  Resolves top-level demand into per-utility required quantities.

  The norms graph is cyclic, so quantities are found by fixed-point
  iteration: each pass pushes the previous pass's quantities through every
  DISTRIBUTION and CONVERSION edge, credits (negative factors) are netted
  against gross demand, and passes repeat until no utility moves by more than
  the tolerance.

  Resolve() is a pure function of the constructor arguments and its own
  parameters. Collaborators are borrowed and must outlive the call; they are
  only read, so one resolver may serve concurrent calls.

  Errors (all util::ResolutionError):
    ValidationError    bad demand or formula inputs, before any pass
    SupplyUnavailable  a distribution node lost every supplier
    ConvergenceError   iteration cap hit; carries the last vector
    CapacityExceeded   a steam asset is above max capacity x hours
*/
class BalanceResolver {
 public:
  BalanceResolver(const graph::NormsGraph& graph, const availability::AvailabilityView& availability,
                  const formula::FormulaEvaluator& formulas, SolverOptions options = {});

  Resolution Resolve(const model::DemandMap& demand, const model::CoefficientMap& coefficients, const model::PeriodId& period) const;

 private:
  void CheckCapacity(const std::vector<double>& quantities, std::uint32_t iterations, std::vector<Diagnostic>& warnings) const;

  const graph::NormsGraph&               graph_;
  const availability::AvailabilityView& availability_;
  const formula::FormulaEvaluator&       formulas_;
  SolverOptions                          options_;
};

} // namespace normbalance::core
