#pragma once

#include <memory>

#include "internal/core/resolution.hpp"
#include "internal/formula/formula_evaluator.hpp"

namespace normbalance::db { class SnapshotSource; }

namespace normbalance::service {

/*
  Dependency container for ResolutionService.
*/
struct ServiceContext {
  std::shared_ptr<normbalance::db::SnapshotSource> source;
  std::shared_ptr<const normbalance::formula::FormulaEvaluator> formulas;

  core::SolverOptions solver;
  double distribution_epsilon = 1e-6;
  double default_hours = 720.0;
};

}
