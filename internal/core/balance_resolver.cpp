#include "balance_resolver.hpp"

#include <cmath>
#include <set>
#include <utility>
#include <variant>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace normbalance::core {

using graph::NodeIndex;
using model::NormType;

namespace {

model::QuantityMap ToQuantityMap(const graph::NormsGraph& graph, const std::vector<double>& values) {
  model::QuantityMap quantities;
  for (NodeIndex i = 0; i < values.size(); ++i) {
    quantities.emplace(graph.UtilityAt(i).id, values[i]);
  }
  return quantities;
}

/*
  One propagation pass over the whole graph.

  Everything that does not change between passes (seed, supplier
  availability, coefficient lookups) is fixed at construction.
*/
class Propagation {
 public:
  Propagation(const graph::NormsGraph& graph, const formula::FormulaEvaluator& formulas, std::vector<double> seed,
              std::vector<bool> available, std::vector<const model::AssetCoefficients*> coefficients)
      : graph_(graph),
        formulas_(formulas),
        seed_(std::move(seed)),
        available_(std::move(available)),
        coefficients_(std::move(coefficients)) {
  }

  const std::vector<double>& Seed() const {
    return seed_;
  }

  /*
    gross  = seed + sum of positive contributions from consumers in `q`
    credit = sum of |negative contributions|
  */
  void Run(const std::vector<double>& q, std::uint32_t iteration, std::vector<double>& gross, std::vector<double>& credit,
           std::vector<EdgeFlow>* flows) const {
    gross = seed_;
    credit.assign(q.size(), 0.0);

    for (NodeIndex consumer = 0; consumer < q.size(); ++consumer) {
      const double quantity = q[consumer];
      if (!(quantity > 0.0)) {
        continue;
      }

      const auto& refs = graph_.SuppliersOf(consumer);

      // Unavailable suppliers drop out; the rest are renormalised by their stated shares.
      double available_share = 0.0;
      if (graph_.HasDistribution(consumer)) {
        for (const auto& ref : refs) {
          if (ref.type == NormType::kDistribution && available_[ref.supplier]) {
            available_share += ref.share;
          }
        }
        if (!(available_share > 0.0)) {
          throw util::SupplyUnavailable(graph_.UtilityAt(consumer).id, ToQuantityMap(graph_, q), iteration);
        }
      }

      for (const auto& ref : refs) {
        double      contribution = 0.0;
        std::string formula;

        if (ref.type == NormType::kDistribution) {
          if (!available_[ref.supplier]) {
            continue;
          }
          contribution = quantity * (ref.share / available_share);
        } else if (ref.IsFormula() && coefficients_[ref.edge]) {
          contribution = formulas_.Evaluate(ref.formula->formula, quantity, *coefficients_[ref.edge]);
          formula      = ref.formula->formula;
        } else {
          contribution = ref.share * quantity;
        }

        if (contribution >= 0.0) {
          gross[ref.supplier] += contribution;
        } else {
          credit[ref.supplier] -= contribution;
        }

        if (flows) {
          flows->push_back({graph_.UtilityAt(consumer).id, graph_.UtilityAt(ref.supplier).id, ref.type, contribution, std::move(formula)});
        }
      }
    }
  }

 private:
  const graph::NormsGraph&                        graph_;
  const formula::FormulaEvaluator&                formulas_;
  std::vector<double>                             seed_;
  std::vector<bool>                               available_;
  std::vector<const model::AssetCoefficients*>    coefficients_;
};

} // namespace

BalanceResolver::BalanceResolver(const graph::NormsGraph& graph, const availability::AvailabilityView& availability,
                                 const formula::FormulaEvaluator& formulas, SolverOptions options)
    : graph_(graph), availability_(availability), formulas_(formulas), options_(options) {
}

Resolution BalanceResolver::Resolve(const model::DemandMap& demand, const model::CoefficientMap& coefficients,
                                    const model::PeriodId& period) const {
  const std::size_t        n = graph_.Size();
  std::vector<std::string> issues;
  std::vector<Diagnostic>  warnings;

  if (!(options_.tolerance > 0.0) || options_.max_iterations == 0) {
    throw util::InvalidArgument("solver needs a positive tolerance and iteration cap");
  }

  // ------------------------------------------------------------
  // Seed demand
  // ------------------------------------------------------------

  std::vector<double> seed(n, 0.0);
  for (const auto& [utility_id, record] : demand) {
    auto index = graph_.IndexOf(utility_id);
    if (!index) {
      issues.push_back("demand references unknown utility " + utility_id);
      continue;
    }
    const double total = record.Total();
    if (!std::isfinite(total) || record.process < 0.0 || record.fixed < 0.0) {
      issues.push_back("demand for " + utility_id + " must be finite and non-negative");
      continue;
    }
    seed[*index] = total;
  }

  // ------------------------------------------------------------
  // Supplier availability
  // ------------------------------------------------------------

  std::vector<bool>     available(n, true);
  std::set<NodeIndex>   reported;
  for (NodeIndex i = 0; i < n; ++i) {
    if (auto asset = availability_.AssetForUtility(graph_.UtilityAt(i).id)) {
      available[i] = availability_.IsAvailable(*asset);
    }
  }

  for (NodeIndex consumer = 0; consumer < n; ++consumer) {
    for (const auto& ref : graph_.SuppliersOf(consumer)) {
      if (ref.type != NormType::kDistribution || reported.count(ref.supplier)) {
        continue;
      }
      const auto& supplier = graph_.UtilityAt(ref.supplier);
      auto        asset    = availability_.AssetForUtility(supplier.id);
      if (asset && !availability_.HasRecord(*asset)) {
        reported.insert(ref.supplier);
        warnings.push_back({DiagnosticKind::kMissingAvailability, supplier.id, *asset,
                            "no availability record for asset " + *asset + " in period " + period + "; treated as unavailable", 0.0});
      }
    }
  }

  for (const auto& zero : graph_.ZeroResiduals()) {
    const auto& consumer = graph_.UtilityAt(zero.consumer);
    const auto& supplier = graph_.UtilityAt(zero.supplier);
    warnings.push_back({DiagnosticKind::kZeroResidualShare, supplier.id, {},
                        "null share of " + supplier.id + " in " + consumer.id + " derives to zero; known shares already sum to 1", 0.0});
  }

  // ------------------------------------------------------------
  // Formula coefficients
  // ------------------------------------------------------------

  const auto&                                  edges = graph_.Edges();
  std::vector<const model::AssetCoefficients*> edge_coefficients(edges.size(), nullptr);
  for (std::size_t e = 0; e < edges.size(); ++e) {
    const auto* factor = std::get_if<model::FormulaFactor>(&edges[e].factor);
    if (!factor) {
      continue;
    }
    if (!formulas_.Has(factor->formula)) {
      issues.push_back("norm " + edges[e].consumer + " -> " + edges[e].supplier + " names unknown formula " + factor->formula);
      continue;
    }
    if (auto it = coefficients.find(factor->asset_id); it != coefficients.end()) {
      edge_coefficients[e] = &it->second;
    } else if (factor->fallback) {
      warnings.push_back({DiagnosticKind::kMissingCoefficients, edges[e].consumer, factor->asset_id,
                          "no coefficients for asset " + factor->asset_id + " in period " + period + "; using plain factor", *factor->fallback});
    } else {
      issues.push_back("no coefficients for asset " + factor->asset_id + " and no fallback factor on norm " + edges[e].consumer + " -> " +
                       edges[e].supplier);
    }
  }

  if (!issues.empty()) {
    throw util::ValidationError(std::move(issues));
  }

  // ------------------------------------------------------------
  // Fixed-point iteration
  // ------------------------------------------------------------

  Propagation propagation(graph_, formulas_, seed, std::move(available), std::move(edge_coefficients));

  std::vector<double> q = seed;
  std::vector<double> gross;
  std::vector<double> credit;
  std::vector<double> next(n, 0.0);
  std::vector<double> net(n, 0.0);

  std::uint32_t iteration = 0;
  double        max_delta = 0.0;
  NodeIndex     max_delta_node = 0;
  bool          converged = false;

  while (iteration < options_.max_iterations) {
    ++iteration;
    propagation.Run(q, iteration, gross, credit, nullptr);

    max_delta      = 0.0;
    max_delta_node = 0;
    for (NodeIndex u = 0; u < n; ++u) {
      net[u]  = gross[u] - credit[u];
      next[u] = (net[u] < 0.0 && !options_.allow_negative_carry) ? 0.0 : net[u];

      if (!std::isfinite(next[u])) {
        throw util::ConvergenceError(ToQuantityMap(graph_, q), graph_.UtilityAt(u).id, std::fabs(next[u]), iteration);
      }

      const double delta = std::fabs(next[u] - q[u]);
      if (delta > max_delta) {
        max_delta      = delta;
        max_delta_node = u;
      }
    }

    q.swap(next);
    if (max_delta < options_.tolerance) {
      converged = true;
      break;
    }
  }

  if (!converged) {
    throw util::ConvergenceError(ToQuantityMap(graph_, q), n ? graph_.UtilityAt(max_delta_node).id : model::UtilityId{}, max_delta, iteration);
  }

  for (NodeIndex u = 0; u < n; ++u) {
    if (net[u] < -options_.tolerance) {
      const auto& id = graph_.UtilityAt(u).id;
      warnings.push_back({DiagnosticKind::kNegativeRequirement, id, {},
                          options_.allow_negative_carry ? "credits exceed gross demand; negative requirement carried"
                                                        : "credits exceed gross demand; requirement clamped to zero",
                          net[u]});
    }
  }

  if (options_.check_capacity) {
    CheckCapacity(q, iteration, warnings);
  }

  Resolution resolution;
  resolution.period     = period;
  resolution.iterations = iteration;
  resolution.max_delta  = max_delta;

  // Flows are re-derived from the converged vector so they add up to it.
  propagation.Run(q, iteration, gross, credit, &resolution.flows);

  resolution.quantities = ToQuantityMap(graph_, q);
  resolution.warnings   = std::move(warnings);
  return resolution;
}

void BalanceResolver::CheckCapacity(const std::vector<double>& quantities, std::uint32_t iterations,
                                    std::vector<Diagnostic>& warnings) const {
  std::vector<util::CapacityShortfall> shortfalls;

  for (NodeIndex u = 0; u < quantities.size(); ++u) {
    const auto& utility = graph_.UtilityAt(u);
    const auto* asset   = availability_.SteamAssetFor(utility.id);
    if (!asset) {
      continue;
    }

    const auto   status   = availability_.StatusOf(asset->id);
    const double hours    = status.available ? status.operational_hours : 0.0;
    const double capacity = asset->max_capacity * hours;
    const double quantity = quantities[u];

    if (quantity - capacity > options_.tolerance) {
      shortfalls.push_back({asset->id, utility.id, quantity, capacity});
      continue;
    }

    const double minimum = asset->min_capacity * hours;
    if (status.available && quantity > 0.0 && quantity < minimum) {
      warnings.push_back({DiagnosticKind::kBelowMinimumLoad, utility.id, asset->id,
                          "asset " + asset->name + " loaded below its minimum of " + std::to_string(minimum), quantity});
    }
  }

  if (!shortfalls.empty()) {
    throw util::CapacityExceeded(std::move(shortfalls), ToQuantityMap(graph_, quantities), iterations, warnings);
  }
}

} // namespace normbalance::core
