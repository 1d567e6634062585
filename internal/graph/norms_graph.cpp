#include "norms_graph.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

#include "internal/formula/formula_evaluator.hpp"
#include "internal/util/errors.hpp"

namespace normbalance::graph {

using model::NormType;

namespace {

std::string Describe(const model::NormEdge& edge) {
  std::ostringstream out;
  out << ToString(edge.type) << " norm";
  if (!edge.id.empty()) {
    out << " " << edge.id;
  }
  out << " (" << edge.consumer << " -> " << edge.supplier << ")";
  return out.str();
}

} // namespace

NormsGraph::NormsGraph(NormsSnapshot snapshot, ValidationOptions options)
    : options_(options), utilities_(std::move(snapshot.utilities)) {
  std::vector<std::string> issues;

  Index(issues);
  Link(snapshot.norms, issues);
  DeriveShares(options_.distribution_epsilon, issues);

  // fail fast: nothing may solve on an inconsistent graph
  if (!issues.empty()) {
    throw util::ValidationError(std::move(issues));
  }
}

std::optional<NodeIndex> NormsGraph::IndexOf(std::string_view id) const {
  auto it = by_id_.find(std::string(id));
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

NodeIndex NormsGraph::RequireIndex(std::string_view id) const {
  auto index = IndexOf(id);
  if (!index) {
    throw util::NotFound("unknown utility: " + std::string(id));
  }
  return *index;
}

void NormsGraph::Index(std::vector<std::string>& issues) {
  by_id_.reserve(utilities_.size());
  for (std::size_t i = 0; i < utilities_.size(); ++i) {
    const auto& utility = utilities_[i];
    if (utility.id.empty()) {
      issues.push_back("utility '" + utility.name + "' has an empty id");
      continue;
    }
    if (!by_id_.emplace(utility.id, static_cast<NodeIndex>(i)).second) {
      issues.push_back("duplicate utility id " + utility.id);
    }
  }

  suppliers_.assign(utilities_.size(), {});
  has_distribution_.assign(utilities_.size(), false);
  formula_driven_.assign(utilities_.size(), false);
}

void NormsGraph::Link(const std::vector<model::NormEdge>& norms, std::vector<std::string>& issues) {
  edges_.reserve(norms.size());

  for (const auto& edge : norms) {
    if (!edge.active) {
      continue;
    }

    auto consumer = IndexOf(edge.consumer);
    auto supplier = IndexOf(edge.supplier);
    if (!consumer) {
      issues.push_back(Describe(edge) + " references unknown consumer utility " + edge.consumer);
    }
    if (!supplier) {
      issues.push_back(Describe(edge) + " references unknown supplier utility " + edge.supplier);
    }
    if (!consumer || !supplier) {
      continue;
    }

    bool valid = std::visit(
        [&](const auto& factor) {
          using T = std::decay_t<decltype(factor)>;
          if (edge.type == NormType::kDistribution) {
            if (*consumer == *supplier) {
              issues.push_back(Describe(edge) + " distributes a utility onto itself");
              return false;
            }
            if constexpr (std::is_same_v<T, model::FormulaFactor>) {
              issues.push_back(Describe(edge) + " cannot be formula-driven");
              return false;
            } else if constexpr (std::is_same_v<T, model::FixedFactor>) {
              if (factor.value < 0.0 || !std::isfinite(factor.value)) {
                issues.push_back(Describe(edge) + " has invalid share " + std::to_string(factor.value));
                return false;
              }
            }
            return true;
          }

          if constexpr (std::is_same_v<T, model::ResidualFactor>) {
            issues.push_back(Describe(edge) + " has no factor");
            return false;
          } else if constexpr (std::is_same_v<T, model::FormulaFactor>) {
            if (factor.formula.empty() || factor.asset_id.empty()) {
              issues.push_back(Describe(edge) + " formula binding needs a formula name and an asset");
              return false;
            }
            if (options_.formulas && !options_.formulas->Has(factor.formula)) {
              issues.push_back(Describe(edge) + " names unknown formula " + factor.formula);
              return false;
            }
          } else {
            if (!std::isfinite(factor.value)) {
              issues.push_back(Describe(edge) + " has a non-finite factor");
              return false;
            }
          }
          return true;
        },
        edge.factor);

    if (!valid) {
      continue;
    }

    edges_.push_back(edge);

    SupplierRef ref;
    ref.supplier = *supplier;
    ref.type     = edge.type;
    ref.edge     = edges_.size() - 1;
    suppliers_[*consumer].push_back(ref);

    if (edge.type == NormType::kDistribution) {
      has_distribution_[*consumer] = true;
    }
  }

  // Pointers are taken once edges_ no longer grows.
  for (auto& refs : suppliers_) {
    for (auto& ref : refs) {
      const auto& edge = edges_[ref.edge];
      if (const auto* fixed = std::get_if<model::FixedFactor>(&edge.factor)) {
        ref.share = fixed->value;
      } else if (const auto* formula = std::get_if<model::FormulaFactor>(&edge.factor)) {
        ref.formula = formula;
        ref.share   = formula->fallback.value_or(0.0);
      }
    }
  }
}

void NormsGraph::DeriveShares(double epsilon, std::vector<std::string>& issues) {
  for (NodeIndex consumer = 0; consumer < suppliers_.size(); ++consumer) {
    auto& refs = suppliers_[consumer];

    double       known = 0.0;
    SupplierRef* residual = nullptr;
    int          residual_count = 0;

    for (auto& ref : refs) {
      if (ref.formula) {
        formula_driven_[consumer] = true;
      }
      if (ref.type != NormType::kDistribution) {
        continue;
      }
      if (std::holds_alternative<model::ResidualFactor>(edges_[ref.edge].factor)) {
        ++residual_count;
        if (!residual) {
          residual = &ref;
        }
        continue;
      }
      known += ref.share;
    }

    if (!has_distribution_[consumer]) {
      continue;
    }

    const auto& id = utilities_[consumer].id;
    if (residual_count > 1) {
      issues.push_back("distribution utility " + id + " has " + std::to_string(residual_count) + " null factors, at most one is allowed");
      continue;
    }
    if (known > 1.0 + epsilon) {
      issues.push_back("distribution factors of " + id + " sum to " + std::to_string(known) + ", above 1");
      continue;
    }
    if (!residual) {
      if (std::fabs(known - 1.0) > epsilon) {
        issues.push_back("distribution factors of " + id + " sum to " + std::to_string(known) + ", expected 1");
      }
      continue;
    }

    residual->share = known >= 1.0 ? 0.0 : 1.0 - known;
    if (residual->share <= epsilon) {
      residual->share = 0.0;
      zero_residuals_.push_back({consumer, residual->supplier});
    }
  }
}

} // namespace normbalance::graph
