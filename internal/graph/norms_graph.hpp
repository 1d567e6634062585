#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/norm_edge.hpp"
#include "internal/model/utility.hpp"

namespace normbalance::formula {
class FormulaEvaluator;
}

namespace normbalance::graph {

// Opaque arena index of a utility inside one NormsGraph.
using NodeIndex = std::uint32_t;

struct NormsSnapshot {
  std::vector<model::Utility>  utilities;
  std::vector<model::NormEdge> norms;
};

struct ValidationOptions {
  // Tolerance on DISTRIBUTION factor sums.
  double distribution_epsilon = 1e-6;

  // When set, formula factors must name a registered formula.
  const formula::FormulaEvaluator* formulas = nullptr;
};

struct SupplierRef {
  NodeIndex       supplier = 0;
  model::NormType type     = model::NormType::kConversion;

  // Index into NormsGraph::Edges()
  std::size_t edge = 0;

  /*
    DISTRIBUTION: share of the consumer's quantity, residual already derived.
    CONVERSION:   plain factor (the fallback factor for formula edges, 0 if none).
  */
  double share = 0.0;

  bool IsFormula() const {
    return formula != nullptr;
  }

  // Set for formula-driven CONVERSION edges; points into the owning graph.
  const model::FormulaFactor* formula = nullptr;
};

// A residual DISTRIBUTION factor that derived to zero.
struct ZeroResidual {
  NodeIndex consumer = 0;
  NodeIndex supplier = 0;
};

/*
  Immutable arena of utilities and active norm edges.

  Utilities are addressed by dense NodeIndex values; edges refer to indices,
  so back-edges and cycles need no ownership between nodes. The constructor
  validates the whole graph and throws util::ValidationError listing every
  problem before any caller can solve on it.
*/
class NormsGraph {
 public:
  explicit NormsGraph(NormsSnapshot snapshot, ValidationOptions options = {});

  NormsGraph(const NormsGraph&)            = delete;
  NormsGraph& operator=(const NormsGraph&) = delete;
  NormsGraph(NormsGraph&&)                 = default;
  NormsGraph& operator=(NormsGraph&&)      = default;

  std::size_t Size() const {
    return utilities_.size();
  }

  const model::Utility& UtilityAt(NodeIndex index) const {
    return utilities_[index];
  }

  const std::vector<model::Utility>& Utilities() const {
    return utilities_;
  }

  std::optional<NodeIndex> IndexOf(std::string_view id) const;

  // Throws util::NotFound.
  NodeIndex RequireIndex(std::string_view id) const;

  // Active suppliers in source insertion order.
  const std::vector<SupplierRef>& SuppliersOf(NodeIndex consumer) const {
    return suppliers_[consumer];
  }

  bool HasDistribution(NodeIndex consumer) const {
    return has_distribution_[consumer];
  }

  // Consumer has at least one formula-driven CONVERSION edge.
  bool IsFormulaDriven(NodeIndex consumer) const {
    return formula_driven_[consumer];
  }

  // Active edges in source order.
  const std::vector<model::NormEdge>& Edges() const {
    return edges_;
  }

  const std::vector<ZeroResidual>& ZeroResiduals() const {
    return zero_residuals_;
  }

 private:
  void Index(std::vector<std::string>& issues);
  void Link(const std::vector<model::NormEdge>& norms, std::vector<std::string>& issues);
  void DeriveShares(double epsilon, std::vector<std::string>& issues);

  ValidationOptions options_;

  std::vector<model::Utility>                utilities_;
  std::unordered_map<std::string, NodeIndex> by_id_;

  std::vector<model::NormEdge>           edges_;
  std::vector<std::vector<SupplierRef>>  suppliers_;
  std::vector<bool>                      has_distribution_;
  std::vector<bool>                      formula_driven_;
  std::vector<ZeroResidual>              zero_residuals_;
};

} // namespace normbalance::graph
