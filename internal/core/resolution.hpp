#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/norm_edge.hpp"
#include "internal/model/period_inputs.hpp"

namespace normbalance::core {

enum class DiagnosticKind : std::uint8_t {
  kMissingAvailability = 1,
  kNegativeRequirement = 2,
  kMissingCoefficients = 3,
  kBelowMinimumLoad    = 4,
  kZeroResidualShare   = 5,
};

constexpr std::string_view ToString(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::kMissingAvailability:
      return "MISSING_AVAILABILITY";
    case DiagnosticKind::kNegativeRequirement:
      return "NEGATIVE_REQUIREMENT";
    case DiagnosticKind::kMissingCoefficients:
      return "MISSING_COEFFICIENTS";
    case DiagnosticKind::kBelowMinimumLoad:
      return "BELOW_MINIMUM_LOAD";
    case DiagnosticKind::kZeroResidualShare:
      return "ZERO_RESIDUAL_SHARE";
    default:
      return "UNKNOWN";
  }
}

// Warning attached to a successful resolution.
struct Diagnostic {
  DiagnosticKind   kind = DiagnosticKind::kMissingAvailability;
  model::UtilityId utility_id;
  model::AssetId   asset_id;
  std::string      message;
  double           value = 0.0;
};

// Supplier quantity induced by one edge in the final pass.
struct EdgeFlow {
  model::UtilityId consumer;
  model::UtilityId supplier;
  model::NormType  type = model::NormType::kConversion;

  // Negative for credits.
  double quantity = 0.0;

  // Formula name for formula-driven edges evaluated with coefficients.
  std::string formula;
};

struct SolverOptions {
  // Converged when every utility moves less than this between passes.
  double tolerance = 1e-6;

  std::uint32_t max_iterations = 500;

  bool allow_negative_carry = false;
  bool check_capacity       = true;
};

struct Resolution {
  model::PeriodId         period;
  model::QuantityMap      quantities;
  std::vector<EdgeFlow>   flows;
  std::vector<Diagnostic> warnings;

  std::uint32_t iterations = 0;
  double        max_delta  = 0.0;
};

} // namespace normbalance::core
