#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/utility.hpp"

namespace normbalance::model {

enum class NormType : std::uint8_t {
  kDistribution = 1,
  kConversion = 2,
};

constexpr std::string_view ToString(NormType type) {
  return type == NormType::kDistribution ? "DISTRIBUTION" : "CONVERSION";
}

inline std::optional<NormType> ParseNormType(std::string_view value) {
  if (value == "DISTRIBUTION") return NormType::kDistribution;
  if (value == "CONVERSION") return NormType::kConversion;
  return std::nullopt;
}

// Known, signed factor. Negative on a CONVERSION edge means a by-product credit.
struct FixedFactor {
  double value = 0.0;
};

// Null DISTRIBUTION factor: share = 1 - sum(known factors of the same consumer).
struct ResidualFactor {};

// CONVERSION contribution computed by a named formula from the consumer's quantity.
struct FormulaFactor {
  std::string formula;
  std::string asset_id;

  // Plain factor applied when the asset has no coefficients for the period.
  std::optional<double> fallback;
};

using NormFactor = std::variant<FixedFactor, ResidualFactor, FormulaFactor>;

/*
  Directed norm: consumer requires (or is distributed over) supplier.
*/
struct NormEdge {
  std::string id;
  UtilityId   consumer;
  UtilityId   supplier;
  std::string account_type_id;
  NormType    type = NormType::kConversion;
  NormFactor  factor = FixedFactor{};
  std::string description;
  bool        active = true;
};

} // namespace normbalance::model
