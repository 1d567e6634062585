#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace normbalance::model {

using UtilityId = std::string;

enum class UtilityType : std::uint8_t {
  kOther = 0,
  kSteam = 1,
  kPower = 2,
  kWater = 3,
  kGas = 4,
  kRawMaterial = 5,
  kChemical = 6,
  kByProduct = 7,
};

constexpr std::string_view ToString(UtilityType type) {
  switch (type) {
    case UtilityType::kSteam:
      return "STEAM";
    case UtilityType::kPower:
      return "POWER";
    case UtilityType::kWater:
      return "WATER";
    case UtilityType::kGas:
      return "GAS";
    case UtilityType::kRawMaterial:
      return "RAW_MATERIAL";
    case UtilityType::kChemical:
      return "CHEMICAL";
    case UtilityType::kByProduct:
      return "BY_PRODUCT";
    case UtilityType::kOther:
    default:
      return "OTHER";
  }
}

inline std::optional<UtilityType> ParseUtilityType(std::string_view value) {
  for (auto type : {UtilityType::kSteam, UtilityType::kPower, UtilityType::kWater, UtilityType::kGas, UtilityType::kRawMaterial,
                    UtilityType::kChemical, UtilityType::kByProduct, UtilityType::kOther}) {
    if (ToString(type) == value) {
      return type;
    }
  }
  return std::nullopt;
}

/*
  Reference data row from UtilityMaster.

  Immutable for the duration of a resolution.
*/
struct Utility {
  UtilityId   id;
  std::string code;
  std::string name;
  std::string uom;
  std::string plant_id;
  UtilityType type = UtilityType::kOther;

  // Demand-side aggregation node (e.g. "LP Steam_Dis")
  bool is_distribution = false;
};

} // namespace normbalance::model
