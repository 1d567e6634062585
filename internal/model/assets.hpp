#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/utility.hpp"

namespace normbalance::model {

using AssetId = std::string;

enum class AssetType : std::uint8_t {
  kHrsg = 1,
  kStg = 2,
  kPrds = 3,
};

constexpr std::string_view ToString(AssetType type) {
  switch (type) {
    case AssetType::kHrsg:
      return "HRSG";
    case AssetType::kStg:
      return "STG";
    case AssetType::kPrds:
    default:
      return "PRDS";
  }
}

inline std::optional<AssetType> ParseAssetType(std::string_view value) {
  if (value == "HRSG") return AssetType::kHrsg;
  if (value == "STG") return AssetType::kStg;
  if (value == "PRDS") return AssetType::kPrds;
  return std::nullopt;
}

/*
  Steam generation unit (SteamGenerationAssets row).

  Capacities are MT per operating hour.
*/
struct SteamAsset {
  AssetId     id;
  std::string name;
  AssetType   type = AssetType::kPrds;
  std::string steam_type;
  double      min_capacity = 0.0;
  double      max_capacity = 0.0;
  double      efficiency = 1.0;

  // HRSG availability mirrors this power asset
  std::optional<AssetId> linked_power_asset;

  bool is_always_available = false;

  // Dispatch order among otherwise-equal suppliers. Not used for share weighting.
  int priority = 1;
};

// Power generation unit (gas turbine); availability comes from AssetAvailability.
struct PowerAsset {
  AssetId     id;
  std::string name;
};

// Utility whose supply is produced by a physical asset.
struct UtilityAssetLink {
  UtilityId utility_id;
  AssetId   asset_id;
};

struct AvailabilityRecord {
  AssetId asset_id;
  bool    available = false;
  double  operational_hours = 0.0;
};

} // namespace normbalance::model
