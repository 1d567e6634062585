#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/assets.hpp"

namespace normbalance::availability {

constexpr double kDefaultMonthlyHours = 720.0;

struct AvailabilitySnapshot {
  std::vector<model::SteamAsset>       steam_assets;
  std::vector<model::PowerAsset>       power_assets;
  std::vector<model::UtilityAssetLink> links;

  // Records of one period only.
  std::vector<model::AvailabilityRecord> records;

  double default_hours = kDefaultMonthlyHours;
};

struct AssetStatus {
  bool   available         = false;
  double operational_hours = 0.0;

  // False when no availability record covered the asset for the period.
  bool has_record = false;
};

/*
  Read-only, per-period asset availability.

  - Power assets take their record as-is.
  - HRSGs (steam assets linked to a power asset) mirror the linked record.
  - Always-available assets (STG, PRDS) report available with the default
    hours unless a record for the asset itself overrides the hours.
  - Anything without a record is unavailable and flagged as missing.

  Utilities without an asset link are not asset-backed and always available.
*/
class AvailabilityView {
 public:
  AvailabilityView() = default;

  // Throws util::ValidationError on duplicate assets or links to unknown assets.
  explicit AvailabilityView(AvailabilitySnapshot snapshot);

  bool   IsAvailable(std::string_view asset_id) const;
  double OperationalHours(std::string_view asset_id) const;
  bool   HasRecord(std::string_view asset_id) const;

  // Unknown assets report unavailable without a record.
  AssetStatus StatusOf(std::string_view asset_id) const;

  std::optional<model::AssetId> AssetForUtility(std::string_view utility_id) const;

  // nullptr when the utility is not backed by a steam asset.
  const model::SteamAsset* SteamAssetFor(std::string_view utility_id) const;

  const std::vector<model::UtilityAssetLink>& Links() const {
    return links_;
  }

 private:
  std::map<model::AssetId, AssetStatus, std::less<>>        status_;
  std::map<model::AssetId, model::SteamAsset, std::less<>>  steam_assets_;
  std::map<model::UtilityId, model::AssetId, std::less<>>   by_utility_;
  std::vector<model::UtilityAssetLink>                      links_;
};

} // namespace normbalance::availability
