#include "availability_view.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace normbalance::availability {

AvailabilityView::AvailabilityView(AvailabilitySnapshot snapshot) : links_(std::move(snapshot.links)) {
  std::vector<std::string> issues;

  std::map<model::AssetId, model::AvailabilityRecord, std::less<>> records;
  for (auto& record : snapshot.records) {
    records[record.asset_id] = record;
  }

  std::set<model::AssetId, std::less<>> power_ids;
  for (const auto& power : snapshot.power_assets) {
    if (!power_ids.insert(power.id).second) {
      issues.push_back("duplicate power asset " + power.id);
      continue;
    }

    AssetStatus status;
    if (auto it = records.find(power.id); it != records.end()) {
      status.available         = it->second.available;
      status.operational_hours = it->second.operational_hours;
      status.has_record        = true;
    }
    status_[power.id] = status;
  }

  for (auto& steam : snapshot.steam_assets) {
    if (power_ids.count(steam.id) || steam_assets_.count(steam.id)) {
      issues.push_back("duplicate asset " + steam.id);
      continue;
    }

    AssetStatus status;
    auto        own = records.find(steam.id);
    if (steam.is_always_available) {
      status.available         = true;
      status.operational_hours = own != records.end() ? own->second.operational_hours : snapshot.default_hours;
      status.has_record        = true;
    } else if (steam.linked_power_asset) {
      if (!power_ids.count(*steam.linked_power_asset)) {
        issues.push_back("steam asset " + steam.id + " links unknown power asset " + *steam.linked_power_asset);
        continue;
      }
      status = status_[*steam.linked_power_asset];
    } else if (own != records.end()) {
      status.available         = own->second.available;
      status.operational_hours = own->second.operational_hours;
      status.has_record        = true;
    }

    status_[steam.id] = status;
    steam_assets_.emplace(steam.id, std::move(steam));
  }

  for (const auto& link : links_) {
    if (!status_.count(link.asset_id)) {
      issues.push_back("utility " + link.utility_id + " links unknown asset " + link.asset_id);
      continue;
    }
    if (!by_utility_.emplace(link.utility_id, link.asset_id).second) {
      issues.push_back("utility " + link.utility_id + " is linked to more than one asset");
    }
  }

  if (!issues.empty()) {
    throw util::ValidationError(std::move(issues));
  }
}

AssetStatus AvailabilityView::StatusOf(std::string_view asset_id) const {
  auto it = status_.find(asset_id);
  if (it == status_.end()) {
    return {};
  }
  return it->second;
}

bool AvailabilityView::IsAvailable(std::string_view asset_id) const {
  return StatusOf(asset_id).available;
}

double AvailabilityView::OperationalHours(std::string_view asset_id) const {
  return StatusOf(asset_id).operational_hours;
}

bool AvailabilityView::HasRecord(std::string_view asset_id) const {
  return StatusOf(asset_id).has_record;
}

std::optional<model::AssetId> AvailabilityView::AssetForUtility(std::string_view utility_id) const {
  auto it = by_utility_.find(utility_id);
  if (it == by_utility_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const model::SteamAsset* AvailabilityView::SteamAssetFor(std::string_view utility_id) const {
  auto asset = by_utility_.find(utility_id);
  if (asset == by_utility_.end()) {
    return nullptr;
  }
  auto it = steam_assets_.find(asset->second);
  return it == steam_assets_.end() ? nullptr : &it->second;
}

} // namespace normbalance::availability
