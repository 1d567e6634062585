#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/availability/availability_view.hpp"
#include "internal/db/memory/memory_snapshot_source.hpp"
#include "internal/graph/norms_graph.hpp"
#include "internal/model/assets.hpp"
#include "internal/model/norm_edge.hpp"
#include "internal/model/utility.hpp"

namespace normbalance::testing {

inline model::Utility MakeUtility(const std::string& id, bool is_distribution = false,
                                  model::UtilityType type = model::UtilityType::kSteam) {
  model::Utility u;
  u.id              = id;
  u.code            = id;
  u.name            = id;
  u.uom             = "MT";
  u.type            = type;
  u.is_distribution = is_distribution;
  return u;
}

inline model::NormEdge Distribution(const std::string& consumer, const std::string& supplier, double share) {
  model::NormEdge e;
  e.consumer = consumer;
  e.supplier = supplier;
  e.type     = model::NormType::kDistribution;
  e.factor   = model::FixedFactor{share};
  return e;
}

inline model::NormEdge Residual(const std::string& consumer, const std::string& supplier) {
  model::NormEdge e;
  e.consumer = consumer;
  e.supplier = supplier;
  e.type     = model::NormType::kDistribution;
  e.factor   = model::ResidualFactor{};
  return e;
}

inline model::NormEdge Conversion(const std::string& consumer, const std::string& supplier, double factor) {
  model::NormEdge e;
  e.consumer = consumer;
  e.supplier = supplier;
  e.type     = model::NormType::kConversion;
  e.factor   = model::FixedFactor{factor};
  return e;
}

inline model::NormEdge Formula(const std::string& consumer, const std::string& supplier, const std::string& formula,
                               const std::string& asset, std::optional<double> fallback) {
  model::NormEdge e;
  e.consumer = consumer;
  e.supplier = supplier;
  e.type     = model::NormType::kConversion;
  e.factor   = model::FormulaFactor{formula, asset, fallback};
  return e;
}

inline model::SteamAsset Hrsg(const std::string& id, const std::string& gt, double min_mt_h, double max_mt_h) {
  model::SteamAsset a;
  a.id                 = id;
  a.name               = id;
  a.type               = model::AssetType::kHrsg;
  a.steam_type         = "SHP";
  a.min_capacity       = min_mt_h;
  a.max_capacity       = max_mt_h;
  a.efficiency         = 1.03;
  a.linked_power_asset = gt;
  return a;
}

inline model::SteamAsset AlwaysOn(const std::string& id, model::AssetType type) {
  model::SteamAsset a;
  a.id                  = id;
  a.name                = id;
  a.type                = type;
  a.max_capacity        = 999999.0;
  a.is_always_available = true;
  a.priority            = 10;
  return a;
}

// SHP distributed over two HRSGs mirroring two gas turbines.
inline availability::AvailabilitySnapshot TwoHrsgSnapshot(bool gt1_up, bool gt2_up, double hours = 720.0) {
  availability::AvailabilitySnapshot s;
  s.power_assets = {{"GT1", "GT1"}, {"GT2", "GT2"}};
  s.steam_assets = {Hrsg("HRSG1", "GT1", 60.0, 136.0), Hrsg("HRSG2", "GT2", 60.0, 136.0)};
  s.links        = {{"HRSG1_SHP", "HRSG1"}, {"HRSG2_SHP", "HRSG2"}};
  s.records      = {{"GT1", gt1_up, gt1_up ? hours : 0.0}, {"GT2", gt2_up, gt2_up ? hours : 0.0}};
  return s;
}

inline db::PeriodInputs MakePeriod(const std::string& id, int month, bool gt1_up, bool gt2_up, double shp_demand) {
  db::PeriodInputs inputs;
  inputs.period                = {id, month, 2025, id};
  inputs.demand["SHP_DIS"]     = {shp_demand, 0.0};
  inputs.availability          = {{"GT1", gt1_up, gt1_up ? 720.0 : 0.0}, {"GT2", gt2_up, gt2_up ? 720.0 : 0.0}};
  inputs.benchmarks["SHP_DIS"] = 50000.0;
  return inputs;
}

/*
  Two-HRSG plant behind an in-memory source, periods stored out of order:

    P-01  both HRSGs up, 50000 MT SHP
    P-02  GT1 down, 50000 MT SHP
    P-03  both down, 1000 MT SHP (no supplier left)
    P-04  GT1 down, 200000 MT SHP (above HRSG2 capacity)
*/
inline std::shared_ptr<db::memory::MemorySnapshotSource> MemoryPlant() {
  const auto assets = TwoHrsgSnapshot(true, true);

  db::ReferenceData reference;
  reference.utilities    = {MakeUtility("SHP_DIS", true), MakeUtility("HRSG1_SHP"), MakeUtility("HRSG2_SHP"),
                            MakeUtility("BFW", false, model::UtilityType::kWater)};
  reference.norms        = {Distribution("SHP_DIS", "HRSG1_SHP", 0.5), Distribution("SHP_DIS", "HRSG2_SHP", 0.5),
                            Conversion("HRSG1_SHP", "BFW", 1.024), Conversion("HRSG2_SHP", "BFW", 1.024)};
  reference.steam_assets = assets.steam_assets;
  reference.power_assets = assets.power_assets;
  reference.links        = assets.links;

  auto source = std::make_shared<db::memory::MemorySnapshotSource>(std::move(reference));
  source->PutPeriod(MakePeriod("P-04", 4, false, true, 200000.0));
  source->PutPeriod(MakePeriod("P-02", 2, false, true, 50000.0));
  source->PutPeriod(MakePeriod("P-01", 1, true, true, 50000.0));
  source->PutPeriod(MakePeriod("P-03", 3, false, false, 1000.0));
  return source;
}

} // namespace normbalance::testing
