#include "sqlite_snapshot_source.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace normbalance::db::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::vector<model::Utility> QueryUtilities(SqliteDB& db) {
  Statement st(db, "SELECT UtilityId,UtilityCode,UtilityName,UOM,PlantId,UtilityType,IsDistribution FROM UtilityMaster ORDER BY UtilityId;");

  std::vector<model::Utility> out;
  while (st.Step()) {
    model::Utility u;
    u.id              = ColText(st.Get(), 0);
    u.code            = ColText(st.Get(), 1);
    u.name            = ColText(st.Get(), 2);
    u.uom             = ColText(st.Get(), 3);
    u.plant_id        = ColText(st.Get(), 4);
    u.is_distribution = ColBool(st.Get(), 6);

    auto type = model::ParseUtilityType(ColText(st.Get(), 5));
    if (!type) {
      throw std::runtime_error("UtilityMaster " + u.id + ": unknown UtilityType '" + ColText(st.Get(), 5) + "'");
    }
    u.type = *type;
    out.push_back(std::move(u));
  }
  return out;
}

std::vector<model::NormEdge> QueryNorms(SqliteDB& db) {
  Statement st(db,
               "SELECT NormId,ConsumerUtilityId,SupplierUtilityId,AccountTypeId,NormFactor,NormType,Description,IsActive "
               "FROM UtilityNorms ORDER BY NormId;");

  std::vector<model::NormEdge> out;
  while (st.Step()) {
    model::NormEdge e;
    e.id              = ColText(st.Get(), 0);
    e.consumer        = ColText(st.Get(), 1);
    e.supplier        = ColText(st.Get(), 2);
    e.account_type_id = ColText(st.Get(), 3);
    e.description     = ColText(st.Get(), 6);
    e.active          = ColBool(st.Get(), 7);

    auto type = model::ParseNormType(ColText(st.Get(), 5));
    if (!type) {
      throw std::runtime_error("UtilityNorms " + e.id + ": unknown NormType '" + ColText(st.Get(), 5) + "'");
    }
    e.type = *type;

    if (ColIsNull(st.Get(), 4)) {
      e.factor = model::ResidualFactor{};
    } else {
      e.factor = model::FixedFactor{ColDouble(st.Get(), 4)};
    }
    out.push_back(std::move(e));
  }
  return out;
}

// Rewrites bound CONVERSION edges into formula edges. The stored factor becomes the fallback.
void ApplyFormulaBindings(SqliteDB& db, std::vector<model::NormEdge>& norms) {
  Statement st(db, "SELECT ConsumerUtilityId,SupplierUtilityId,FormulaName,AssetId FROM FormulaBinding ORDER BY ConsumerUtilityId,SupplierUtilityId;");

  std::vector<std::string> issues;
  while (st.Step()) {
    const auto consumer = ColText(st.Get(), 0);
    const auto supplier = ColText(st.Get(), 1);

    bool bound = false;
    for (auto& edge : norms) {
      if (!edge.active || edge.type != model::NormType::kConversion || edge.consumer != consumer || edge.supplier != supplier) {
        continue;
      }

      model::FormulaFactor factor;
      factor.formula  = ColText(st.Get(), 2);
      factor.asset_id = ColText(st.Get(), 3);
      if (const auto* fixed = std::get_if<model::FixedFactor>(&edge.factor)) {
        factor.fallback = fixed->value;
      }
      edge.factor = std::move(factor);
      bound       = true;
    }

    if (!bound) {
      issues.push_back("formula binding " + consumer + " -> " + supplier + " has no active CONVERSION norm");
    }
  }

  if (!issues.empty()) {
    throw util::ValidationError(std::move(issues));
  }
}

std::vector<model::PowerAsset> QueryPowerAssets(SqliteDB& db) {
  Statement st(db, "SELECT AssetId,AssetName FROM PowerGenerationAssets ORDER BY AssetId;");

  std::vector<model::PowerAsset> out;
  while (st.Step()) {
    out.push_back({ColText(st.Get(), 0), ColText(st.Get(), 1)});
  }
  return out;
}

std::vector<model::SteamAsset> QuerySteamAssets(SqliteDB& db) {
  Statement st(db,
               "SELECT AssetId,AssetName,AssetType,SteamType,MinCapacityMT,MaxCapacityMT,Efficiency,LinkedPowerAssetId,"
               "IsAlwaysAvailable,Priority FROM SteamGenerationAssets ORDER BY Priority,AssetId;");

  std::vector<model::SteamAsset> out;
  while (st.Step()) {
    model::SteamAsset a;
    a.id           = ColText(st.Get(), 0);
    a.name         = ColText(st.Get(), 1);
    a.steam_type   = ColText(st.Get(), 3);
    a.min_capacity = ColDouble(st.Get(), 4);
    a.max_capacity = ColDouble(st.Get(), 5);
    a.efficiency   = ColDouble(st.Get(), 6);
    if (!ColIsNull(st.Get(), 7)) {
      a.linked_power_asset = ColText(st.Get(), 7);
    }
    a.is_always_available = ColBool(st.Get(), 8);
    a.priority            = ColI32(st.Get(), 9);

    auto type = model::ParseAssetType(ColText(st.Get(), 2));
    if (!type) {
      throw std::runtime_error("SteamGenerationAssets " + a.id + ": unknown AssetType '" + ColText(st.Get(), 2) + "'");
    }
    a.type = *type;
    out.push_back(std::move(a));
  }
  return out;
}

std::vector<model::UtilityAssetLink> QueryLinks(SqliteDB& db) {
  Statement st(db, "SELECT UtilityId,AssetId FROM UtilityAssetLink ORDER BY UtilityId;");

  std::vector<model::UtilityAssetLink> out;
  while (st.Step()) {
    out.push_back({ColText(st.Get(), 0), ColText(st.Get(), 1)});
  }
  return out;
}

model::Period ReadPeriod(sqlite3_stmt* st) {
  model::Period p;
  p.id    = ColText(st, 0);
  p.month = ColI32(st, 1);
  p.year  = ColI32(st, 2);
  p.label = ColText(st, 3);
  return p;
}

} // namespace

SqliteSnapshotSource::SqliteSnapshotSource(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

ReferenceData SqliteSnapshotSource::LoadReference() {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction           tx(db_, SqliteTransaction::Kind::kRead);

  ReferenceData data;
  data.utilities = QueryUtilities(*db_);
  data.norms     = QueryNorms(*db_);
  ApplyFormulaBindings(*db_, data.norms);
  data.power_assets = QueryPowerAssets(*db_);
  data.steam_assets = QuerySteamAssets(*db_);
  data.links        = QueryLinks(*db_);

  tx.Commit();
  return data;
}

std::vector<model::Period> SqliteSnapshotSource::ListPeriods() {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(*db_, "SELECT FinancialYearMonthId,Month,Year,Label FROM FinancialYearMonth ORDER BY Year,Month,FinancialYearMonthId;");

  std::vector<model::Period> out;
  while (st.Step()) {
    out.push_back(ReadPeriod(st.Get()));
  }
  return out;
}

std::optional<model::Period> SqliteSnapshotSource::FindPeriod(const model::PeriodId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return QueryPeriod(id);
}

std::optional<model::Period> SqliteSnapshotSource::QueryPeriod(const model::PeriodId& id) {
  Statement st(*db_, "SELECT FinancialYearMonthId,Month,Year,Label FROM FinancialYearMonth WHERE FinancialYearMonthId=?;");
  BindText(st.Get(), 1, id);

  if (!st.Step()) {
    return std::nullopt;
  }
  return ReadPeriod(st.Get());
}

PeriodInputs SqliteSnapshotSource::LoadPeriod(const model::PeriodId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction           tx(db_, SqliteTransaction::Kind::kRead);

  auto period = QueryPeriod(id);
  if (!period) {
    throw util::NotFound("unknown period: " + id);
  }

  PeriodInputs inputs;
  inputs.period = *period;

  {
    Statement st(*db_, "SELECT UtilityId,ProcessRequirement,FixedRequirement FROM SteamRequirement WHERE FinancialYearMonthId=?;");
    BindText(st.Get(), 1, id);
    while (st.Step()) {
      auto& record = inputs.demand[ColText(st.Get(), 0)];
      record.process += ColDouble(st.Get(), 1);
      record.fixed += ColDouble(st.Get(), 2);
    }
  }

  {
    Statement st(*db_, "SELECT AssetId,IsAssetAvailable,OperationalHours FROM AssetAvailability WHERE FinancialYearMonthId=? ORDER BY AssetId;");
    BindText(st.Get(), 1, id);
    while (st.Step()) {
      inputs.availability.push_back({ColText(st.Get(), 0), ColBool(st.Get(), 1), ColDouble(st.Get(), 2)});
    }
  }

  {
    Statement st(*db_, "SELECT AssetId,HeatRate,FreeSteamFactor FROM GasTurbineCoefficients WHERE FinancialYearMonthId=?;");
    BindText(st.Get(), 1, id);
    while (st.Step()) {
      inputs.coefficients[ColText(st.Get(), 0)] = {ColDouble(st.Get(), 1), ColDouble(st.Get(), 2)};
    }
  }

  {
    Statement st(*db_, "SELECT UtilityId,ReferenceQuantity FROM BenchmarkNorms WHERE FinancialYearMonthId=?;");
    BindText(st.Get(), 1, id);
    while (st.Step()) {
      inputs.benchmarks[ColText(st.Get(), 0)] = ColDouble(st.Get(), 1);
    }
  }

  tx.Commit();
  return inputs;
}

} // namespace normbalance::db::sqlite
