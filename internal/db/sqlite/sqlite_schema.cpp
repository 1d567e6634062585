#include "sqlite_schema.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "sqlite_tx.hpp"

namespace normbalance::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS PlantMaster (PlantId TEXT PRIMARY KEY, PlantCode TEXT NOT NULL, PlantName TEXT NOT NULL, Description TEXT);",
      "CREATE TABLE IF NOT EXISTS AccountTypeMaster (AccountTypeId TEXT PRIMARY KEY, AccountTypeName TEXT NOT NULL, Description TEXT);",
      "CREATE TABLE IF NOT EXISTS UtilityMaster (UtilityId TEXT PRIMARY KEY, UtilityCode TEXT NOT NULL, UtilityName TEXT NOT NULL, UOM TEXT, PlantId TEXT REFERENCES PlantMaster(PlantId), UtilityType TEXT NOT NULL DEFAULT 'OTHER' CHECK (UtilityType IN ('STEAM','POWER','WATER','GAS','RAW_MATERIAL','CHEMICAL','BY_PRODUCT','OTHER')), IsDistribution INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS UtilityNorms (NormId INTEGER PRIMARY KEY, ConsumerUtilityId TEXT NOT NULL REFERENCES UtilityMaster(UtilityId), SupplierUtilityId TEXT NOT NULL REFERENCES UtilityMaster(UtilityId), AccountTypeId TEXT REFERENCES AccountTypeMaster(AccountTypeId), NormFactor REAL, NormType TEXT NOT NULL CHECK (NormType IN ('DISTRIBUTION','CONVERSION')), Description TEXT, IsActive INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS PowerGenerationAssets (AssetId TEXT PRIMARY KEY, AssetName TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS SteamGenerationAssets (AssetId TEXT PRIMARY KEY, AssetName TEXT NOT NULL, AssetType TEXT NOT NULL CHECK (AssetType IN ('HRSG','STG','PRDS')), SteamType TEXT, MinCapacityMT REAL NOT NULL DEFAULT 0, MaxCapacityMT REAL NOT NULL DEFAULT 0, Efficiency REAL NOT NULL DEFAULT 1, LinkedPowerAssetId TEXT REFERENCES PowerGenerationAssets(AssetId), IsAlwaysAvailable INTEGER NOT NULL DEFAULT 0, Priority INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS UtilityAssetLink (UtilityId TEXT PRIMARY KEY REFERENCES UtilityMaster(UtilityId), AssetId TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS FormulaBinding (ConsumerUtilityId TEXT NOT NULL, SupplierUtilityId TEXT NOT NULL, FormulaName TEXT NOT NULL, AssetId TEXT NOT NULL, PRIMARY KEY (ConsumerUtilityId, SupplierUtilityId));",
      "CREATE TABLE IF NOT EXISTS FinancialYearMonth (FinancialYearMonthId TEXT PRIMARY KEY, Month INTEGER NOT NULL CHECK (Month BETWEEN 1 AND 12), Year INTEGER NOT NULL, Label TEXT);",
      "CREATE TABLE IF NOT EXISTS SteamRequirement (Id INTEGER PRIMARY KEY, FinancialYearMonthId TEXT NOT NULL REFERENCES FinancialYearMonth(FinancialYearMonthId), UtilityId TEXT NOT NULL REFERENCES UtilityMaster(UtilityId), ProcessRequirement REAL NOT NULL DEFAULT 0, FixedRequirement REAL NOT NULL DEFAULT 0, UNIQUE (FinancialYearMonthId, UtilityId));",
      "CREATE TABLE IF NOT EXISTS AssetAvailability (AssetId TEXT NOT NULL, FinancialYearMonthId TEXT NOT NULL REFERENCES FinancialYearMonth(FinancialYearMonthId), IsAssetAvailable INTEGER NOT NULL, OperationalHours REAL NOT NULL DEFAULT 0, PRIMARY KEY (AssetId, FinancialYearMonthId));",
      "CREATE TABLE IF NOT EXISTS GasTurbineCoefficients (AssetId TEXT NOT NULL, FinancialYearMonthId TEXT NOT NULL REFERENCES FinancialYearMonth(FinancialYearMonthId), HeatRate REAL NOT NULL, FreeSteamFactor REAL NOT NULL, PRIMARY KEY (AssetId, FinancialYearMonthId));",
      "CREATE TABLE IF NOT EXISTS BenchmarkNorms (UtilityId TEXT NOT NULL REFERENCES UtilityMaster(UtilityId), FinancialYearMonthId TEXT NOT NULL REFERENCES FinancialYearMonth(FinancialYearMonthId), ReferenceQuantity REAL NOT NULL, PRIMARY KEY (UtilityId, FinancialYearMonthId));",
      "CREATE INDEX IF NOT EXISTS IX_UtilityNorms_Consumer ON UtilityNorms (ConsumerUtilityId);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

void RunScript(const std::shared_ptr<SqliteDB>& db, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open SQL script: " + path);
  }
  std::ostringstream script;
  script << in.rdbuf();

  SqliteTransaction tx(db, SqliteTransaction::Kind::kWrite);
  try {
    db->Exec(script.str());
  } catch (const std::exception& e) {
    throw std::runtime_error("SQL script " + path + " failed: " + e.what());
  }
  tx.Commit();
}

} // namespace normbalance::db::sqlite
