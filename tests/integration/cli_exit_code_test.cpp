#include <sys/wait.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

namespace fs = std::filesystem;

fs::path WorkDir() {
  const auto dir = fs::temp_directory_path() / "normbalance_cli_tests";
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
  assert(out.good());
}

// Exit code of the CLI run with `args`; output goes nowhere.
int RunCli(const std::string& args) {
  const std::string command = std::string("\"") + NORMBALANCE_CLI + "\" " + args + " >/dev/null 2>&1";
  const int         status  = std::system(command.c_str());
  assert(status != -1);
  assert(WIFEXITED(status));
  return WEXITSTATUS(status);
}

void TestUsageErrors() {
  assert(RunCli("") == 1);
  assert(RunCli("validate") == 1);
  assert(RunCli("--config x.yaml --format xml validate") == 1);
  assert(RunCli("--config x.yaml resolve") == 1);
  assert(RunCli("--config x.yaml frobnicate") == 1);
}

void TestExitCodes() {
  const auto dir    = WorkDir();
  const auto config = dir / "norm-balance.yaml";
  WriteFile(config, "logging:\n  level: error\n"
                    "database:\n  sqlite:\n    path: \"" +
                        (dir / "plant.db").string() +
                        "\"\n"
                        "workers:\n  threads: 2\n");
  const std::string with_config = "--config \"" + config.string() + "\" ";

  // unreadable config
  assert(RunCli("--config \"" + (dir / "missing.yaml").string() + "\" validate") == 2);

  assert(RunCli(with_config + "init-db \"" NORMBALANCE_SEED_SQL "\"") == 0);
  assert(RunCli(with_config + "validate") == 0);
  assert(RunCli(with_config + "resolve FY2526-05") == 0);
  assert(RunCli(with_config + "--format text resolve FY2526-04") == 0);
  assert(RunCli(with_config + "resolve-all") == 0);

  // unknown period
  assert(RunCli(with_config + "resolve FY2099-01") == 2);

  // a month with SHP demand and no availability rows: every HRSG is down
  const auto outage = dir / "outage.sql";
  WriteFile(outage, "INSERT INTO FinancialYearMonth (FinancialYearMonthId, Month, Year, Label) VALUES ('FY2526-06', 6, 2025, 'Jun-2025');\n"
                    "INSERT INTO SteamRequirement (FinancialYearMonthId, UtilityId, ProcessRequirement, FixedRequirement) VALUES "
                    "('FY2526-06', 'SHP_STEAM_DIS', 1000.0, 0);\n");
  assert(RunCli(with_config + "init-db \"" + outage.string() + "\"") == 0);
  assert(RunCli(with_config + "resolve FY2526-06") == 4);
  assert(RunCli(with_config + "resolve-all") == 4);
  assert(RunCli(with_config + "resolve FY2526-05") == 0);

  // a distribution node feeding itself
  const auto broken = dir / "broken.sql";
  WriteFile(broken, "INSERT INTO UtilityNorms (NormId, ConsumerUtilityId, SupplierUtilityId, AccountTypeId, NormFactor, NormType, Description) "
                    "VALUES (900, 'LP_STEAM_DIS', 'LP_STEAM_DIS', 'UTILITIES', 0.1, 'DISTRIBUTION', 'loop');\n");
  assert(RunCli(with_config + "init-db \"" + broken.string() + "\"") == 0);
  assert(RunCli(with_config + "validate") == 3);
  assert(RunCli(with_config + "resolve FY2526-05") == 3);
}

} // namespace

int main() {
  TestUsageErrors();
  TestExitCodes();

  std::cout << "normbalance_integration_cli_exit_codes: pass\n";
  return 0;
}
