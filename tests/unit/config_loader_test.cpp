#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using normbalance::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "normbalance_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  sqlite:
    path: "/var/lib/norm-balance/plant.db"
    read_only: true
solver:
  tolerance: 1e-9
  max_iterations: 1000
  distribution_epsilon: 1e-4
  allow_negative_carry: true
  skip_capacity_check: true
availability:
  default_hours: 744
workers:
  threads: 4
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/norm-balance/plant.db");
  assert(config.database().sqlite().read_only());
  assert(config.solver().tolerance() == 1e-9);
  assert(config.solver().max_iterations() == 1000);
  assert(config.solver().distribution_epsilon() == 1e-4);
  assert(config.solver().allow_negative_carry());
  assert(config.solver().skip_capacity_check());
  assert(config.availability().default_hours() == 744.0);
  assert(config.workers().threads() == 4);
}

void TestDefaultsFillUnsetFields() {
  const auto config = ConfigLoader::LoadFromString("solver:\n  max_iterations: 20\n");
  assert(config.solver().max_iterations() == 20);
  assert(config.solver().tolerance() == 1e-6);
  assert(config.solver().distribution_epsilon() == 1e-6);
  assert(!config.solver().allow_negative_carry());
  assert(config.availability().default_hours() == 720.0);
  assert(config.workers().threads() >= 1);
  assert(config.logging().level() == "info");
  assert(!config.database().has_sqlite());

  // empty document
  const auto empty = ConfigLoader::LoadFromString("");
  assert(empty.solver().max_iterations() == 500);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "1234"
logging:
  pattern: "C:\\logs\\\"quoted\""
)");
  assert(config.database().sqlite().path() == "1234");
  assert(config.logging().pattern() == "C:\\logs\\\"quoted\"");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("solver:\n  tolerance: -1\n"));
  assert(Rejects("solver:\n  distribution_epsilon: -0.5\n"));
  assert(Rejects("availability:\n  default_hours: -720\n"));
  assert(Rejects("solver:\n  max_iterations: many\n"));
  assert(Rejects("- just\n- a\n- list\n"));
  assert(Rejects("solver: [unclosed\n"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(solver:
  tolerance: 1e-6
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
  assert(Rejects("solver:\n  damping: 0.5\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/norm-balance.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsFillUnsetFields();
  TestQuotedScalarsStayStrings();
  TestInvalidValuesAreRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "normbalance_unit_config_loader: pass\n";
  return 0;
}
