#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/result_aggregator.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr int kExitOk               = 0;
constexpr int kExitUsage            = 1;
constexpr int kExitFatal            = 2;
constexpr int kExitValidation       = 3;
constexpr int kExitResolutionFailed = 4;

void Usage() {
  std::cerr << "Usage:\n"
            << "  norm-balance --config <config.yaml> [--format json|text] validate\n"
            << "  norm-balance --config <config.yaml> [--format json|text] resolve <period>\n"
            << "  norm-balance --config <config.yaml> [--format json|text] resolve-all\n"
            << "  norm-balance --config <config.yaml> init-db [seed.sql]\n";
}

struct Args {
  std::string              config_path;
  bool                     text = false;
  std::string              command;
  std::vector<std::string> operands;
};

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      std::string format = argv[++i];
      if (format != "json" && format != "text") return false;
      args.text = format == "text";
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.operands.push_back(arg);
    }
  }

  if (args.config_path.empty() || args.command.empty()) return false;
  if (args.command == "validate" || args.command == "resolve-all") return args.operands.empty();
  if (args.command == "resolve") return args.operands.size() == 1;
  if (args.command == "init-db") return args.operands.size() <= 1;
  return false;
}

void Print(const normbalance::report::v1::BalanceReport& report, bool text, bool pretty) {
  if (text) {
    std::cout << normbalance::report::ResultAggregator::ToText(report) << std::endl;
  } else {
    std::cout << normbalance::report::ResultAggregator::ToJson(report, pretty) << std::endl;
  }
}

int RunCommand(const Args& args, const normbalance::runtime::config::RuntimeConfig& config) {
  using normbalance::observability::IntField;
  using normbalance::observability::StringField;

  if (args.command == "init-db") {
    normbalance::factory::InitDatabase(config, args.operands.empty() ? std::string{} : args.operands.front());
    return kExitOk;
  }

  auto app = normbalance::factory::Build(config);

  if (args.command == "validate") {
    auto summary = app.resolution_service->Validate();
    std::cout << "ok: " << summary.utilities << " utilities, " << summary.norms << " norms, " << summary.steam_assets
              << " steam assets, " << summary.power_assets << " power assets, " << summary.periods << " periods" << std::endl;
    return kExitOk;
  }

  if (args.command == "resolve") {
    auto report = app.resolution_service->Resolve(args.operands.front());
    Print(report, args.text, true);
    return report.authoritative() ? kExitOk : kExitResolutionFailed;
  }

  // resolve-all: one report per line, in period order
  auto results = app.batch_runner->RunAll();
  int  exit    = kExitOk;
  for (const auto& result : results) {
    if (result.report) {
      Print(*result.report, args.text, false);
    } else {
      std::cerr << result.period << ": " << result.error << std::endl;
    }
    if (!result.Ok()) exit = kExitResolutionFailed;
  }
  NORMBALANCE_LOG_INFO("resolve-all done", {IntField("periods", static_cast<std::int64_t>(results.size())),
                                            StringField("result", exit == kExitOk ? "ok" : "failures")});
  return exit;
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    Usage();
    return kExitUsage;
  }

  int exit = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = normbalance::config::ConfigLoader::LoadFromYaml(args.config_path);

    normbalance::observability::InitializeLogging(config);

    exit = RunCommand(args, config);
  } catch (const normbalance::util::ValidationError& e) {
    for (const auto& issue : e.Issues()) {
      std::cerr << "invalid: " << issue << "\n";
    }
    NORMBALANCE_LOG_ERROR("Validation failed", {normbalance::observability::IntField("issues", static_cast<std::int64_t>(e.Issues().size()))});
    exit = kExitValidation;
  } catch (const std::exception& e) {
    NORMBALANCE_LOG_ERROR("Fatal error", {normbalance::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << std::endl;
    exit = kExitFatal;
  }

  normbalance::observability::ShutdownLogging();
  return exit;
}
