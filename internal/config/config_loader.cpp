#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace normbalance::config {

namespace {

constexpr double   kDefaultTolerance           = 1e-6;
constexpr uint32_t kDefaultMaxIterations       = 500;
constexpr double   kDefaultDistributionEpsilon = 1e-6;
constexpr double   kDefaultHours               = 720.0;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1e-6" for a string field must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static normbalance::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  normbalance::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

normbalance::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

normbalance::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(normbalance::runtime::config::RuntimeConfig& config) {
  auto* solver = config.mutable_solver();
  if (solver->tolerance() == 0.0) {
    solver->set_tolerance(kDefaultTolerance);
  }
  if (solver->max_iterations() == 0) {
    solver->set_max_iterations(kDefaultMaxIterations);
  }
  if (solver->distribution_epsilon() == 0.0) {
    solver->set_distribution_epsilon(kDefaultDistributionEpsilon);
  }

  if (!(solver->tolerance() > 0.0) || !std::isfinite(solver->tolerance())) {
    throw std::runtime_error("Invalid configuration: solver.tolerance must be positive");
  }
  if (!(solver->distribution_epsilon() > 0.0) || !std::isfinite(solver->distribution_epsilon())) {
    throw std::runtime_error("Invalid configuration: solver.distribution_epsilon must be positive");
  }

  auto* availability = config.mutable_availability();
  if (availability->default_hours() == 0.0) {
    availability->set_default_hours(kDefaultHours);
  }
  if (!(availability->default_hours() > 0.0) || !std::isfinite(availability->default_hours())) {
    throw std::runtime_error("Invalid configuration: availability.default_hours must be positive");
  }

  if (config.workers().threads() == 0) {
    const unsigned hardware = std::thread::hardware_concurrency();
    config.mutable_workers()->set_threads(hardware == 0 ? 1 : hardware);
  }

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }
}

} // namespace normbalance::config
