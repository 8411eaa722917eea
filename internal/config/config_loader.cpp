#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "internal/merge/stream_merger.hpp"
#include "internal/util/errors.hpp"

namespace txfeed::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // strtod also accepts hex, nan and inf; those stay strings (e.g. 0x-prefixed hashes)
  const bool   plain_decimal = scalar_value.find_first_of("xXnN") == std::string::npos;
  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (plain_decimal && !scalar_value.empty() && endptr && *endptr == '\0') {
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
      throw util::InvalidConfiguration("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

void ConfigLoader::LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfiguration("Failed to load YAML " + path + ": " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfiguration("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidConfiguration("Invalid " + message->GetDescriptor()->name() + " in " + path + ": " +
                                     std::string(status.message()));
  }
}

txfeed::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  txfeed::runtime::config::RuntimeConfig config;
  LoadMessageFromYaml(path, &config);
  return config;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ValidateConfig(const txfeed::runtime::config::RuntimeConfig& config) {
  if (config.sources().empty()) {
    throw util::InvalidConfiguration("config: no sources configured; add at least one entry under sources");
  }

  std::unordered_set<std::string> names;
  for (int i = 0; i < config.sources_size(); ++i) {
    const auto& source = config.sources(i);
    if (source.name().empty()) {
      throw util::InvalidConfiguration("config: sources[" + std::to_string(i) + "] is missing a name");
    }
    if (source.fixture_path().empty()) {
      throw util::InvalidConfiguration("config: source '" + source.name() + "' is missing fixture_path");
    }
    if (!names.insert(source.name()).second) {
      throw util::InvalidConfiguration("config: duplicate source name '" + source.name() + "'");
    }
  }

  const auto limit = config.merge().default_limit();
  if (limit < 0 || limit > merge::kMaxTakeLimit) {
    throw util::InvalidConfiguration("config: merge.default_limit must be within [0, " + std::to_string(merge::kMaxTakeLimit) +
                                     "], got " + std::to_string(limit));
  }
}

std::int64_t EffectiveDefaultLimit(const txfeed::runtime::config::RuntimeConfig& config) {
  return config.merge().default_limit() == 0 ? kDefaultTakeLimit : config.merge().default_limit();
}

} // namespace txfeed::config
