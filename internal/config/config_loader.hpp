#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace txfeed::config {

/*
  Loads protobuf messages from YAML files.

  YAML is converted to JSON then parsed into protobuf, so the .proto schema
  is the single definition of what a file may contain. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static txfeed::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws util::InvalidConfiguration on unreadable YAML or a schema mismatch.
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);
};

// Fallback when merge.default_limit is 0.
inline constexpr std::int64_t kDefaultTakeLimit = 100;

/*
  Semantic checks the schema cannot express:
    - at least one source
    - every source has a name and a fixture_path
    - source names are unique
    - merge.default_limit within [0, kMaxTakeLimit]

  Throws util::InvalidConfiguration.
*/
void ValidateConfig(const txfeed::runtime::config::RuntimeConfig& config);

// merge.default_limit, or kDefaultTakeLimit when unset.
std::int64_t EffectiveDefaultLimit(const txfeed::runtime::config::RuntimeConfig& config);

} // namespace txfeed::config
