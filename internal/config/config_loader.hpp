#pragma once

#include <string>

#include "config/config.pb.h"

namespace sealer::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto schema is
  the single source of truth for field names. Unknown keys are rejected.
  Quoted scalars always stay strings; plain scalars that look like numbers or
  booleans are typed.
*/
class ConfigLoader {
 public:
  static sealer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static sealer::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error naming the first missing or invalid setting.
  static void Validate(const sealer::runtime::config::RuntimeConfig& config);
};

} // namespace sealer::config
