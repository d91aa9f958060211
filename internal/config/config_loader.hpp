#pragma once

#include <string>

#include "config/config.pb.h"

namespace gigbook::config {

inline constexpr uint32_t kDefaultImageMaxWidth = 1920;
inline constexpr double   kDefaultImageQuality  = 0.8;
inline constexpr uint64_t kDefaultMaxAudioBytes = 50ull * 1024 * 1024;
inline constexpr uint64_t kDefaultMaxImageBytes = 10ull * 1024 * 1024;
inline constexpr uint64_t kDefaultMaxImagePixels = 50ull * 1000 * 1000;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON and parsed
  into the config message, so the .proto is the single schema. Unknown
  keys are rejected. Defaults are applied after parsing.
*/
class ConfigLoader {
 public:
  static gigbook::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static gigbook::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // memory database + RAM blobs when no backend is named; media limits
  static void ApplyDefaults(gigbook::runtime::config::RuntimeConfig& config);
};

} // namespace gigbook::config
