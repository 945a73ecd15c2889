#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace seat::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; values are validated before the config is returned.
*/
class ConfigLoader {
 public:
  static seat::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error("Invalid configuration: ...") on bad values.
  static void Validate(const seat::runtime::config::RuntimeConfig& config);
};

inline constexpr std::chrono::minutes kDefaultHoldTtl{10};
inline constexpr const char*          kDefaultStatePath = "airline_state.json";

std::chrono::minutes                DefaultHoldTtl(const seat::runtime::config::RuntimeConfig& config);
std::optional<std::chrono::minutes> MaxHoldTtl(const seat::runtime::config::RuntimeConfig& config);
bool                                SeedDefaultFlights(const seat::runtime::config::RuntimeConfig& config);

} // namespace seat::config
