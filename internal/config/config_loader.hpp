#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace zreplicate::config {

// Smallest explicit channel buffer accepted; 0 means "OS default".
inline constexpr uint64_t kMinimumBufferSizeBytes = 16384;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static zreplicate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

/*
  Rejects settings that cannot produce a working transfer.

  Throws util::InvalidArgument.
*/
void ValidateConfig(const zreplicate::runtime::config::RuntimeConfig& config);

} // namespace zreplicate::config
