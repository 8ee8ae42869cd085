#pragma once

#include "util/engine_config.hpp"
#include "util/result.hpp"

#include <string>

namespace ue::config {

inline constexpr const char* kDefaultConfigPath = "/etc/update-payload/engine.json";

// Keys absent from the file keep the values already in |out|.
Result LoadEngineConfigFile(const std::string& path, EngineConfig& out);

} // namespace ue::config
