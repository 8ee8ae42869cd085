#pragma once

#include "util/engine_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace ue::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, EngineConfig& cfg, std::string& err);

} // namespace ue::config::detail
