#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

namespace ue::config {

Result LoadEngineConfigFile(const std::string& path, EngineConfig& out) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::FormatError("Config: " + err);
    }

    EngineConfig cfg = out;
    if (!detail::FillConfigFromJson(json, cfg, err)) {
        return Result::FormatError("Config: " + err + " in " + path);
    }

    out = std::move(cfg);
    LogDebug("Loaded config %s (%zu trusted keys)", path.c_str(), out.trusted_keys.size());
    return Result::Ok();
}

} // namespace ue::config
