#include "util/config_json_utils.hpp"

#include <fstream>

namespace ue::config::detail {

namespace {

// Each getter returns false when the key is absent; a present key of the
// wrong type is reported through |err|.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_unsigned()) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key,
                             std::vector<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, EngineConfig& cfg, std::string& err) {
    err.clear();

    GetStringArrayIfPresent(j, "TrustedKeys", cfg.trusted_keys, err);
    if (!err.empty())
        return false;

    GetU64IfPresent(j, "MaxManifestSize", cfg.max_manifest_size, err);
    if (!err.empty())
        return false;
    if (cfg.max_manifest_size == 0) {
        err = "MaxManifestSize must be positive";
        return false;
    }

    if (auto it = j.find("SupportedMajorVersions"); it != j.end()) {
        if (!it->is_array() || it->empty()) {
            err = "SupportedMajorVersions must be a non-empty array";
            return false;
        }
        std::vector<std::uint64_t> versions;
        for (const auto& v : *it) {
            if (!v.is_number_unsigned()) {
                err = "SupportedMajorVersions entries must be non-negative integers";
                return false;
            }
            const auto version = v.get<std::uint64_t>();
            if (version < 1 || version > 2) {
                err = "unsupported major version in SupportedMajorVersions: " +
                      std::to_string(version);
                return false;
            }
            versions.push_back(version);
        }
        cfg.supported_major_versions = std::move(versions);
    }

    {
        std::vector<std::string> names;
        if (GetStringArrayIfPresent(j, "AllowedOperations", names, err)) {
            std::vector<OperationType> ops;
            for (const auto& name : names) {
                auto type = OperationTypeFromName(name);
                if (!type) {
                    err = "unknown operation in AllowedOperations: " + name;
                    return false;
                }
                ops.push_back(*type);
            }
            cfg.allowed_operations = std::move(ops);
        }
        if (!err.empty())
            return false;
    }

    GetStringIfPresent(j, "StagingDir", cfg.staging_dir, err);
    if (!err.empty())
        return false;

    GetU64IfPresent(j, "MaxOperationBufferBytes", cfg.max_operation_buffer_bytes, err);
    if (!err.empty())
        return false;

    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "TargetCapacityBytes", v, err)) {
            cfg.target_capacity_bytes = v;
        }
        if (!err.empty())
            return false;
    }

    GetBoolIfPresent(j, "RequirePinnedHash", cfg.require_pinned_hash, err);
    GetBoolIfPresent(j, "FsyncAfterApply", cfg.fsync_after_apply, err);
    if (!err.empty())
        return false;

    return true;
}

} // namespace ue::config::detail
