#pragma once

#include "payload/manifest.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ue {

inline constexpr std::uint64_t kDefaultMaxManifestSize = 4ULL * 1024 * 1024;
inline constexpr std::uint64_t kDefaultMaxOperationBufferBytes = 64ULL * 1024 * 1024;

// Immutable engine policy. Built once at startup from the JSON config file and
// CLI overrides, then passed by const reference.
struct EngineConfig {
    std::vector<std::string> trusted_keys;
    std::uint64_t max_manifest_size = kDefaultMaxManifestSize;
    std::vector<std::uint64_t> supported_major_versions{1, 2};
    std::vector<OperationType> allowed_operations = AllOperationTypes();
    std::string staging_dir = "/tmp";
    std::uint64_t max_operation_buffer_bytes = kDefaultMaxOperationBufferBytes;
    std::optional<std::uint64_t> target_capacity_bytes;
    bool require_pinned_hash = true;
    bool fsync_after_apply = true;

    bool SupportsMajorVersion(std::uint64_t v) const {
        return std::find(supported_major_versions.begin(), supported_major_versions.end(), v) !=
               supported_major_versions.end();
    }

    bool AllowsOperation(OperationType t) const {
        return std::find(allowed_operations.begin(), allowed_operations.end(), t) !=
               allowed_operations.end();
    }
};

} // namespace ue
