#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ue {

inline constexpr char kPayloadMagic[4] = {'C', 'r', 'A', 'U'};
inline constexpr std::size_t kHeaderSizeV1 = 20;
inline constexpr std::size_t kHeaderSizeV2 = 24;
inline constexpr std::uint32_t kDefaultBlockSize = 4096;

// start_block value of an extent that has no physical location.
inline constexpr std::uint64_t kSparseHole = UINT64_MAX;

// Values match the wire enum.
enum class OperationType : int {
    kReplace = 0,
    kReplaceBz = 1,
    kMove = 2,
    kBsdiff = 3,
    kSourceCopy = 4,
    kSourceBsdiff = 5,
    kZero = 6,
    kDiscard = 7,
    kReplaceXz = 8,
};

const char* OperationTypeName(OperationType type);
std::optional<OperationType> OperationTypeFromName(std::string_view name);
const std::vector<OperationType>& AllOperationTypes();

// Operations that consume a byte range of the data blob.
bool CarriesData(OperationType type);
// Operations that read the source slot instead of the target.
bool ReadsSourceSlot(OperationType type);

struct Extent {
    std::uint64_t start_block = 0;
    std::uint64_t num_blocks = 0;

    bool IsSparse() const { return start_block == kSparseHole; }
};

struct InstallOperation {
    OperationType type = OperationType::kReplace;
    std::uint64_t data_offset = 0;
    std::uint64_t data_length = 0;
    std::vector<Extent> src_extents;
    std::uint64_t src_length = 0;
    std::vector<Extent> dst_extents;
    std::uint64_t dst_length = 0;
    std::string data_sha256_hash;
};

struct PartitionInfo {
    std::uint64_t size = 0;
    std::string hash;
};

struct Manifest {
    std::uint32_t block_size = kDefaultBlockSize;
    std::uint32_t minor_version = 0;
    std::vector<InstallOperation> install_operations;

    std::optional<std::uint64_t> signatures_offset;
    std::optional<std::uint64_t> signatures_size;

    std::optional<PartitionInfo> old_partition_info;
    std::optional<PartitionInfo> new_partition_info;
};

struct Signature {
    std::uint32_t version = 0;
    std::string data;
    std::optional<std::uint32_t> unpadded_signature_size;
};

struct PayloadHeader {
    std::uint64_t major_version = 0;
    std::uint64_t manifest_size = 0;
    std::uint32_t metadata_signature_size = 0;

    std::size_t Size() const { return major_version >= 2 ? kHeaderSizeV2 : kHeaderSizeV1; }
    // Bytes from the start of the container up to the first blob byte.
    std::uint64_t MetadataSize() const {
        return Size() + manifest_size + metadata_signature_size;
    }
};

} // namespace ue
