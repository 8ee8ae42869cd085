#include "payload/manifest_decoder.hpp"

#include "update_metadata.pb.h"

#include <algorithm>
#include <climits>
#include <string>

namespace ue {

namespace {

constexpr size_t kSha256Size = 32;

std::string OpLabel(size_t index, OperationType type) {
    return "operation " + std::to_string(index) + " (" + OperationTypeName(type) + ")";
}

bool ExtentBytes(std::span<const Extent> extents, std::uint32_t block_size, std::uint64_t& out) {
    std::uint64_t total = 0;
    for (const auto& e : extents) {
        std::uint64_t bytes = 0;
        if (__builtin_mul_overflow(e.num_blocks, static_cast<std::uint64_t>(block_size), &bytes) ||
            __builtin_add_overflow(total, bytes, &total)) {
            return false;
        }
    }
    out = total;
    return true;
}

std::expected<std::vector<Extent>, std::string> ConvertExtents(
    const google::protobuf::RepeatedPtrField<proto::Extent>& in, const char* which) {
    std::vector<Extent> out;
    out.reserve(static_cast<size_t>(in.size()));

    std::uint64_t prev_end = 0;
    bool have_prev = false;
    for (const auto& pe : in) {
        if (!pe.has_start_block() || !pe.has_num_blocks()) {
            return std::unexpected(std::string(which) + " extent missing start_block/num_blocks");
        }
        Extent e{.start_block = pe.start_block(), .num_blocks = pe.num_blocks()};
        if (e.num_blocks == 0) {
            return std::unexpected(std::string(which) + " extent with zero blocks");
        }
        if (!e.IsSparse()) {
            std::uint64_t end = 0;
            if (__builtin_add_overflow(e.start_block, e.num_blocks, &end)) {
                return std::unexpected(std::string(which) + " extent overflows");
            }
            // Within one list, physical extents ascend and never overlap.
            if (have_prev && e.start_block < prev_end) {
                return std::unexpected(std::string(which) +
                                       " extents overlap or are out of order at block " +
                                       std::to_string(e.start_block));
            }
            prev_end = end;
            have_prev = true;
        }
        out.push_back(e);
    }
    return out;
}

bool AnySparse(const std::vector<Extent>& extents) {
    return std::any_of(extents.begin(), extents.end(), [](const Extent& e) { return e.IsSparse(); });
}

std::expected<PartitionInfo, std::string> ConvertPartitionInfo(const proto::PartitionInfo& in,
                                                                const char* which) {
    PartitionInfo info;
    info.size = in.size();
    info.hash = in.hash();
    if (in.has_hash() && info.hash.size() != kSha256Size) {
        return std::unexpected(std::string(which) + " hash must be 32 bytes");
    }
    return info;
}

std::expected<InstallOperation, std::string> ConvertOperation(const proto::InstallOperation& in,
                                                              size_t index,
                                                              std::uint32_t block_size) {
    InstallOperation op;
    op.type = static_cast<OperationType>(in.type());
    const std::string label = OpLabel(index, op.type);

    auto src = ConvertExtents(in.src_extents(), "src");
    if (!src) return std::unexpected(label + ": " + src.error());
    auto dst = ConvertExtents(in.dst_extents(), "dst");
    if (!dst) return std::unexpected(label + ": " + dst.error());
    op.src_extents = std::move(*src);
    op.dst_extents = std::move(*dst);

    if (op.dst_extents.empty()) {
        return std::unexpected(label + ": no dst extents");
    }

    std::uint64_t dst_bytes = 0;
    std::uint64_t src_bytes = 0;
    if (!ExtentBytes(op.dst_extents, block_size, dst_bytes) ||
        !ExtentBytes(op.src_extents, block_size, src_bytes)) {
        return std::unexpected(label + ": extent size overflows");
    }

    if (CarriesData(op.type)) {
        if (!in.has_data_offset() || !in.has_data_length()) {
            return std::unexpected(label + ": missing data_offset/data_length");
        }
        if (in.data_length() == 0) {
            return std::unexpected(label + ": empty data");
        }
    } else if (in.data_length() != 0) {
        return std::unexpected(label + ": operation does not take blob data");
    }
    op.data_offset = in.data_offset();
    op.data_length = in.data_length();

    std::uint64_t data_end = 0;
    if (__builtin_add_overflow(op.data_offset, op.data_length, &data_end)) {
        return std::unexpected(label + ": data range overflows");
    }

    if (in.has_data_sha256_hash()) {
        if (in.data_sha256_hash().size() != kSha256Size) {
            return std::unexpected(label + ": data_sha256_hash must be 32 bytes");
        }
        op.data_sha256_hash = in.data_sha256_hash();
    }

    op.src_length = in.has_src_length() ? in.src_length() : src_bytes;
    op.dst_length = in.has_dst_length() ? in.dst_length() : dst_bytes;

    switch (op.type) {
        case OperationType::kReplace:
            if (op.data_length != dst_bytes) {
                return std::unexpected(label + ": data_length " + std::to_string(op.data_length) +
                                       " != dst size " + std::to_string(dst_bytes));
            }
            [[fallthrough]];
        case OperationType::kReplaceBz:
        case OperationType::kReplaceXz:
        case OperationType::kZero:
        case OperationType::kDiscard:
            if (!op.src_extents.empty()) {
                return std::unexpected(label + ": unexpected src extents");
            }
            break;
        case OperationType::kMove:
        case OperationType::kSourceCopy:
            if (op.src_extents.empty()) {
                return std::unexpected(label + ": no src extents");
            }
            if (AnySparse(op.src_extents)) {
                return std::unexpected(label + ": sparse src extent");
            }
            if (src_bytes != dst_bytes) {
                return std::unexpected(label + ": src size " + std::to_string(src_bytes) +
                                       " != dst size " + std::to_string(dst_bytes));
            }
            break;
        case OperationType::kBsdiff:
        case OperationType::kSourceBsdiff:
            if (op.src_extents.empty()) {
                return std::unexpected(label + ": no src extents");
            }
            if (op.src_length > src_bytes) {
                return std::unexpected(label + ": src_length exceeds src extents");
            }
            if (op.dst_length == 0 || op.dst_length > dst_bytes) {
                return std::unexpected(label + ": dst_length outside dst extents");
            }
            break;
    }

    return op;
}

} // namespace

bool DestinationBytes(const InstallOperation& op, std::uint32_t block_size, std::uint64_t& out) {
    return ExtentBytes(op.dst_extents, block_size, out);
}

bool SourceBytes(const InstallOperation& op, std::uint32_t block_size, std::uint64_t& out) {
    return ExtentBytes(op.src_extents, block_size, out);
}

std::expected<Manifest, std::string> ManifestDecoder::Decode(
    std::span<const std::uint8_t> bytes) const {
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected("manifest too large to decode");
    }

    proto::DeltaArchiveManifest pb;
    // Fails on truncation, malformed nesting, and missing required fields
    // (including unknown operation type values).
    if (!pb.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return std::unexpected("manifest does not decode");
    }

    Manifest m;
    m.block_size = pb.block_size();
    m.minor_version = pb.minor_version();
    if (m.block_size == 0 || (m.block_size & (m.block_size - 1)) != 0) {
        return std::unexpected("block_size must be a power of two, got " +
                               std::to_string(m.block_size));
    }

    if (pb.has_signatures_offset() != pb.has_signatures_size()) {
        return std::unexpected("signatures_offset and signatures_size must be given together");
    }
    if (pb.has_signatures_offset()) {
        m.signatures_offset = pb.signatures_offset();
        m.signatures_size = pb.signatures_size();
        std::uint64_t end = 0;
        if (__builtin_add_overflow(*m.signatures_offset, *m.signatures_size, &end)) {
            return std::unexpected("signatures region overflows");
        }
    }

    if (pb.has_old_partition_info()) {
        auto info = ConvertPartitionInfo(pb.old_partition_info(), "old_partition_info");
        if (!info) return std::unexpected(info.error());
        m.old_partition_info = std::move(*info);
    }
    if (pb.has_new_partition_info()) {
        auto info = ConvertPartitionInfo(pb.new_partition_info(), "new_partition_info");
        if (!info) return std::unexpected(info.error());
        m.new_partition_info = std::move(*info);
    }

    m.install_operations.reserve(static_cast<size_t>(pb.install_operations_size()));
    for (int i = 0; i < pb.install_operations_size(); ++i) {
        const auto& pop = pb.install_operations(i);
        const auto idx = static_cast<size_t>(i);

        auto op = ConvertOperation(pop, idx, m.block_size);
        if (!op) return std::unexpected(op.error());

        if (std::find(allowed_.begin(), allowed_.end(), op->type) == allowed_.end()) {
            return std::unexpected(OpLabel(idx, op->type) + ": operation type not allowed");
        }

        // Data must come from the blob region, never from the signatures.
        if (m.signatures_offset && CarriesData(op->type) &&
            op->data_offset + op->data_length > *m.signatures_offset) {
            return std::unexpected(OpLabel(idx, op->type) + ": data range [" +
                                   std::to_string(op->data_offset) + ", +" +
                                   std::to_string(op->data_length) +
                                   ") outside blob region");
        }

        m.install_operations.push_back(std::move(*op));
    }

    return m;
}

std::expected<std::vector<Signature>, std::string> DecodeSignatures(
    std::span<const std::uint8_t> bytes) {
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected("signature block too large to decode");
    }

    proto::Signatures pb;
    if (!pb.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return std::unexpected("signature block does not decode");
    }

    std::vector<Signature> out;
    out.reserve(static_cast<size_t>(pb.signatures_size()));
    for (const auto& ps : pb.signatures()) {
        Signature s;
        s.version = ps.version();
        s.data = ps.data();
        if (ps.has_unpadded_signature_size()) {
            s.unpadded_signature_size = ps.unpadded_signature_size();
        }
        out.push_back(std::move(s));
    }
    return out;
}

std::string EncodeManifest(const Manifest& manifest) {
    proto::DeltaArchiveManifest pb;
    pb.set_block_size(manifest.block_size);
    if (manifest.minor_version != 0) pb.set_minor_version(manifest.minor_version);
    if (manifest.signatures_offset) pb.set_signatures_offset(*manifest.signatures_offset);
    if (manifest.signatures_size) pb.set_signatures_size(*manifest.signatures_size);

    auto fill_info = [](const PartitionInfo& info, proto::PartitionInfo* out) {
        out->set_size(info.size);
        if (!info.hash.empty()) out->set_hash(info.hash);
    };
    if (manifest.old_partition_info) fill_info(*manifest.old_partition_info, pb.mutable_old_partition_info());
    if (manifest.new_partition_info) fill_info(*manifest.new_partition_info, pb.mutable_new_partition_info());

    for (const auto& op : manifest.install_operations) {
        auto* pop = pb.add_install_operations();
        pop->set_type(static_cast<proto::InstallOperation::Type>(op.type));
        if (CarriesData(op.type)) {
            pop->set_data_offset(op.data_offset);
            pop->set_data_length(op.data_length);
        }
        for (const auto& e : op.src_extents) {
            auto* pe = pop->add_src_extents();
            pe->set_start_block(e.start_block);
            pe->set_num_blocks(e.num_blocks);
        }
        for (const auto& e : op.dst_extents) {
            auto* pe = pop->add_dst_extents();
            pe->set_start_block(e.start_block);
            pe->set_num_blocks(e.num_blocks);
        }
        if (op.src_length != 0) pop->set_src_length(op.src_length);
        if (op.dst_length != 0) pop->set_dst_length(op.dst_length);
        if (!op.data_sha256_hash.empty()) pop->set_data_sha256_hash(op.data_sha256_hash);
    }

    return pb.SerializeAsString();
}

std::string EncodeSignatures(std::span<const Signature> signatures) {
    proto::Signatures pb;
    for (const auto& s : signatures) {
        auto* ps = pb.add_signatures();
        ps->set_version(s.version);
        ps->set_data(s.data);
        if (s.unpadded_signature_size) ps->set_unpadded_signature_size(*s.unpadded_signature_size);
    }
    return pb.SerializeAsString();
}

} // namespace ue
