// operation_executor.cpp - Sequential application of install operations.

#include "payload/operation_executor.hpp"

#include "crypto/sha256.hpp"
#include "io/buffer_reader.hpp"
#include "io/decompressing_reader.hpp"
#include "payload/bspatch.hpp"
#include "payload/extent_io.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace ue {

namespace {

constexpr size_t kChunk = 64 * 1024;

std::string OpLabel(std::size_t index, OperationType type) {
    return "operation " + std::to_string(index) + " (" + OperationTypeName(type) + ")";
}

Result WriteZerosTo(ExtentWriter& writer, std::uint64_t length) {
    static const std::vector<std::uint8_t> kZeros(kChunk, 0);
    while (length > 0) {
        const auto n = static_cast<size_t>(std::min<std::uint64_t>(length, kZeros.size()));
        Result r = writer.WriteAll(std::span<const std::uint8_t>(kZeros.data(), n));
        if (!r.is_ok()) return r;
        length -= n;
    }
    return Result::Ok();
}

} // namespace

OperationExecutor::OperationExecutor(const Manifest& manifest,
                                     const IBlobSource& blob,
                                     IBlockDevice& target,
                                     IBlockDevice* source,
                                     ExecutorOptions options)
    : manifest_(&manifest), blob_(&blob), target_(&target), source_(source), options_(options) {}

Result OperationExecutor::Plan(std::size_t index, const InstallOperation& op, PlannedOp& out) const {
    const std::string label = OpLabel(index, op.type);

    IBlockDevice* from = target_;
    if (ReadsSourceSlot(op.type)) {
        if (!source_) {
            return Result::FormatError(label + ": requires a source partition");
        }
        from = source_;
    }

    const ExtentTranslator dst_map(manifest_->block_size, target_->Capacity());
    const ExtentTranslator src_map(manifest_->block_size, from->Capacity());

    Result r = dst_map.TranslateAll(op.dst_extents, out.dst);
    if (!r.is_ok()) return r.Context(label + " dst");
    r = src_map.TranslateAll(op.src_extents, out.src);
    if (!r.is_ok()) return r.Context(label + " src");

    if (!TotalLength(out.dst, out.dst_bytes) || !TotalLength(out.src, out.src_bytes)) {
        return Result::FormatError(label + ": extent sizes overflow");
    }

    const std::uint64_t cap = options_.max_operation_buffer_bytes;
    if (op.data_length > cap) {
        return Result::FormatError(label + ": data length " + std::to_string(op.data_length) +
                                   " exceeds operation buffer limit");
    }
    switch (op.type) {
        case OperationType::kMove:
        case OperationType::kSourceCopy:
        case OperationType::kBsdiff:
        case OperationType::kSourceBsdiff:
            if (out.src_bytes > cap) {
                return Result::FormatError(label + ": source size " +
                                           std::to_string(out.src_bytes) +
                                           " exceeds operation buffer limit");
            }
            break;
        case OperationType::kReplace:
        case OperationType::kReplaceBz:
        case OperationType::kReplaceXz:
        case OperationType::kZero:
        case OperationType::kDiscard:
            break;
    }
    return Result::Ok();
}

Result OperationExecutor::Preflight() {
    std::vector<PlannedOp> plans;
    plans.reserve(manifest_->install_operations.size());
    for (std::size_t i = 0; i < manifest_->install_operations.size(); ++i) {
        PlannedOp plan;
        Result r = Plan(i, manifest_->install_operations[i], plan);
        if (!r.is_ok()) return r;
        plans.push_back(std::move(plan));
    }
    plans_ = std::move(plans);
    planned_ = true;
    return Result::Ok();
}

Result OperationExecutor::Run() {
    if (!planned_) {
        Result r = Preflight();
        if (!r.is_ok()) return r;
    }

    const auto& ops = manifest_->install_operations;
    LogInfo("Applying %zu operations (block size %u)", ops.size(), manifest_->block_size);

    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (options_.cancel && options_.cancel->load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled,
                                "Cancelled after " + std::to_string(applied_) + " of " +
                                    std::to_string(ops.size()) + " operations");
        }

        Result r = Apply(i, ops[i], plans_[i]);
        if (!r.is_ok()) {
            LogError("%s failed: %s", OpLabel(i, ops[i].type).c_str(), r.msg.c_str());
            return r.Context(OpLabel(i, ops[i].type));
        }
        ++applied_;

        if (options_.progress) {
            ProgressEvent ev;
            ev.operation = OperationTypeName(ops[i].type);
            ev.ops_done = applied_;
            ev.ops_total = ops.size();
            ev.bytes_written = bytes_written_;
            options_.progress->OnProgress(ev);
        }
    }

    LogInfo("Applied %zu operations, %llu bytes written", applied_,
            (unsigned long long)bytes_written_);
    return Result::Ok();
}

Result OperationExecutor::LoadData(std::size_t index, const InstallOperation& op,
                                   std::vector<std::uint8_t>& out) {
    out.assign(static_cast<size_t>(op.data_length), 0);
    Result r = blob_->ReadAt(op.data_offset, std::span<std::uint8_t>(out.data(), out.size()));
    if (!r.is_ok()) return r;

    if (!op.data_sha256_hash.empty()) {
        auto actual = Sha256(out);
        if (!actual) {
            return Result::Fail(ErrorKind::Io, "SHA-256 of operation data failed");
        }
        Sha256Digest expected{};
        std::memcpy(expected.data(), op.data_sha256_hash.data(), expected.size());
        if (!DigestEquals(*actual, expected)) {
            return Result::IntegrityError("data hash mismatch: expected " + HexEncode(expected) +
                                          " actual " + HexEncode(*actual));
        }
    }
    LogDebug("%s: %llu data bytes at blob offset %llu", OpLabel(index, op.type).c_str(),
             (unsigned long long)op.data_length, (unsigned long long)op.data_offset);
    return Result::Ok();
}

Result OperationExecutor::Apply(std::size_t index, const InstallOperation& op,
                                const PlannedOp& plan) {
    std::vector<std::uint8_t> data;
    if (CarriesData(op.type)) {
        Result r = LoadData(index, op, data);
        if (!r.is_ok()) return r;
    }

    switch (op.type) {
        case OperationType::kReplace:
            return ApplyReplace(plan, data);
        case OperationType::kReplaceBz:
            return ApplyReplaceCompressed(plan, data, /*xz=*/false);
        case OperationType::kReplaceXz:
            return ApplyReplaceCompressed(plan, data, /*xz=*/true);
        case OperationType::kZero:
            return ApplyZero(plan);
        case OperationType::kDiscard:
            return ApplyDiscard(plan);
        case OperationType::kMove:
            return ApplyCopy(plan, *target_);
        case OperationType::kSourceCopy:
            return ApplyCopy(plan, *source_);
        case OperationType::kBsdiff:
            return ApplyBsdiff(op, plan, *target_, data);
        case OperationType::kSourceBsdiff:
            return ApplyBsdiff(op, plan, *source_, data);
    }
    return Result::FormatError("unknown operation type");
}

Result OperationExecutor::ApplyReplace(const PlannedOp& plan, std::span<const std::uint8_t> data) {
    ExtentWriter writer(*target_, plan.dst);
    Result r = writer.WriteAll(data);
    if (!r.is_ok()) return r;
    bytes_written_ += writer.Written();
    return writer.End();
}

Result OperationExecutor::ApplyReplaceCompressed(const PlannedOp& plan,
                                                 std::span<const std::uint8_t> data, bool xz) {
    BufferReader raw(data);
    DecompressingReader decompressor;
    Result r = decompressor.Open(raw, xz ? DecompressingReader::Codec::kXz
                                         : DecompressingReader::Codec::kBzip2);
    if (!r.is_ok()) return r;

    ExtentWriter writer(*target_, plan.dst);
    std::vector<std::uint8_t> buf(kChunk);
    while (true) {
        const ssize_t n = decompressor.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Result::FormatError("decompression failed: " + decompressor.LastError());
        }
        r = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.is_ok()) return r;
    }
    bytes_written_ += writer.Written();
    return writer.End();
}

Result OperationExecutor::ApplyZero(const PlannedOp& plan) {
    ExtentWriter writer(*target_, plan.dst);
    Result r = WriteZerosTo(writer, plan.dst_bytes);
    if (!r.is_ok()) return r;
    bytes_written_ += writer.Written();
    return writer.End();
}

Result OperationExecutor::ApplyDiscard(const PlannedOp& plan) {
    for (const auto& range : plan.dst) {
        if (range.sparse) continue;
        Result r = target_->Discard(range.offset, range.length);
        if (!r.is_ok()) return r;
        bytes_written_ += range.length;
    }
    return Result::Ok();
}

Result OperationExecutor::ApplyCopy(const PlannedOp& plan, IBlockDevice& from) {
    // The whole source is read before the first write, so overlapping
    // src/dst ranges copy the pre-operation contents.
    std::vector<std::uint8_t> staged;
    Result r = ReadExtents(from, plan.src, staged);
    if (!r.is_ok()) return r;

    ExtentWriter writer(*target_, plan.dst);
    r = writer.WriteAll(staged);
    if (!r.is_ok()) return r;
    bytes_written_ += writer.Written();
    return writer.End();
}

Result OperationExecutor::ApplyBsdiff(const InstallOperation& op, const PlannedOp& plan,
                                      IBlockDevice& from, std::span<const std::uint8_t> patch) {
    std::vector<std::uint8_t> old_data;
    Result r = ReadExtents(from, plan.src, old_data);
    if (!r.is_ok()) return r;
    if (op.src_length < old_data.size()) {
        old_data.resize(static_cast<size_t>(op.src_length));
    }

    auto new_size = BsdiffNewSize(patch);
    if (!new_size) return Result::FormatError(new_size.error());
    if (*new_size != op.dst_length) {
        return Result::FormatError("patch declares " + std::to_string(*new_size) +
                                   " bytes, dst_length is " + std::to_string(op.dst_length));
    }

    ExtentWriter writer(*target_, plan.dst);
    r = ApplyBsdiffPatch(old_data, patch, writer);
    if (!r.is_ok()) return r;
    if (writer.Written() != op.dst_length) {
        return Result::FormatError("patch produced " + std::to_string(writer.Written()) +
                                   " bytes, dst_length is " + std::to_string(op.dst_length));
    }

    // Tail of the last block past dst_length.
    r = WriteZerosTo(writer, writer.Remaining());
    if (!r.is_ok()) return r;
    bytes_written_ += writer.Written();
    return writer.End();
}

} // namespace ue
