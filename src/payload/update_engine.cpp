// update_engine.cpp - Verify-then-apply pipeline for one payload.

#include "payload/update_engine.hpp"

#include "io/hashing_reader.hpp"
#include "payload/manifest_decoder.hpp"
#include "payload/operation_executor.hpp"
#include "payload/payload_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace ue {

namespace {

constexpr size_t kChunk = 64 * 1024;

// Streams |length| blob bytes into |sink|, or just consumes them when |sink| is null.
Result CopyBlob(PayloadReader& reader, std::uint64_t length, IWriter* sink) {
    auto blob = reader.OpenBlob(length);
    std::vector<std::uint8_t> buf(kChunk);
    std::uint64_t copied = 0;

    while (true) {
        const ssize_t n = blob->Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            if (reader.BlobTruncated()) {
                return Result::FormatError("Truncated payload blob: got " + std::to_string(copied) +
                                           " of " + std::to_string(length) + " bytes");
            }
            return Result::IoError(EIO, "Read failed in payload blob");
        }
        if (sink) {
            Result r = sink->WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!r.is_ok()) return r;
        }
        copied += static_cast<std::uint64_t>(n);
    }
    return Result::Ok();
}

// SHA-256 over the first |size| bytes of a device.
Result HashDevicePrefix(IBlockDevice& device, std::uint64_t size, Sha256Digest& out) {
    if (size > device.Capacity()) {
        return Result::OutOfBounds("partition size " + std::to_string(size) +
                                   " exceeds device capacity " + std::to_string(device.Capacity()));
    }

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(kChunk);
    for (std::uint64_t pos = 0; pos < size;) {
        const auto n = static_cast<size_t>(std::min<std::uint64_t>(size - pos, buf.size()));
        Result r = device.ReadAt(pos, std::span<std::uint8_t>(buf.data(), n));
        if (!r.is_ok()) return r;
        hasher.Update(std::span<const std::uint8_t>(buf.data(), n));
        pos += n;
    }

    auto digest = hasher.Final();
    if (!digest) return Result::Fail(ErrorKind::Io, "SHA-256 of partition failed");
    out = *digest;
    return Result::Ok();
}

Result CheckPartitionHash(IBlockDevice& device, const PartitionInfo& info, const char* which) {
    Sha256Digest actual{};
    Result r = HashDevicePrefix(device, info.size, actual);
    if (!r.is_ok()) return r.Context(which);

    Sha256Digest expected{};
    std::memcpy(expected.data(), info.hash.data(), expected.size());
    if (!DigestEquals(actual, expected)) {
        return Result::IntegrityError(std::string(which) + " hash mismatch: expected " +
                                      HexEncode(expected) + " actual " + HexEncode(actual));
    }
    LogInfo("%s hash verified (%llu bytes)", which, (unsigned long long)info.size);
    return Result::Ok();
}

// With a pinned size, a stream that ends early or runs long fails closed.
Result CheckPinnedLength(Result r, const PayloadReader& reader, const HashingReader& hashing,
                         const ExpectedPayload& expected) {
    if (r.is_ok() || !expected.size || !reader.LengthMismatch()) return r;
    return Result::SecurityError("Payload stream does not match expected size " +
                                 std::to_string(*expected.size) + ": read " +
                                 std::to_string(hashing.BytesRead()) + " bytes (" + r.msg + ")");
}

} // namespace

Result UpdateEngine::Verify(IReader& src,
                            const ExpectedPayload& expected,
                            bool stage_blob,
                            std::unique_ptr<VerifiedPayload>& out) const {
    if (config_->require_pinned_hash && !expected.sha256) {
        return Result::SecurityError("No expected payload hash supplied");
    }
    if (keys_->Empty()) {
        return Result::SecurityError("No trusted keys configured");
    }

    HashingReader hashing(src);
    PayloadReader reader(hashing, *config_);

    PayloadHeader header;
    Result r = CheckPinnedLength(reader.ReadHeader(header), reader, hashing, expected);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> manifest_bytes;
    r = CheckPinnedLength(reader.ReadManifest(manifest_bytes), reader, hashing, expected);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> metadata_signature;
    r = CheckPinnedLength(reader.ReadMetadataSignature(metadata_signature), reader, hashing,
                          expected);
    if (!r.is_ok()) return r;

    ManifestDecoder decoder(config_->allowed_operations);
    auto manifest = decoder.Decode(manifest_bytes);
    if (!manifest) {
        return Result::FormatError("Invalid manifest: " + manifest.error());
    }
    LogInfo("Manifest: %zu operations, block size %u, minor version %u",
            manifest->install_operations.size(), manifest->block_size, manifest->minor_version);

    PayloadVerifier verifier(*keys_);
    if (header.major_version >= 2) {
        r = verifier.VerifyMetadataSignature(reader.HeaderBytes(), manifest_bytes,
                                             metadata_signature);
        if (!r.is_ok()) return r;
    }

    r = verifier.CheckDeclaredSize(header, *manifest, expected);
    if (!r.is_ok()) return r;

    const std::uint64_t blob_size = *manifest->signatures_offset;
    hashing.SetHashLimit(header.MetadataSize() + blob_size);

    std::unique_ptr<StagingFile> staged;
    if (stage_blob) {
        staged = std::make_unique<StagingFile>();
        r = StagingFile::Create(config_->staging_dir, *staged);
        if (!r.is_ok()) return r;
    }
    r = CheckPinnedLength(CopyBlob(reader, blob_size, staged.get()), reader, hashing, expected);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> signature_block;
    r = CheckPinnedLength(reader.ReadSignatures(*manifest->signatures_size, signature_block),
                          reader, hashing, expected);
    if (!r.is_ok()) return r;
    r = CheckPinnedLength(reader.ExpectEnd(), reader, hashing, expected);
    if (!r.is_ok()) return r;

    auto digest = hashing.FinishHash();
    if (!digest) {
        return Result::Fail(ErrorKind::Io, "SHA-256 of payload failed");
    }
    r = verifier.CheckPayloadHash(*digest, expected);
    if (!r.is_ok()) return r;

    r = verifier.VerifySignatures(*digest, signature_block);
    if (!r.is_ok()) return r;

    if (staged) {
        r = staged->FsyncNow();
        if (!r.is_ok()) return r;
    }

    LogInfo("Payload verified: %llu bytes, sha256 %s",
            (unsigned long long)reader.Consumed(), HexEncode(*digest).c_str());

    out.reset(new VerifiedPayload());
    out->header_ = header;
    out->manifest_ = std::move(*manifest);
    out->payload_hash_ = *digest;
    out->blob_ = std::move(staged);
    return Result::Ok();
}

Result UpdateEngine::Apply(const VerifiedPayload& payload,
                           IBlockDevice& target,
                           IBlockDevice* source,
                           const ApplyOptions& options) const {
    if (!payload.HasBlob()) {
        return Result::FormatError("Payload was verified without staging its data");
    }
    const Manifest& manifest = payload.GetManifest();

    ExecutorOptions exec_options;
    exec_options.max_operation_buffer_bytes = config_->max_operation_buffer_bytes;
    exec_options.cancel = options.cancel;
    exec_options.progress = options.progress;

    OperationExecutor executor(manifest, payload.Blob(), target, source, exec_options);
    Result r = executor.Preflight();
    if (!r.is_ok()) return r;

    if (source && manifest.old_partition_info && !manifest.old_partition_info->hash.empty()) {
        r = CheckPartitionHash(*source, *manifest.old_partition_info, "Source partition");
        if (!r.is_ok()) return r;
    }

    r = executor.Run();
    if (!r.is_ok()) return r;

    if (config_->fsync_after_apply) {
        r = target.FsyncNow();
        if (!r.is_ok()) return r;
    }

    if (manifest.new_partition_info && !manifest.new_partition_info->hash.empty()) {
        r = CheckPartitionHash(target, *manifest.new_partition_info, "Target partition");
        if (!r.is_ok()) return r;
    }

    return Result::Ok();
}

} // namespace ue
