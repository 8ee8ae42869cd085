#pragma once

#include "payload/manifest.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace ue {

// Whole-buffer protobuf decode into the typed manifest plus the structural
// checks every later stage relies on (extent ordering, data ranges inside the
// blob region, destination sizes, allowed operation types).
class ManifestDecoder {
  public:
    ManifestDecoder() : allowed_(AllOperationTypes()) {}
    explicit ManifestDecoder(std::vector<OperationType> allowed) : allowed_(std::move(allowed)) {}

    std::expected<Manifest, std::string> Decode(std::span<const std::uint8_t> bytes) const;

  private:
    std::vector<OperationType> allowed_;
};

std::expected<std::vector<Signature>, std::string> DecodeSignatures(
    std::span<const std::uint8_t> bytes);

// Wire encoders, used to build payloads and fixtures.
std::string EncodeManifest(const Manifest& manifest);
std::string EncodeSignatures(std::span<const Signature> signatures);

// Bytes an operation writes: sum of num_blocks * block_size over dst extents.
bool DestinationBytes(const InstallOperation& op, std::uint32_t block_size, std::uint64_t& out);
bool SourceBytes(const InstallOperation& op, std::uint32_t block_size, std::uint64_t& out);

} // namespace ue
