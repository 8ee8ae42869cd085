#pragma once

#include "io/io.hpp"
#include "payload/manifest.hpp"
#include "util/engine_config.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace ue {

// Container reader: walks header, manifest, metadata signature, blob and
// signature regions of one payload stream strictly in order. Each region is
// length-checked before any of its bytes are consumed.
class PayloadReader {
  public:
    PayloadReader(IReader& src, const EngineConfig& config) : src_(&src), config_(&config) {}

    // Magic is checked before anything past it is read.
    Result ReadHeader(PayloadHeader& out);
    Result ReadManifest(std::vector<std::uint8_t>& out);
    // No-op returning an empty buffer for version 1 payloads.
    Result ReadMetadataSignature(std::vector<std::uint8_t>& out);

    // Reader over the next |length| bytes. It reports end of stream at the
    // bound; a source that ends early makes Read() fail.
    std::unique_ptr<IReader> OpenBlob(std::uint64_t length);

    Result ReadSignatures(std::uint64_t length, std::vector<std::uint8_t>& out);

    // Format error if the stream continues past the signature region.
    Result ExpectEnd();

    std::uint64_t Consumed() const { return consumed_; }
    // Set when the stream ended inside the blob region.
    bool BlobTruncated() const { return blob_truncated_; }
    // Set once the stream is known to end somewhere other than right after
    // the signature region: early inside a region, or with trailing bytes.
    bool LengthMismatch() const { return short_read_ || blob_truncated_ || trailing_; }

    // Raw header bytes as read, for the metadata signature digest.
    std::span<const std::uint8_t> HeaderBytes() const {
        return std::span<const std::uint8_t>(header_bytes_.data(), have_header_ ? header_.Size() : 0);
    }

  private:
    class BlobReader;

    Result ReadExact(std::span<std::uint8_t> out, const char* what);

    IReader* src_;
    const EngineConfig* config_;
    PayloadHeader header_{};
    std::array<std::uint8_t, kHeaderSizeV2> header_bytes_{};
    bool have_header_ = false;
    std::uint64_t consumed_ = 0;
    bool blob_truncated_ = false;
    bool short_read_ = false;
    bool trailing_ = false;
};

} // namespace ue
