#include "payload/payload_reader.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>

namespace ue {

namespace {

std::uint64_t LoadBe64(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

std::uint32_t LoadBe32(const std::uint8_t* p) {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) | (std::uint32_t(p[2]) << 8) |
           std::uint32_t(p[3]);
}

} // namespace

class PayloadReader::BlobReader final : public IReader {
  public:
    BlobReader(PayloadReader* parent, std::uint64_t length) : parent_(parent), left_(length) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (left_ == 0 || out.empty()) return 0;
        if (out.size() > left_) out = out.first(static_cast<size_t>(left_));

        const ssize_t n = parent_->src_->Read(out);
        if (n < 0) return -1;
        if (n == 0) {
            LogError("Payload ended with %llu blob bytes missing", (unsigned long long)left_);
            parent_->blob_truncated_ = true;
            return -1;
        }
        left_ -= static_cast<std::uint64_t>(n);
        parent_->consumed_ += static_cast<std::uint64_t>(n);
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return left_; }

  private:
    PayloadReader* parent_;
    std::uint64_t left_;
};

Result PayloadReader::ReadExact(std::span<std::uint8_t> out, const char* what) {
    const ssize_t n = ReadFull(*src_, out);
    if (n < 0) {
        return Result::IoError(EIO, std::string("Read failed in payload ") + what);
    }
    consumed_ += static_cast<std::uint64_t>(n);
    if (static_cast<size_t>(n) != out.size()) {
        short_read_ = true;
        return Result::FormatError(std::string("Truncated payload ") + what + ": got " +
                                   std::to_string(n) + " of " + std::to_string(out.size()) +
                                   " bytes");
    }
    return Result::Ok();
}

Result PayloadReader::ReadHeader(PayloadHeader& out) {
    std::uint8_t buf[kHeaderSizeV2] = {};

    Result r = ReadExact(std::span<std::uint8_t>(buf, sizeof(kPayloadMagic)), "magic");
    if (!r.is_ok()) return r;
    if (std::memcmp(buf, kPayloadMagic, sizeof(kPayloadMagic)) != 0) {
        return Result::FormatError("Bad payload magic");
    }

    r = ReadExact(std::span<std::uint8_t>(buf + 4, kHeaderSizeV1 - 4), "header");
    if (!r.is_ok()) return r;

    PayloadHeader h;
    h.major_version = LoadBe64(buf + 4);
    h.manifest_size = LoadBe64(buf + 12);

    if (!config_->SupportsMajorVersion(h.major_version)) {
        return Result::FormatError("Unsupported payload major version " +
                                   std::to_string(h.major_version));
    }

    if (h.major_version >= 2) {
        r = ReadExact(std::span<std::uint8_t>(buf + kHeaderSizeV1, kHeaderSizeV2 - kHeaderSizeV1),
                      "header");
        if (!r.is_ok()) return r;
        h.metadata_signature_size = LoadBe32(buf + kHeaderSizeV1);
    }

    if (h.manifest_size > config_->max_manifest_size) {
        return Result::FormatError("Manifest size " + std::to_string(h.manifest_size) +
                                   " exceeds limit " + std::to_string(config_->max_manifest_size));
    }
    // The metadata signature is buffered like the manifest.
    if (h.metadata_signature_size > config_->max_manifest_size) {
        return Result::FormatError("Metadata signature size " +
                                   std::to_string(h.metadata_signature_size) + " exceeds limit");
    }

    LogDebug("Payload header: version %llu, manifest %llu bytes, metadata signature %u bytes",
             (unsigned long long)h.major_version,
             (unsigned long long)h.manifest_size,
             h.metadata_signature_size);

    header_ = h;
    std::memcpy(header_bytes_.data(), buf, sizeof(buf));
    have_header_ = true;
    out = h;
    return Result::Ok();
}

Result PayloadReader::ReadManifest(std::vector<std::uint8_t>& out) {
    if (!have_header_) return Result::FormatError("Manifest requested before header");
    out.assign(static_cast<size_t>(header_.manifest_size), 0);
    return ReadExact(std::span<std::uint8_t>(out.data(), out.size()), "manifest");
}

Result PayloadReader::ReadMetadataSignature(std::vector<std::uint8_t>& out) {
    if (!have_header_) return Result::FormatError("Metadata signature requested before header");
    out.assign(header_.metadata_signature_size, 0);
    if (out.empty()) return Result::Ok();
    return ReadExact(std::span<std::uint8_t>(out.data(), out.size()), "metadata signature");
}

std::unique_ptr<IReader> PayloadReader::OpenBlob(std::uint64_t length) {
    return std::make_unique<BlobReader>(this, length);
}

Result PayloadReader::ReadSignatures(std::uint64_t length, std::vector<std::uint8_t>& out) {
    if (length > config_->max_manifest_size) {
        return Result::FormatError("Signature block size " + std::to_string(length) +
                                   " exceeds limit");
    }
    out.assign(static_cast<size_t>(length), 0);
    return ReadExact(std::span<std::uint8_t>(out.data(), out.size()), "signatures");
}

Result PayloadReader::ExpectEnd() {
    std::uint8_t extra = 0;
    const ssize_t n = ReadFull(*src_, std::span<std::uint8_t>(&extra, 1));
    if (n < 0) return Result::IoError(EIO, "Read failed at end of payload");
    if (n > 0) {
        trailing_ = true;
        return Result::FormatError("Trailing bytes after signature region at offset " +
                                   std::to_string(consumed_));
    }
    return Result::Ok();
}

} // namespace ue
