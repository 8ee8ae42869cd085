// bspatch.cpp - bsdiff patch application through libbspatch.

#include "payload/bspatch.hpp"

#include "util/logger.hpp"

#include <bsdiff/bspatch.h>

#include <cstring>
#include <functional>

namespace ue {

namespace {

constexpr size_t kHeaderSize = 32;

// bsdiff integers: 63-bit magnitude, little-endian, sign in the top bit.
std::int64_t ReadOfftin(const std::uint8_t* p) {
    std::int64_t y = p[7] & 0x7F;
    for (int i = 6; i >= 0; --i) {
        y = y * 256 + p[i];
    }
    return (p[7] & 0x80) ? -y : y;
}

} // namespace

std::expected<std::uint64_t, std::string> BsdiffNewSize(std::span<const std::uint8_t> patch) {
    if (patch.size() < kHeaderSize) {
        return std::unexpected(std::string("bsdiff patch shorter than its header"));
    }
    if (std::memcmp(patch.data(), "BSDIFF40", 8) != 0 &&
        std::memcmp(patch.data(), "BSDF2", 5) != 0) {
        return std::unexpected(std::string("Bad bsdiff magic"));
    }
    const std::int64_t size = ReadOfftin(patch.data() + 24);
    if (size < 0) {
        return std::unexpected(std::string("Corrupt bsdiff header"));
    }
    return static_cast<std::uint64_t>(size);
}

Result ApplyBsdiffPatch(std::span<const std::uint8_t> old_data,
                        std::span<const std::uint8_t> patch,
                        IWriter& out) {
    Result write_error = Result::Ok();
    const std::function<size_t(const std::uint8_t*, size_t)> sink =
        [&](const std::uint8_t* data, size_t len) -> size_t {
        write_error = out.WriteAll(std::span<const std::uint8_t>(data, len));
        return write_error.is_ok() ? len : 0;
    };

    const int rc = bsdiff::bspatch(old_data.data(), old_data.size(),
                                   patch.data(), patch.size(), sink);
    if (!write_error.is_ok()) return write_error;
    if (rc != 0) {
        LogDebug("bspatch returned %d for a %zu byte patch", rc, patch.size());
        return Result::FormatError("bsdiff patch rejected (bspatch error " +
                                   std::to_string(rc) + ")");
    }
    return Result::Ok();
}

} // namespace ue
