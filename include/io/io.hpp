#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace ue {

// Sequential byte source. Read() returns bytes read, 0 at end of stream, -1 on error.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Random-access view of the verified data blob region.
class IBlobSource {
public:
    virtual ~IBlobSource() = default;
    virtual std::uint64_t Size() const = 0;
    virtual Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const = 0;
};

// Positional access to a slot device (or an image file standing in for one).
class IBlockDevice {
public:
    virtual ~IBlockDevice() = default;
    virtual std::uint64_t Capacity() const = 0;
    virtual Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) = 0;
    virtual Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) = 0;
    virtual Result Discard(std::uint64_t offset, std::uint64_t length) = 0;
    virtual Result FsyncNow() = 0;
};

// Keeps reading until |out| is full or the stream ends.
// Returns the number of bytes read, or -1 on error.
inline ssize_t ReadFull(IReader& reader, std::span<std::uint8_t> out) {
    size_t got = 0;
    while (got < out.size()) {
        const ssize_t n = reader.Read(out.subspan(got));
        if (n < 0) return -1;
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

} // namespace ue
