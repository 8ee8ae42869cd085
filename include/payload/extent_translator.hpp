#pragma once

#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace ue {

// Byte range on a device. A sparse range has no physical location: writes to
// it are dropped and reads from it yield zeros.
struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    bool sparse = false;
};

class ExtentTranslator {
  public:
    ExtentTranslator(std::uint32_t block_size, std::uint64_t capacity)
        : block_size_(block_size), capacity_(capacity) {}

    std::uint32_t BlockSize() const { return block_size_; }
    std::uint64_t Capacity() const { return capacity_; }

    // OutOfBounds for ranges past the device end, Format for arithmetic overflow.
    Result Translate(const Extent& extent, ByteRange& out) const;
    Result TranslateAll(std::span<const Extent> extents, std::vector<ByteRange>& out) const;

  private:
    std::uint32_t block_size_;
    std::uint64_t capacity_;
};

// Sum of range lengths. Returns false on overflow.
bool TotalLength(std::span<const ByteRange> ranges, std::uint64_t& out);

} // namespace ue
