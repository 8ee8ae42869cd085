#pragma once

#include "io/io.hpp"
#include "payload/extent_translator.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace ue {

// Write cursor over an operation's destination ranges. Bytes are laid out
// across the ranges in order; bytes landing in a sparse range are dropped.
class ExtentWriter final : public IWriter {
  public:
    ExtentWriter(IBlockDevice& device, std::span<const ByteRange> ranges);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override { return device_->FsyncNow(); }

    // Format error unless exactly Capacity() bytes were written.
    Result End() const;

    std::uint64_t Capacity() const { return total_; }
    std::uint64_t Written() const { return written_; }
    std::uint64_t Remaining() const { return total_ - written_; }

  private:
    IBlockDevice* device_;
    std::span<const ByteRange> ranges_;
    std::uint64_t total_ = 0;
    std::uint64_t written_ = 0;
    size_t index_ = 0;
    std::uint64_t offset_in_range_ = 0;
};

// Reads the concatenation of |ranges| from |device|; sparse ranges read as zeros.
Result ReadExtents(IBlockDevice& device, std::span<const ByteRange> ranges,
                   std::vector<std::uint8_t>& out);

} // namespace ue
