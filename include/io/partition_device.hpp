#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <optional>
#include <span>
#include <string>

namespace ue {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// A slot partition, or a regular image file standing in for one.
class PartitionDevice final : public IBlockDevice {
  public:
    enum class Mode { kReadOnly, kReadWrite };

    // |declared_capacity| caps a block device and sizes an image file; without
    // it an image file's capacity is its current length.
    static Result Open(std::string path,
                       Mode mode,
                       std::optional<std::uint64_t> declared_capacity,
                       PartitionDevice& out);

    const std::string& Path() const { return path_; }
    bool IsBlockDevice() const { return is_block_; }

    std::uint64_t Capacity() const override { return capacity_; }
    Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) override;
    Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) override;
    Result Discard(std::uint64_t offset, std::uint64_t length) override;
    Result FsyncNow() override;

  private:
    Result WriteZeros(std::uint64_t offset, std::uint64_t length);

    std::string path_;
    Fd fd_;
    Mode mode_ = Mode::kReadOnly;
    bool is_block_ = false;
    std::uint64_t capacity_ = 0;
};

} // namespace ue
