#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace ue {

// Private spool for the data blob. The file is unlinked as soon as it is
// created, so nothing is left behind whatever way the process exits.
class StagingFile final : public IWriter, public IBlobSource {
public:
    static Result Create(const std::string& dir, StagingFile& out);

    StagingFile() = default;
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;
    StagingFile(StagingFile&&) noexcept = default;
    StagingFile& operator=(StagingFile&&) noexcept = default;

    // Appends.
    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t Size() const override { return size_; }
    Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const override;

private:
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace ue
