#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace ue {

// Payload byte source: a regular file, a FIFO, or stdin when path is "-".
class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader& out);

    const std::string& Path() const { return path_; }

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace ue
