#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>

#include <memory>
#include <string>
#include <vector>

namespace ue {

// Streams the decompressed form of a bzip2 or xz byte source through
// libarchive's filter chain. Input in any other (or no) compression format is
// rejected at Open().
class DecompressingReader final : public IReader {
public:
    enum class Codec { kBzip2, kXz };

    DecompressingReader() = default;
    ~DecompressingReader() override;

    DecompressingReader(const DecompressingReader&) = delete;
    DecompressingReader& operator=(const DecompressingReader&) = delete;

    Result Open(IReader& src, Codec codec);

    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& LastError() const { return error_; }

private:
    struct Source {
        IReader* reader = nullptr;
        std::vector<std::uint8_t> buf;
    };

    std::string ArchiveError() const;

    struct archive* ar_ = nullptr;
    std::unique_ptr<Source> source_;
    std::string error_;
    bool eof_ = false;
};

const char* CodecName(DecompressingReader::Codec codec);

} // namespace ue
