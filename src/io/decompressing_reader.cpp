#include "io/decompressing_reader.hpp"

#include <archive_entry.h>

#include <cerrno>

namespace ue {

const char* CodecName(DecompressingReader::Codec codec) {
    switch (codec) {
        case DecompressingReader::Codec::kBzip2: return "bzip2";
        case DecompressingReader::Codec::kXz:    return "xz";
    }
    return "unknown";
}

DecompressingReader::~DecompressingReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

std::string DecompressingReader::ArchiveError() const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return em ? std::string(em) : std::string("unknown");
}

Result DecompressingReader::Open(IReader& src, Codec codec) {
    if (ar_) return Result::FormatError("Decompressor already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::IoError(ENOMEM, "archive_read_new failed");

    // The raw format yields the filtered stream as a single entry.
    archive_read_support_format_raw(ar_);
    const int want = codec == Codec::kBzip2 ? ARCHIVE_FILTER_BZIP2 : ARCHIVE_FILTER_XZ;
    if (codec == Codec::kBzip2) {
        archive_read_support_filter_bzip2(ar_);
    } else {
        archive_read_support_filter_xz(ar_);
    }

    source_ = std::make_unique<Source>();
    source_->reader = &src;
    source_->buf.resize(64 * 1024);

    auto read_cb = [](archive*, void* cd, const void** buff) -> la_ssize_t {
        auto* s = static_cast<Source*>(cd);
        const ssize_t n = s->reader->Read(std::span<std::uint8_t>(s->buf.data(), s->buf.size()));
        if (n < 0) return -1;
        *buff = s->buf.data();
        return static_cast<la_ssize_t>(n); // 0 => EOF
    };

    // source_ is owned here, so close has nothing to release.
    auto close_cb = [](archive*, void*) -> int { return ARCHIVE_OK; };

    if (archive_read_open2(ar_, source_.get(), /*open*/nullptr, read_cb, /*skip*/nullptr,
                           close_cb) != ARCHIVE_OK) {
        return Result::FormatError(std::string("Invalid ") + CodecName(codec) + " data: " +
                                   ArchiveError());
    }

    struct archive_entry* entry = nullptr;
    if (archive_read_next_header(ar_, &entry) != ARCHIVE_OK) {
        return Result::FormatError(std::string("Invalid ") + CodecName(codec) + " data: " +
                                   ArchiveError());
    }

    if (archive_filter_count(ar_) < 2 || archive_filter_code(ar_, 0) != want) {
        return Result::FormatError(std::string("Data is not ") + CodecName(codec) + " compressed");
    }

    return Result::Ok();
}

ssize_t DecompressingReader::Read(std::span<std::uint8_t> out) {
    if (!ar_) {
        error_ = "Decompressor not opened";
        return -1;
    }
    if (eof_ || out.empty()) return 0;

    const la_ssize_t n = archive_read_data(ar_, out.data(), out.size());
    if (n < 0) {
        error_ = ArchiveError();
        return -1;
    }
    if (n == 0) eof_ = true;
    return static_cast<ssize_t>(n);
}

} // namespace ue
