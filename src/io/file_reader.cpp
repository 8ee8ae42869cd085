#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ue {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);
    out.size_ = std::nullopt;

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::IoError(
            e, "Failed to open payload: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        return Result::IoError(e, "fstat failed: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::IoError(EISDIR, "Payload path is a directory: " + out.path_);
    }
    if (S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace ue
