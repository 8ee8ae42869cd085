#include "io/staging_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace ue {

Result StagingFile::Create(const std::string& dir, StagingFile& out) {
    std::string tmpl = (dir.empty() ? std::string("/tmp") : dir) + "/update-payload-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::IoError(e, "mkstemp failed in " + dir + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);
    out.size_ = 0;

    if (::unlink(buf.data()) != 0) {
        const int e = errno;
        return Result::IoError(e, std::string("unlink failed: ") + buf.data());
    }
    return Result::Ok();
}

Result StagingFile::WriteAll(std::span<const std::uint8_t> in) {
    size_t off = 0;
    while (off < in.size()) {
        const ssize_t n = ::pwrite(fd_.Get(), in.data() + off, in.size() - off,
                                   static_cast<off_t>(size_ + off));
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const int e = n == 0 ? EIO : errno;
        return Result::IoError(e, "Staging write failed (" + std::string(std::strerror(e)) + ")");
    }
    size_ += in.size();
    return Result::Ok();
}

Result StagingFile::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::IoError(e, "Staging fsync failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result StagingFile::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const {
    if (offset > size_ || out.size() > size_ - offset) {
        return Result::OutOfBounds("read past end of staged blob");
    }

    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd_.Get(), out.data() + done, out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const int e = n == 0 ? EIO : errno;
        return Result::IoError(e, "Staging read failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace ue
