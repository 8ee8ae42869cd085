// partition_device.cpp - Positional I/O on a slot partition or image file.

#include "io/partition_device.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace ue {

namespace {

std::string Errno(int e) { return std::string(std::strerror(e)); }

bool RangeOk(std::uint64_t offset, std::uint64_t length, std::uint64_t capacity) {
    return offset <= capacity && length <= capacity - offset;
}

} // namespace

Result PartitionDevice::Open(std::string path,
                             Mode mode,
                             std::optional<std::uint64_t> declared_capacity,
                             PartitionDevice& out) {
    out.path_ = std::move(path);
    out.mode_ = mode;

    int flags = O_CLOEXEC | (mode == Mode::kReadWrite ? O_RDWR : O_RDONLY);
    if (mode == Mode::kReadWrite && !IsDevPath(out.path_)) {
        // Image files are updated in place: never truncate.
        flags |= O_CREAT;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        const int e = errno;
        return Result::IoError(e, "Failed to open device: " + out.path_ + " (" + Errno(e) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        return Result::IoError(e, "fstat failed: " + out.path_ + " (" + Errno(e) + ")");
    }

    if (S_ISBLK(st.st_mode)) {
        out.is_block_ = true;
        std::uint64_t bytes = 0;
        if (::ioctl(fd, BLKGETSIZE64, &bytes) != 0) {
            const int e = errno;
            return Result::IoError(e, "BLKGETSIZE64 failed: " + out.path_ + " (" + Errno(e) + ")");
        }
        out.capacity_ = declared_capacity ? std::min(*declared_capacity, bytes) : bytes;
    } else if (S_ISREG(st.st_mode)) {
        out.is_block_ = false;
        out.capacity_ = declared_capacity ? *declared_capacity
                                          : static_cast<std::uint64_t>(st.st_size);
    } else {
        return Result::IoError(EINVAL, "Not a block device or regular file: " + out.path_);
    }

    LogDebug("Opened %s (%s, capacity %llu bytes)",
             out.path_.c_str(),
             out.is_block_ ? "block device" : "image file",
             (unsigned long long)out.capacity_);
    return Result::Ok();
}

Result PartitionDevice::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) {
    if (!RangeOk(offset, out.size(), capacity_)) {
        return Result::OutOfBounds("read past end of " + path_);
    }

    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd_.Get(), out.data() + done, out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            if (is_block_) {
                return Result::IoError(EIO, "Unexpected end of device: " + path_);
            }
            // Image files may be shorter than their declared capacity.
            std::fill(out.begin() + static_cast<std::ptrdiff_t>(done), out.end(), 0);
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::IoError(e, "Read failed on " + path_ + " (" + Errno(e) + ")");
    }
    return Result::Ok();
}

Result PartitionDevice::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) {
    if (mode_ != Mode::kReadWrite) {
        return Result::IoError(EBADF, "Device opened read-only: " + path_);
    }
    if (!RangeOk(offset, in.size(), capacity_)) {
        return Result::OutOfBounds("write past end of " + path_);
    }

    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    std::uint64_t pos = offset;

    while (rem > 0) {
        ssize_t n = ::pwrite(fd_.Get(), p, rem, static_cast<off_t>(pos));
        if (n > 0) {
            p += static_cast<size_t>(n);
            pos += static_cast<std::uint64_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = n == 0 ? EIO : errno;
        return Result::IoError(e, "Write failed on " + path_ + " (" + Errno(e) + ")");
    }

    return Result::Ok();
}

Result PartitionDevice::WriteZeros(std::uint64_t offset, std::uint64_t length) {
    std::vector<std::uint8_t> zeros(static_cast<size_t>(std::min<std::uint64_t>(length, 1 << 20)), 0);
    while (length > 0) {
        const auto chunk = std::min<std::uint64_t>(length, zeros.size());
        Result r = WriteAt(offset, std::span<const std::uint8_t>(zeros.data(), static_cast<size_t>(chunk)));
        if (!r.is_ok()) return r;
        offset += chunk;
        length -= chunk;
    }
    return Result::Ok();
}

Result PartitionDevice::Discard(std::uint64_t offset, std::uint64_t length) {
    if (mode_ != Mode::kReadWrite) {
        return Result::IoError(EBADF, "Device opened read-only: " + path_);
    }
    if (!RangeOk(offset, length, capacity_)) {
        return Result::OutOfBounds("discard past end of " + path_);
    }
    if (length == 0) {
        return Result::Ok();
    }

    if (is_block_) {
        std::uint64_t range[2] = {offset, length};
        if (::ioctl(fd_.Get(), BLKDISCARD, &range) == 0) {
            return Result::Ok();
        }
    } else if (::fallocate(fd_.Get(), FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE,
                           static_cast<off_t>(offset), static_cast<off_t>(length)) == 0) {
        return Result::Ok();
    }

    // Discarded blocks must read back as zeros either way.
    LogDebug("Discard unsupported on %s (%s), writing zeros", path_.c_str(), Errno(errno).c_str());
    return WriteZeros(offset, length);
}

Result PartitionDevice::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::IoError(e, "fsync failed on " + path_ + " (" + Errno(e) + ")");
    }
    return Result::Ok();
}

} // namespace ue
