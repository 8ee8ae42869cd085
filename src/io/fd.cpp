#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace ue {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    int rc = 0;
    if (fd_ >= 0 && fd_ != STDIN_FILENO) {
        // Linux releases the descriptor even when close() reports EINTR.
        if (::close(fd_) != 0 && errno != EINTR) {
            rc = errno;
        }
    }
    fd_ = -1;
    return rc;
}

} // namespace ue
