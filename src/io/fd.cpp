#include "io/fd.hpp"

#include <unistd.h>

namespace gzinspect {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    if (fd == fd_) return;
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ > STDERR_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace gzinspect
