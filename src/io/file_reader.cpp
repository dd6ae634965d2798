#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gzinspect {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.pos_ = 0;

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return Result::Fail(errno, "fstat failed: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL, "Input is not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            pos_ += static_cast<std::uint64_t>(n);
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result FileReader::Seek(std::uint64_t offset) {
    const off_t r = ::lseek(fd_.Get(), static_cast<off_t>(offset), SEEK_SET);
    if (r < 0) {
        return Result::Fail(errno, "lseek failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    pos_ = static_cast<std::uint64_t>(r);
    return Result::Ok();
}

} // namespace gzinspect
