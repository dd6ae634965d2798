#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace gzinspect {

// Seekable reader over a regular file.
class FileReader final : public ISeekableReader {
public:
    static Result Open(std::string path, FileReader &out);

    const std::string& Path() const { return path_; }

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    Result Seek(std::uint64_t offset) override;
    std::uint64_t Tell() const override { return pos_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::uint64_t pos_ = 0;
};

} // namespace gzinspect
