#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace gzinspect {

class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

// A reader whose cursor can be moved to an absolute byte offset.
class ISeekableReader : public IReader {
public:
    virtual Result Seek(std::uint64_t offset) = 0;
    virtual std::uint64_t Tell() const = 0;
};

// Reads until `out` is full or the source is exhausted.
// Returns the number of bytes read, or -1 on error.
inline ssize_t ReadFull(IReader& reader, std::span<std::uint8_t> out) {
    size_t got = 0;
    while (got < out.size()) {
        const ssize_t n = reader.Read(out.subspan(got));
        if (n < 0) return -1;
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

} // namespace gzinspect
