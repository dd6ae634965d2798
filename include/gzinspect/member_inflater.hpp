#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <zlib.h>

namespace gzinspect {

struct MemberExtent {
    // Header + deflate data + trailer. Bytes of the span past this point are slack.
    std::size_t member_size = 0;
    std::size_t decoded_size = 0;
};

struct InflateError {
    std::string message;
    // Offset within the span where decoding stopped.
    std::size_t stopped_at = 0;
};

// Decodes the raw deflate body of one gzip member. The header is parsed
// separately, so the method byte is not checked and the body is always
// treated as deflate. The CRC32/ISIZE trailer must be present but is not
// verified.
class MemberInflater {
  public:
    MemberInflater();
    ~MemberInflater();

    MemberInflater(const MemberInflater&) = delete;
    MemberInflater& operator=(const MemberInflater&) = delete;

    // `span` starts at the member's first header byte; deflate data starts
    // at `header_size`. Decoded bytes are appended to `out` when non-null.
    std::expected<MemberExtent, InflateError> Inflate(std::span<const std::uint8_t> span,
                                                      std::size_t header_size,
                                                      std::vector<std::uint8_t>* out = nullptr);

  private:
    z_stream strm_{};
    std::vector<std::uint8_t> out_buffer_;
};

} // namespace gzinspect
