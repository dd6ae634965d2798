#include "gzinspect/member_inflater.hpp"

#include "gzinspect/gzip_header.hpp"

#include <limits>
#include <stdexcept>

namespace gzinspect {

MemberInflater::MemberInflater() : out_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // Negative window bits: raw deflate, the gzip wrapper is handled by us.
    if (inflateInit2(&strm_, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

MemberInflater::~MemberInflater() {
    inflateEnd(&strm_);
}

std::expected<MemberExtent, InflateError> MemberInflater::Inflate(std::span<const std::uint8_t> span,
                                                                  std::size_t header_size,
                                                                  std::vector<std::uint8_t>* out) {
    if (span.size() <= header_size) {
        return std::unexpected(InflateError{"no compressed data after header", span.size()});
    }
    const std::size_t body_size = span.size() - header_size;
    if (body_size > std::numeric_limits<uInt>::max()) {
        return std::unexpected(InflateError{"member too large for a single inflate pass", header_size});
    }

    if (inflateReset(&strm_) != Z_OK) {
        return std::unexpected(InflateError{"inflateReset failed", header_size});
    }
    strm_.next_in = const_cast<Bytef*>(span.data() + header_size);
    strm_.avail_in = static_cast<uInt>(body_size);

    std::size_t decoded = 0;
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());

        const int ret = inflate(&strm_, Z_NO_FLUSH);

        const std::size_t produced = out_buffer_.size() - strm_.avail_out;
        decoded += produced;
        if (out && produced > 0) {
            out->insert(out->end(), out_buffer_.begin(),
                        out_buffer_.begin() + static_cast<std::ptrdiff_t>(produced));
        }

        if (ret == Z_STREAM_END) break;
        if (ret == Z_OK) continue;

        const std::size_t stopped_at = header_size + (body_size - strm_.avail_in);
        // No progress with all input consumed: the deflate stream is cut short.
        if (ret == Z_BUF_ERROR && strm_.avail_in == 0) {
            return std::unexpected(InflateError{"unexpected end of deflate data", stopped_at});
        }
        std::string msg = strm_.msg ? strm_.msg : zError(ret);
        return std::unexpected(InflateError{std::move(msg), stopped_at});
    }

    const std::size_t deflate_end = header_size + (body_size - strm_.avail_in);
    const std::size_t trailer_have = span.size() - deflate_end;
    if (trailer_have < kGzipTrailerSize) {
        return std::unexpected(InflateError{"truncated gzip trailer (" + std::to_string(trailer_have) +
                                                " of 8 bytes)",
                                            span.size()});
    }

    return MemberExtent{.member_size = deflate_end + kGzipTrailerSize, .decoded_size = decoded};
}

} // namespace gzinspect
