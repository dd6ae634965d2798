#include "gzinspect/member_scanner.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <span>
#include <string>

namespace gzinspect {

namespace {

std::unexpected<ScanError> Fail(ScanErrorKind kind, std::uint64_t offset, std::string msg) {
    return std::unexpected(ScanError{.kind = kind, .offset = offset, .message = std::move(msg)});
}

unsigned long long Ull(std::uint64_t v) { return static_cast<unsigned long long>(v); }

} // namespace

MemberScanner::MemberScanner(ScanOptions opt) : opt_(opt), block_(std::max<std::size_t>(opt.block_size, 1)) {}

std::expected<ChunkInfo, ScanError> MemberScanner::ReadMember(ISeekableReader& src,
                                                              std::uint64_t offset,
                                                              std::size_t chunk_number) {
    if (auto r = src.Seek(offset); !r.ok) {
        return Fail(ScanErrorKind::Io, offset, r.msg);
    }

    GzipFixedHeader fixed{};
    const ssize_t n = ReadFull(src, fixed);
    if (n < 0) {
        return Fail(ScanErrorKind::Io, offset, std::string("read failed: ") + std::strerror(errno));
    }
    if (n == 0) {
        return Fail(ScanErrorKind::EndOfStream, offset, "End of file");
    }
    if (n >= 2 && !HasGzipMagic(fixed.data())) {
        const auto shown = std::span<const std::uint8_t>(fixed.data(), std::min<std::size_t>(3, n));
        return Fail(ScanErrorKind::BadMagic, offset, "Invalid GZIP header: " + HexBytes(shown));
    }
    if (static_cast<std::size_t>(n) < kGzipHeaderSize) {
        return Fail(ScanErrorKind::TruncatedHeader, offset,
                    "Truncated GZIP header: " + std::to_string(n) + " of 10 bytes present");
    }

    std::vector<std::uint8_t> member(fixed.begin(), fixed.end());
    auto header = DecodeGzipHeader(fixed, src, member);
    if (!header) {
        return Fail(ScanErrorKind::TruncatedHeader, offset, "Invalid GZIP header: " + header.error());
    }
    if (header->method_code != kGzipMethodDeflate) {
        LogWarn("member at offset %llu declares compression method %u, decoding as deflate",
                Ull(offset), static_cast<unsigned>(header->method_code));
    }
    const std::size_t header_size = member.size();

    MemberExtent extent;
    auto stop = ScanForBoundary(src, offset, header_size, member, extent);
    if (!stop) return std::unexpected(stop.error());

    switch (*stop) {
        case ScanStop::Boundary:
            break;

        case ScanStop::Ceiling: {
            auto whole = inflater_.Inflate(member, header_size);
            if (!whole) {
                return Fail(ScanErrorKind::SizeExceeded, offset,
                            "Chunk too large: no member boundary within " +
                                std::to_string(opt_.max_member_bytes) + " bytes (" + whole.error().message + ")");
            }
            LogWarn("member at offset %llu exceeds %zu bytes, treating it as the final member",
                    Ull(offset), opt_.max_member_bytes);
            member.resize(whole->member_size);
            extent = *whole;
            break;
        }

        case ScanStop::EndOfStream: {
            auto recovered = RecoverFinalMember(offset, header_size, member);
            if (!recovered) {
                return Fail(ScanErrorKind::DecodeFailed, offset,
                            "Decompression error at offset " + std::to_string(offset) + ": " +
                                recovered.error().message);
            }
            extent = *recovered;
            break;
        }
    }

    ChunkInfo chunk;
    chunk.chunk_number = chunk_number;
    chunk.offset = offset;
    chunk.compressed_size = member.size();
    chunk.header = std::move(*header);
    chunk.header.header_size = header_size;

    if (opt_.keep_payload) {
        std::vector<std::uint8_t> payload;
        payload.reserve(extent.decoded_size);
        auto decoded = inflater_.Inflate(member, header_size, &payload);
        if (!decoded) {
            return Fail(ScanErrorKind::DecodeFailed, offset,
                        "Decompression error at offset " + std::to_string(offset) + ": " +
                            decoded.error().message);
        }
        extent = *decoded;
        chunk.payload = std::move(payload);
    }

    chunk.uncompressed_size = extent.decoded_size;
    chunk.compression_ratio =
        static_cast<double>(chunk.uncompressed_size) / static_cast<double>(chunk.compressed_size);

    if (auto r = src.Seek(chunk.End()); !r.ok) {
        return Fail(ScanErrorKind::Io, offset, r.msg);
    }
    return chunk;
}

std::expected<MemberScanner::ScanStop, ScanError> MemberScanner::ScanForBoundary(
    ISeekableReader& src,
    std::uint64_t offset,
    std::size_t header_size,
    std::vector<std::uint8_t>& member,
    MemberExtent& extent) {
    // First position that may hold the 1F of a candidate. A pair split
    // across two blocks is seen once the second block is appended.
    std::size_t scan_from = header_size;
    // Once a trial hits corrupt data, every longer prefix hits it too.
    bool corrupt = false;

    while (true) {
        const ssize_t got = src.Read(block_);
        if (got < 0) {
            return Fail(ScanErrorKind::Io, offset, std::string("read failed: ") + std::strerror(errno));
        }
        if (got == 0) return ScanStop::EndOfStream;

        member.insert(member.end(), block_.begin(), block_.begin() + got);

        std::size_t pos = scan_from;
        for (; pos + 1 < member.size(); ++pos) {
            if (corrupt || !HasGzipMagic(&member[pos])) continue;

            auto trial = inflater_.Inflate(std::span<const std::uint8_t>(member.data(), pos), header_size);
            if (trial) {
                LogDebug("member at offset %llu ends at %llu (%zu bytes of slack)",
                         Ull(offset), Ull(offset + pos), pos - trial->member_size);
                member.resize(pos);
                extent = *trial;
                return ScanStop::Boundary;
            }

            LogDebug("candidate boundary at %llu rejected: %s", Ull(offset + pos), trial.error().message.c_str());
            if (trial.error().stopped_at < pos) {
                corrupt = true;
            }
        }
        scan_from = pos;

        if (member.size() > opt_.max_member_bytes) return ScanStop::Ceiling;
    }
}

std::expected<MemberExtent, InflateError> MemberScanner::RecoverFinalMember(std::uint64_t offset,
                                                                           std::size_t header_size,
                                                                           std::vector<std::uint8_t>& member) {
    // A prefix can only decode if the whole buffer decodes up to the same
    // point, so one pass over everything answers the backward search.
    // Bytes after the trailer stay in the chunk so the stream is covered.
    auto whole = inflater_.Inflate(member, header_size);
    if (!whole) return whole;

    if (whole->member_size < member.size()) {
        LogWarn("member at offset %llu is followed by %zu trailing bytes, kept in its chunk",
                Ull(offset), member.size() - whole->member_size);
    }
    return whole;
}

} // namespace gzinspect
