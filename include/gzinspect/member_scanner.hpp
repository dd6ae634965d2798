#pragma once

#include "gzinspect/chunk.hpp"
#include "gzinspect/member_inflater.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <expected>
#include <vector>

namespace gzinspect {

// Finds where the gzip member starting at a given offset ends and decodes it.
//
// Concatenated members carry no length field, and 1F 8B can show up inside
// compressed data by chance. Every 1F 8B found after the header is therefore
// only a candidate: the bytes before it are trial-decoded, and the first
// candidate whose prefix is a complete member becomes the boundary. If the
// source runs out first, the accumulated bytes are the final member.
class MemberScanner {
  public:
    explicit MemberScanner(ScanOptions opt = {});

    const ScanOptions& Options() const { return opt_; }

    // On success the source is positioned at the end of the returned chunk.
    // ScanErrorKind::EndOfStream means no byte was available at `offset`.
    std::expected<ChunkInfo, ScanError> ReadMember(ISeekableReader& src,
                                                   std::uint64_t offset,
                                                   std::size_t chunk_number);

  private:
    enum class ScanStop { Boundary, EndOfStream, Ceiling };

    // Appends blocks to `member` until a boundary is confirmed, the source
    // ends or the size ceiling is crossed.
    std::expected<ScanStop, ScanError> ScanForBoundary(ISeekableReader& src,
                                                       std::uint64_t offset,
                                                       std::size_t header_size,
                                                       std::vector<std::uint8_t>& member,
                                                       MemberExtent& extent);

    // Final member: `member` must start with a complete member; any bytes
    // after its trailer are kept as part of the chunk.
    std::expected<MemberExtent, InflateError> RecoverFinalMember(std::uint64_t offset,
                                                                 std::size_t header_size,
                                                                 std::vector<std::uint8_t>& member);

    ScanOptions opt_;
    MemberInflater inflater_;
    std::vector<std::uint8_t> block_;
};

} // namespace gzinspect
