#pragma once

#include "gzinspect/chunk.hpp"

#include <cstddef>
#include <vector>

namespace gzinspect {

// Physical slot indices of a ring buffer, oldest element first.
// `stored` slots are filled, `total_seen` elements were ever added.
std::vector<std::size_t> RingOrder(std::size_t stored, std::size_t capacity, std::size_t total_seen);

// Keeps the last `capacity` chunks of a stream of unknown length.
class TailBuffer {
public:
    explicit TailBuffer(std::size_t capacity);

    void Add(ChunkInfo chunk);

    // Whether chunk `chunk_num` is among the last `capacity` chunks, given
    // the chunks seen so far.
    bool ShouldBuffer(std::size_t chunk_num) const;

    // Retained chunks in ascending chunk order.
    std::vector<const ChunkInfo*> GetBuffered() const;

    std::size_t Capacity() const { return capacity_; }
    std::size_t TotalSeen() const { return total_seen_; }
    std::size_t Size() const { return slots_.size(); }

private:
    std::vector<ChunkInfo> slots_;
    std::size_t capacity_;
    std::size_t total_seen_ = 0;
};

} // namespace gzinspect
