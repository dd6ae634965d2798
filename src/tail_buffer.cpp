#include "gzinspect/tail_buffer.hpp"

namespace gzinspect {

std::vector<std::size_t> RingOrder(std::size_t stored, std::size_t capacity, std::size_t total_seen) {
    std::vector<std::size_t> order;
    order.reserve(stored);
    if (capacity == 0 || total_seen <= capacity) {
        for (std::size_t i = 0; i < stored; ++i) order.push_back(i);
        return order;
    }
    // The next slot to be overwritten holds the oldest element.
    const std::size_t start = total_seen % capacity;
    for (std::size_t i = start; i < stored; ++i) order.push_back(i);
    for (std::size_t i = 0; i < start && i < stored; ++i) order.push_back(i);
    return order;
}

TailBuffer::TailBuffer(std::size_t capacity) : capacity_(capacity) {
    slots_.reserve(capacity);
}

void TailBuffer::Add(ChunkInfo chunk) {
    if (capacity_ == 0) {
        ++total_seen_;
        return;
    }
    if (slots_.size() < capacity_) {
        slots_.push_back(std::move(chunk));
    } else {
        slots_[total_seen_ % capacity_] = std::move(chunk);
    }
    ++total_seen_;
}

bool TailBuffer::ShouldBuffer(std::size_t chunk_num) const {
    const std::size_t first = total_seen_ > capacity_ ? total_seen_ - capacity_ : 0;
    return chunk_num >= first;
}

std::vector<const ChunkInfo*> TailBuffer::GetBuffered() const {
    std::vector<const ChunkInfo*> out;
    out.reserve(slots_.size());
    for (std::size_t idx : RingOrder(slots_.size(), capacity_, total_seen_)) {
        out.push_back(&slots_[idx]);
    }
    return out;
}

} // namespace gzinspect
