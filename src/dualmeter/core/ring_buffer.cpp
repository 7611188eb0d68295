#include "ring_buffer.h"

#include <algorithm>
#include <cstring>

namespace dualmeter {
namespace core {

RingBuffer::RingBuffer(size_t capacity)
    : buffer_(new uint8_t[capacity > 0 ? capacity : 1]),
      capacity_(capacity > 0 ? capacity : 1) {
}

size_t RingBuffer::write(const uint8_t* data, size_t length) noexcept {
    size_t to_write = std::min(length, capacity_ - size_);
    if (to_write == 0) return 0;

    // Up to two copies when the write wraps
    size_t first_part = std::min(to_write, capacity_ - head_);
    std::memcpy(buffer_.get() + head_, data, first_part);
    if (to_write > first_part) {
        std::memcpy(buffer_.get(), data + first_part, to_write - first_part);
    }

    head_ = (head_ + to_write) % capacity_;
    size_ += to_write;
    return to_write;
}

size_t RingBuffer::read(uint8_t* buffer, size_t length) noexcept {
    size_t n = peek_at(0, buffer, length);
    return discard(n);
}

size_t RingBuffer::peek_at(size_t offset, uint8_t* buffer, size_t length) const noexcept {
    if (offset >= size_) return 0;

    size_t to_peek = std::min(length, size_ - offset);
    if (to_peek == 0) return 0;

    size_t start = (tail_ + offset) % capacity_;
    size_t first_part = std::min(to_peek, capacity_ - start);
    std::memcpy(buffer, buffer_.get() + start, first_part);
    if (to_peek > first_part) {
        std::memcpy(buffer + first_part, buffer_.get(), to_peek - first_part);
    }
    return to_peek;
}

size_t RingBuffer::discard(size_t length) noexcept {
    size_t to_discard = std::min(length, size_);
    if (to_discard == 0) return 0;

    tail_ = (tail_ + to_discard) % capacity_;
    size_ -= to_discard;
    return to_discard;
}

} // namespace core
} // namespace dualmeter
