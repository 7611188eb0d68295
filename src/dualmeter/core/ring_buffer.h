#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace dualmeter {
namespace core {

/**
 * Byte-oriented circular buffer for streaming data.
 *
 * Backs QUIC stream receive queues: bytes arrive in order, the HTTP/3
 * framing layer peeks at frame headers and consumes whole frames.
 *
 * Not thread-safe - caller must handle synchronization.
 */
class RingBuffer {
public:
    /**
     * Create ring buffer with specified capacity.
     *
     * @param capacity Buffer capacity in bytes
     */
    explicit RingBuffer(size_t capacity);

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;
    RingBuffer(RingBuffer&&) noexcept = default;
    RingBuffer& operator=(RingBuffer&&) noexcept = default;

    /**
     * Write data to buffer.
     *
     * @param data Data to write
     * @param length Number of bytes to write
     * @return Number of bytes actually written (may be less if buffer full)
     */
    size_t write(const uint8_t* data, size_t length) noexcept;

    /**
     * Read and consume data.
     *
     * @param buffer Output buffer
     * @param length Maximum bytes to read
     * @return Number of bytes actually read
     */
    size_t read(uint8_t* buffer, size_t length) noexcept;

    /**
     * Copy data starting at the read position without consuming it.
     */
    size_t peek(uint8_t* buffer, size_t length) const noexcept {
        return peek_at(0, buffer, length);
    }

    /**
     * Copy data starting `offset` bytes past the read position without
     * consuming it.
     *
     * @return Number of bytes copied
     */
    size_t peek_at(size_t offset, uint8_t* buffer, size_t length) const noexcept;

    /**
     * Drop bytes from the read side.
     *
     * @return Number of bytes actually discarded
     */
    size_t discard(size_t length) noexcept;

    size_t available() const noexcept { return size_; }
    size_t space() const noexcept { return capacity_ - size_; }
    size_t capacity() const noexcept { return capacity_; }
    bool is_empty() const noexcept { return size_ == 0; }
    bool is_full() const noexcept { return size_ == capacity_; }

    void clear() noexcept {
        head_ = 0;
        tail_ = 0;
        size_ = 0;
    }

private:
    std::unique_ptr<uint8_t[]> buffer_;
    size_t capacity_;
    size_t head_{0};    // Write position
    size_t tail_{0};    // Read position
    size_t size_{0};
};

} // namespace core
} // namespace dualmeter
