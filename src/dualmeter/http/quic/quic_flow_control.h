#pragma once

#include <cstdint>

namespace dualmeter {
namespace quic {

/**
 * QUIC flow control (RFC 9000 Section 4).
 *
 * Flow control operates at two levels:
 * 1. Per-stream: MAX_STREAM_DATA frames
 * 2. Connection-wide: MAX_DATA frames
 *
 * The send side tracks the peer's advertised limit. The receive side
 * enforces our limit and slides it forward once the application has
 * consumed half of the window.
 */
class FlowControl {
public:
    /**
     * @param recv_window Window we advertise to the peer
     * @param peer_max_data Peer's initial_max_data
     */
    FlowControl(uint64_t recv_window, uint64_t peer_max_data)
        : max_data_(peer_max_data),
          recv_window_(recv_window),
          recv_max_data_(recv_window) {
    }

    bool can_send(uint64_t bytes) const noexcept {
        return sent_data_ + bytes <= max_data_;
    }

    void add_sent_data(uint64_t bytes) noexcept {
        sent_data_ += bytes;
    }

    /**
     * Update peer's max data (from MAX_DATA frame). Limits never shrink.
     *
     * @return true if the limit grew
     */
    bool update_peer_max_data(uint64_t new_max) noexcept {
        if (new_max > max_data_) {
            max_data_ = new_max;
            return true;
        }
        return false;
    }

    /**
     * Account newly received bytes (beyond the highest offset seen on their
     * stream).
     *
     * @return false on flow control violation
     */
    bool on_data_received(uint64_t new_bytes) noexcept {
        if (recv_data_ + new_bytes > recv_max_data_) {
            return false;
        }
        recv_data_ += new_bytes;
        return true;
    }

    /**
     * Record bytes consumed by the application.
     *
     * @return true if a MAX_DATA update should be sent
     */
    bool on_data_consumed(uint64_t bytes) noexcept {
        consumed_data_ += bytes;
        if (recv_max_data_ - consumed_data_ < recv_window_ / 2) {
            recv_max_data_ = consumed_data_ + recv_window_;
            return true;
        }
        return false;
    }

    uint64_t peer_max_data() const noexcept { return max_data_; }
    uint64_t sent_data() const noexcept { return sent_data_; }
    uint64_t recv_data() const noexcept { return recv_data_; }
    uint64_t recv_max_data() const noexcept { return recv_max_data_; }

    bool is_blocked() const noexcept {
        return sent_data_ >= max_data_;
    }

    uint64_t available_window() const noexcept {
        if (sent_data_ >= max_data_) return 0;
        return max_data_ - sent_data_;
    }

private:
    uint64_t max_data_;          // Maximum we can send (peer's window)
    uint64_t sent_data_{0};      // Total sent (new data only)
    uint64_t recv_window_;
    uint64_t recv_max_data_;     // Maximum peer can send (our window)
    uint64_t recv_data_{0};      // Sum of highest received offsets
    uint64_t consumed_data_{0};  // Read by the application
};

/**
 * Per-stream flow control.
 */
class StreamFlowControl {
public:
    StreamFlowControl(uint64_t recv_window, uint64_t peer_max_stream_data)
        : max_stream_data_(peer_max_stream_data),
          recv_window_(recv_window),
          recv_max_offset_(recv_window) {
    }

    bool can_send(uint64_t bytes) const noexcept {
        return sent_offset_ + bytes <= max_stream_data_;
    }

    void add_sent_data(uint64_t bytes) noexcept {
        sent_offset_ += bytes;
    }

    bool update_peer_max_stream_data(uint64_t new_max) noexcept {
        if (new_max > max_stream_data_) {
            max_stream_data_ = new_max;
            return true;
        }
        return false;
    }

    /**
     * Check a received range against our limit and advance the highest
     * received offset.
     *
     * @param out_new_bytes Bytes past the previous highest offset
     * @return false on flow control violation
     */
    bool on_data_received(uint64_t offset, uint64_t length, uint64_t& out_new_bytes) noexcept {
        uint64_t end = offset + length;
        if (end > recv_max_offset_) {
            return false;
        }
        out_new_bytes = end > highest_recv_offset_ ? end - highest_recv_offset_ : 0;
        if (end > highest_recv_offset_) {
            highest_recv_offset_ = end;
        }
        return true;
    }

    /**
     * @return true if a MAX_STREAM_DATA update should be sent
     */
    bool on_data_consumed(uint64_t bytes) noexcept {
        consumed_offset_ += bytes;
        if (recv_max_offset_ - consumed_offset_ < recv_window_ / 2) {
            recv_max_offset_ = consumed_offset_ + recv_window_;
            return true;
        }
        return false;
    }

    uint64_t peer_max_stream_data() const noexcept { return max_stream_data_; }
    uint64_t sent_offset() const noexcept { return sent_offset_; }
    uint64_t highest_recv_offset() const noexcept { return highest_recv_offset_; }
    uint64_t recv_max_offset() const noexcept { return recv_max_offset_; }
    uint64_t consumed_offset() const noexcept { return consumed_offset_; }

    bool is_blocked() const noexcept {
        return sent_offset_ >= max_stream_data_;
    }

    uint64_t available_window() const noexcept {
        if (sent_offset_ >= max_stream_data_) return 0;
        return max_stream_data_ - sent_offset_;
    }

private:
    uint64_t max_stream_data_;       // Maximum we can send on this stream
    uint64_t sent_offset_{0};        // Offset of new data sent so far
    uint64_t recv_window_;
    uint64_t recv_max_offset_;       // Maximum peer can send on this stream
    uint64_t highest_recv_offset_{0};
    uint64_t consumed_offset_{0};
};

} // namespace quic
} // namespace dualmeter
