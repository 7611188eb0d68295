#pragma once

#include "quic_frames.h"
#include "quic_flow_control.h"
#include "../../core/ring_buffer.h"
#include <cstdint>
#include <map>
#include <string>

namespace dualmeter {
namespace quic {

/**
 * QUIC stream type based on stream ID.
 *
 * Stream ID encoding (RFC 9000 Section 2.1):
 *   Bit 0: 0 = client-initiated, 1 = server-initiated
 *   Bit 1: 0 = bidirectional, 1 = unidirectional
 */
enum class StreamType {
    CLIENT_BIDI = 0x00,  // 0b00
    SERVER_BIDI = 0x01,  // 0b01
    CLIENT_UNI = 0x02,   // 0b10
    SERVER_UNI = 0x03,   // 0b11
};

/**
 * Set of disjoint half-open byte ranges [start, end).
 */
class RangeSet {
public:
    void add(uint64_t start, uint64_t end);
    void remove(uint64_t start, uint64_t end);

    bool empty() const noexcept { return ranges_.empty(); }
    void clear() noexcept { ranges_.clear(); }

    /**
     * Lowest range, valid only when not empty.
     */
    std::pair<uint64_t, uint64_t> front() const noexcept {
        return *ranges_.begin();
    }

    /**
     * End of the range containing start, or start if none does.
     */
    uint64_t contiguous_end(uint64_t start) const noexcept;

    /**
     * Start of the first range beginning at or after pos, UINT64_MAX if none.
     */
    uint64_t next_start(uint64_t pos) const noexcept;

private:
    std::map<uint64_t, uint64_t> ranges_;
};

class QUICConnection;

/**
 * QUIC stream.
 *
 * Send side: written bytes stay buffered until acknowledged. Lost ranges
 * are re-queued and sent before new data.
 *
 * Receive side: out-of-order segments are held aside and appended to a
 * ring buffer once contiguous. The ring buffer is sized to the receive
 * window, so flow control guarantees it never overflows.
 *
 * Reading goes through QUICConnection so consumption replenishes both the
 * stream and the connection window.
 */
class QUICStream {
public:
    /**
     * @param recv_window Receive window we advertise for this stream
     * @param peer_max_stream_data Peer's initial limit for this stream
     */
    QUICStream(uint64_t stream_id, bool is_server,
               uint64_t recv_window, uint64_t peer_max_stream_data);

    QUICStream(const QUICStream&) = delete;
    QUICStream& operator=(const QUICStream&) = delete;

    uint64_t stream_id() const noexcept { return stream_id_; }
    StreamType type() const noexcept { return type_; }
    bool is_bidirectional() const noexcept { return (stream_id_ & 0x02) == 0; }
    bool is_local() const noexcept { return is_local_; }

    /**
     * True if this endpoint may send on the stream.
     */
    bool can_send() const noexcept { return is_bidirectional() || is_local_; }

    /**
     * True if the peer may send on the stream.
     */
    bool can_receive() const noexcept { return is_bidirectional() || !is_local_; }

    // ------------------------------------------------------------------
    // Send side
    // ------------------------------------------------------------------

    /**
     * Append data to the send buffer.
     *
     * @return Bytes accepted, 0 after close_send() or reset
     */
    size_t write(const uint8_t* data, size_t length);

    /**
     * Mark the end of the stream; FIN goes out after the buffered data.
     */
    void close_send() noexcept;

    /**
     * Bytes written but not yet acknowledged.
     */
    size_t send_buffered() const noexcept { return send_data_.size(); }

    uint64_t bytes_written() const noexcept { return send_base_ + send_data_.size(); }
    bool send_closed() const noexcept { return fin_queued_; }

    /**
     * True if next_frame() would produce a frame with the given
     * connection credit.
     */
    bool has_data_to_send(uint64_t conn_credit) const noexcept;

    /**
     * Build the next STREAM frame. Retransmissions come first, then new
     * data within the stream and connection credit.
     *
     * The frame data points into the send buffer and stays valid until
     * the next call that modifies the stream.
     *
     * @param max_frame_size Room left in the packet
     * @param out_new_bytes New (never sent) bytes in the frame
     * @return false if nothing fits or nothing is pending
     */
    bool next_frame(size_t max_frame_size, uint64_t conn_credit,
                    StreamFrame& out, uint64_t& out_new_bytes) noexcept;

    void on_frame_acked(uint64_t offset, uint64_t length, bool fin);
    void on_frame_lost(uint64_t offset, uint64_t length, bool fin);

    /**
     * Abandon the send side (RESET_STREAM).
     */
    void reset_send(uint64_t error_code) noexcept;

    bool reset_sent() const noexcept { return reset_sent_; }
    uint64_t reset_error_code() const noexcept { return reset_error_code_; }

    /**
     * All data and FIN acknowledged, or the send side was reset.
     */
    bool send_finished() const noexcept {
        if (!can_send()) return true;
        return reset_sent_ || (fin_acked_ && send_data_.empty());
    }

    bool first_byte_sent() const noexcept { return first_byte_sent_; }
    bool fin_sent() const noexcept { return fin_sent_; }

    // ------------------------------------------------------------------
    // Receive side
    // ------------------------------------------------------------------

    /**
     * Deliver STREAM frame data. Flow control is checked by the caller.
     *
     * @return TransportError::NO_ERROR or FINAL_SIZE_ERROR
     */
    TransportError on_stream_frame(uint64_t offset, const uint8_t* data,
                                   uint64_t length, bool fin);

    /**
     * Peer reset its send side.
     *
     * @return TransportError::NO_ERROR or FINAL_SIZE_ERROR
     */
    TransportError on_reset(uint64_t final_size, uint64_t error_code) noexcept;

    /**
     * Stop reading (STOP_SENDING sent). Buffered and future data is
     * discarded.
     */
    void stop_receiving() noexcept;

    /**
     * In-order bytes ready to read.
     */
    const core::RingBuffer& recv_buffer() const noexcept { return recv_buffer_; }

    /**
     * FIN received and every byte up to it delivered to the buffer.
     */
    bool fin_received() const noexcept {
        return final_size_known_ && recv_offset_ == final_size_;
    }

    bool final_size_known() const noexcept { return final_size_known_; }
    bool receive_stopped() const noexcept { return stop_sending_; }
    bool reset_received() const noexcept { return reset_received_; }
    uint64_t peer_reset_code() const noexcept { return peer_reset_code_; }

    /**
     * All peer data read, or the receive side was abandoned.
     */
    bool recv_finished() const noexcept {
        if (!can_receive()) return true;
        return reset_received_ || stop_sending_ ||
               (fin_received() && recv_buffer_.is_empty());
    }

    bool finished() const noexcept { return send_finished() && recv_finished(); }

    StreamFlowControl& flow_control() noexcept { return flow_control_; }
    const StreamFlowControl& flow_control() const noexcept { return flow_control_; }

private:
    friend class QUICConnection;

    /**
     * Consume buffered bytes.
     *
     * @return Bytes consumed
     */
    size_t read(uint8_t* buffer, size_t length) noexcept;
    size_t discard(size_t length) noexcept;

    void advance_send_base() noexcept;

    uint64_t stream_id_;
    StreamType type_;
    bool is_local_;

    StreamFlowControl flow_control_;

    // Send side
    std::string send_data_;          // Unacknowledged bytes from send_base_
    uint64_t send_base_{0};
    uint64_t next_send_offset_{0};   // First byte never transmitted
    RangeSet acked_;
    RangeSet retransmit_;
    bool fin_queued_{false};
    bool fin_sent_{false};
    bool fin_acked_{false};
    bool fin_lost_{false};
    bool first_byte_sent_{false};
    bool reset_sent_{false};
    uint64_t reset_error_code_{0};

    // Receive side
    core::RingBuffer recv_buffer_;
    std::map<uint64_t, std::string> out_of_order_;
    uint64_t recv_offset_{0};        // Next contiguous offset
    bool final_size_known_{false};
    uint64_t final_size_{0};
    bool reset_received_{false};
    uint64_t peer_reset_code_{0};
    bool stop_sending_{false};
};

} // namespace quic
} // namespace dualmeter
