#pragma once

#include "http2_frame.h"
#include "http2_stream.h"
#include "hpack.h"
#include "../core/result.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dualmeter {
namespace http2 {

/**
 * HTTP/2 Connection Settings (RFC 7540 Section 6.5.2).
 */
struct ConnectionSettings {
    uint32_t header_table_size{4096};        // SETTINGS_HEADER_TABLE_SIZE
    bool enable_push{false};                 // SETTINGS_ENABLE_PUSH
    uint32_t max_concurrent_streams{100};    // SETTINGS_MAX_CONCURRENT_STREAMS
    uint32_t initial_window_size{65535};     // SETTINGS_INITIAL_WINDOW_SIZE
    uint32_t max_frame_size{16384};          // SETTINGS_MAX_FRAME_SIZE (16384..16777215)
    uint32_t max_header_list_size{16384};    // SETTINGS_MAX_HEADER_LIST_SIZE
};

/**
 * HTTP/2 Connection State Machine.
 */
enum class ConnectionState : uint8_t {
    PREFACE_PENDING = 0,  // Waiting for client preface
    ACTIVE,               // Processing frames
    GOAWAY_SENT,          // Draining: no new streams, in-flight ones finish
    CLOSED                // Connection error, GOAWAY queued
};

/**
 * Response progress notifications.
 *
 * Both fire when produce_output() appends the frame, before the caller
 * has sent it anywhere. Callers that time delivery must wait for their
 * own transport to drain.
 */
enum class StreamEvent : uint8_t {
    FIRST_BYTE,  // HEADERS frame written to the output
    COMPLETE,    // Frame carrying END_STREAM written to the output
    RESET        // Stream reset before its response completed
};

/**
 * HTTP/2 server-side connection.
 *
 * Pure protocol engine: bytes in through process_input(), bytes out through
 * produce_output(). The owner moves bytes between it and the TLS socket.
 *
 * Response bodies are emitted lazily, only inside the peer's stream and
 * connection windows, and in max_frame_size chunks. Streams blocked on a
 * window resume when WINDOW_UPDATE or SETTINGS grows it.
 */
class Http2Connection {
public:
    /**
     * Invoked once per stream when its request header block is decoded.
     * The handler may call submit_response() before returning.
     */
    using RequestCallback = std::function<void(Http2Stream& stream, bool end_stream)>;

    using StreamEventCallback = std::function<void(const Http2Stream& stream, StreamEvent event)>;

    /**
     * Create connection. The server SETTINGS frame is queued immediately.
     *
     * @param conn_id Connection id used in log lines
     */
    explicit Http2Connection(uint64_t conn_id,
                             const ConnectionSettings& local = ConnectionSettings());

    /**
     * Process incoming plaintext from the TLS layer.
     *
     * Partial frames are buffered until complete.
     *
     * @return ok, or protocol_violation after a connection error (a GOAWAY
     *         is queued and the owner should flush and close)
     */
    core::result<void> process_input(const uint8_t* data, size_t len);

    /**
     * Append pending frames to out.
     *
     * Control frames are always written; HEADERS and DATA are written
     * until out has grown by about budget bytes.
     *
     * @return Number of bytes appended
     */
    size_t produce_output(std::vector<uint8_t>& out, size_t budget);

    /**
     * True if produce_output() would append something.
     */
    bool has_output() const noexcept {
        return !control_out_.empty() || !send_queue_.empty();
    }

    /**
     * Stage a response for a stream. HEADERS and DATA are produced by
     * produce_output().
     *
     * @param headers Response headers without :status, lowercase names
     * @param body Body bytes, or null for a header-only response
     * @return invalid_state if the stream is gone or already answered
     */
    core::result<void> submit_response(
        uint32_t stream_id,
        uint16_t status,
        std::vector<http::HPACKHeader> headers,
        std::shared_ptr<const std::string> body
    );

    /**
     * Reset a stream with RST_STREAM.
     */
    void reset_stream(uint32_t stream_id, ErrorCode error);

    /**
     * Graceful shutdown: GOAWAY(NO_ERROR) naming the last accepted stream.
     * New streams are refused afterwards.
     *
     * @return false if the connection was not active
     */
    bool start_drain();

    /**
     * Draining and no stream left.
     */
    bool is_drained() const noexcept {
        return state_ != ConnectionState::ACTIVE &&
               state_ != ConnectionState::PREFACE_PENDING &&
               stream_manager_.stream_count() == 0;
    }

    Http2Stream* get_stream(uint32_t stream_id) noexcept {
        return stream_manager_.get_stream(stream_id);
    }

    ConnectionState state() const noexcept { return state_; }
    bool is_active() const noexcept { return state_ == ConnectionState::ACTIVE; }
    bool peer_goaway_received() const noexcept { return peer_goaway_; }
    ErrorCode last_error() const noexcept { return last_error_; }
    size_t stream_count() const noexcept { return stream_manager_.stream_count(); }
    uint32_t last_stream_id() const noexcept { return last_stream_id_; }

    const ConnectionSettings& local_settings() const noexcept { return local_settings_; }
    const ConnectionSettings& remote_settings() const noexcept { return remote_settings_; }

    int32_t connection_send_window() const noexcept { return connection_send_window_; }
    int32_t connection_recv_window() const noexcept { return connection_recv_window_; }

    void set_request_callback(RequestCallback callback) {
        request_callback_ = std::move(callback);
    }

    void set_stream_event_callback(StreamEventCallback callback) {
        event_callback_ = std::move(callback);
    }

private:
    // Frame processing
    core::result<void> process_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_settings_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_headers_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_continuation_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_data_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_window_update_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_ping_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_rst_stream_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> handle_goaway_frame(const FrameHeader& header, const uint8_t* payload);
    core::result<void> finish_header_block();

    core::result<void> apply_settings(const std::vector<SettingsParameter>& params);
    void send_settings();

    /**
     * Queue GOAWAY and close.
     */
    core::result<void> connection_error(ErrorCode error, const char* reason);

    /**
     * Queue RST_STREAM and drop the stream.
     */
    void stream_error(uint32_t stream_id, ErrorCode error);

    void enqueue_stream(Http2Stream& stream);
    void finish_stream(Http2Stream& stream, std::vector<uint8_t>& out);
    void notify(const Http2Stream& stream, StreamEvent event);

    uint64_t conn_id_;
    ConnectionState state_{ConnectionState::PREFACE_PENDING};
    ErrorCode last_error_{ErrorCode::NO_ERROR};
    bool peer_goaway_{false};

    ConnectionSettings local_settings_;
    ConnectionSettings remote_settings_;
    bool settings_received_{false};

    // Flow control
    int32_t connection_send_window_{DEFAULT_WINDOW_SIZE};
    int32_t connection_recv_window_{DEFAULT_WINDOW_SIZE};
    uint32_t connection_recv_unacked_{0};

    StreamManager stream_manager_;
    uint32_t last_stream_id_{0};

    http::HPACKEncoder hpack_encoder_;
    http::HPACKDecoder hpack_decoder_;

    // Header block being assembled across HEADERS + CONTINUATION
    std::vector<uint8_t> header_block_;
    uint32_t header_stream_id_{0};
    uint8_t header_flags_{0};
    bool expecting_continuation_{false};

    // Unprocessed input (preface remainder, partial frames)
    std::vector<uint8_t> input_buffer_;
    size_t preface_bytes_validated_{0};

    // Output
    std::vector<uint8_t> control_out_;
    std::deque<uint32_t> send_queue_;      // Streams with something to send
    std::deque<uint32_t> conn_blocked_;    // Streams waiting on the connection window

    RequestCallback request_callback_;
    StreamEventCallback event_callback_;
};

} // namespace http2
} // namespace dualmeter
