#pragma once

#include "http3_frame.h"
#include "qpack/qpack_encoder.h"
#include "qpack/qpack_decoder.h"
#include "quic/quic_connection.h"
#include "../core/result.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dualmeter {
namespace http3 {

/**
 * Response progress notifications, same meaning as for HTTP/2.
 */
enum class StreamEvent : uint8_t {
    FIRST_BYTE,  // First response byte packetized
    COMPLETE,    // FIN packetized
    RESET        // Request abandoned before its response completed
};

struct ConnectionSettings {
    uint64_t max_field_section_size{16384};
    size_t send_buffer_target{256 * 1024};   // Bytes kept queued per response stream
};

/**
 * Decoded request head.
 */
struct Request {
    uint64_t stream_id{0};
    std::string method;
    std::string scheme;
    std::string authority;
    std::string path;
    std::vector<qpack::HeaderField> headers;   // Regular fields only
};

/**
 * Response collected in client mode.
 */
struct Response {
    uint64_t stream_id{0};
    uint16_t status{0};
    std::vector<qpack::HeaderField> headers;
    std::string body;
    bool complete{false};   // FIN received; false if reset or connection lost
};

/**
 * HTTP/3 connection (RFC 9114) layered on a QUICConnection.
 *
 * Server mode surfaces requests and streams responses; client mode issues
 * requests and collects responses. Both sides open a control stream with
 * SETTINGS once the QUIC handshake completes. QPACK runs with the static
 * table only, so no encoder or decoder streams are opened.
 *
 * Response bodies are fed into the QUIC send buffers incrementally, keeping
 * roughly send_buffer_target bytes queued per stream.
 */
class Http3Connection {
public:
    using RequestCallback = std::function<void(const Request& request)>;
    using StreamEventCallback = std::function<void(uint64_t stream_id, StreamEvent event)>;
    using ResponseCallback = std::function<void(const Response& response)>;
    using HandshakeCallback = std::function<void()>;

    explicit Http3Connection(std::unique_ptr<quic::QUICConnection> quic,
                             const ConnectionSettings& settings = ConnectionSettings());

    Http3Connection(const Http3Connection&) = delete;
    Http3Connection& operator=(const Http3Connection&) = delete;

    void process_datagram(const uint8_t* data, size_t len, uint64_t now) noexcept;
    size_t generate_datagram(uint8_t* out, size_t capacity, uint64_t now) noexcept;
    uint64_t next_timeout() const noexcept { return quic_->next_timeout(); }
    void on_timeout(uint64_t now) noexcept;

    /**
     * Stage a response: HEADERS, one DATA frame carrying the body, FIN.
     * HEAD responses and empty bodies carry no DATA frame.
     *
     * @param headers Response fields without :status, lowercase names
     * @return invalid_state if the request is gone or already answered
     */
    core::result<void> submit_response(
        uint64_t stream_id,
        uint16_t status,
        std::vector<qpack::HeaderField> headers,
        std::shared_ptr<const std::string> body
    );

    /**
     * Abandon a request stream in both directions.
     */
    void reset_stream(uint64_t stream_id, ErrorCode error);

    /**
     * Send GOAWAY. Requests on streams at or above the advertised id are
     * rejected with H3_REQUEST_REJECTED.
     *
     * @return false if already draining or closing
     */
    bool start_drain();

    /**
     * Draining and no request stream left.
     */
    bool is_drained() const noexcept { return draining_ && requests_.empty(); }

    /**
     * Close the connection with an HTTP/3 application error.
     */
    void close(ErrorCode error, const char* reason, uint64_t now) noexcept;

    quic::QUICConnection& quic() noexcept { return *quic_; }
    const quic::QUICConnection& quic() const noexcept { return *quic_; }

    bool is_closed() const noexcept { return quic_->is_closed(); }
    bool is_draining() const noexcept { return draining_; }
    bool handshake_complete() const noexcept { return quic_->handshake_complete(); }
    size_t active_requests() const noexcept { return requests_.size(); }

    bool peer_settings_received() const noexcept { return peer_settings_received_; }
    const Settings& peer_settings() const noexcept { return peer_settings_; }
    bool peer_goaway_received() const noexcept { return peer_goaway_; }
    uint64_t peer_goaway_id() const noexcept { return peer_goaway_id_; }

    void set_request_callback(RequestCallback callback) {
        request_callback_ = std::move(callback);
    }

    void set_stream_event_callback(StreamEventCallback callback) {
        event_callback_ = std::move(callback);
    }

    void set_response_callback(ResponseCallback callback) {
        response_callback_ = std::move(callback);
    }

    void set_handshake_callback(HandshakeCallback callback) {
        handshake_callback_ = std::move(callback);
    }

protected:
    /**
     * Client mode: collect the response on a request stream opened by the
     * caller, whose HEADERS and FIN are already queued.
     */
    void track_request(uint64_t stream_id, bool is_head);

    qpack::QPACKEncoder& encoder() noexcept { return encoder_; }

private:
    struct RequestStream {
        uint64_t id{0};

        // Receive side
        bool headers_done{false};
        bool is_head{false};
        bool recv_done{false};
        uint64_t frame_remaining{0};   // Payload bytes left in the current frame
        bool in_data{false};           // Current frame is DATA

        // Send side
        bool responded{false};
        std::vector<uint8_t> head;     // HEADERS frame plus DATA frame header
        size_t head_offset{0};
        std::shared_ptr<const std::string> body;
        size_t body_offset{0};
        bool fin_queued{false};
        bool first_byte{false};
        bool complete{false};

        Response response;             // Client mode
    };

    struct UniStream {
        bool type_known{false};
        uint64_t type{0};
        bool ignored{false};
        uint64_t frame_remaining{0};
    };

    void on_handshake_complete();
    void on_stream_readable(uint64_t stream_id);
    void on_stream_reset(uint64_t stream_id, uint64_t error_code);
    void on_stop_sending(uint64_t stream_id, uint64_t error_code);
    void on_stream_closed(uint64_t stream_id);
    void on_stream_sent(uint64_t stream_id, bool first_byte, bool fin);

    void process_request_stream(uint64_t stream_id);

    /**
     * Callbacks may drop the stream, so these take ids and return false
     * once the stream is gone.
     */
    bool handle_headers(uint64_t stream_id, const std::vector<uint8_t>& block);
    bool handle_request_headers(uint64_t stream_id, std::vector<qpack::HeaderField>& fields);
    bool handle_response_headers(uint64_t stream_id, std::vector<qpack::HeaderField>& fields);
    void finish_request_stream(uint64_t stream_id);

    void process_uni_stream(uint64_t stream_id);
    void process_control_frames(uint64_t stream_id, UniStream& us);
    bool handle_control_frame(const FrameHeader& header, const uint8_t* payload);

    /**
     * Top up response send buffers.
     */
    void pump() noexcept;

    /**
     * Close with an HTTP/3 error code.
     */
    void connection_error(ErrorCode error, const char* reason);

    /**
     * Reset and stop a request stream.
     */
    void stream_error(uint64_t stream_id, ErrorCode error);

    void notify(uint64_t stream_id, StreamEvent event);
    void check_teardown();

    std::unique_ptr<quic::QUICConnection> quic_;
    ConnectionSettings settings_;
    bool is_server_;
    uint64_t now_{0};

    qpack::QPACKEncoder encoder_;
    qpack::QPACKDecoder decoder_;

    int64_t control_stream_id_{-1};
    int64_t peer_control_stream_id_{-1};
    int64_t peer_encoder_stream_id_{-1};
    int64_t peer_decoder_stream_id_{-1};

    Settings local_settings_;
    Settings peer_settings_;
    bool peer_settings_received_{false};
    bool peer_goaway_{false};
    uint64_t peer_goaway_id_{UINT64_MAX};

    bool draining_{false};
    uint64_t goaway_id_{UINT64_MAX};    // First rejected request stream id
    int64_t highest_request_id_{-1};
    bool torn_down_{false};

    std::map<uint64_t, RequestStream> requests_;
    std::map<uint64_t, UniStream> uni_streams_;

    RequestCallback request_callback_;
    StreamEventCallback event_callback_;
    ResponseCallback response_callback_;
    HandshakeCallback handshake_callback_;
};

} // namespace http3
} // namespace dualmeter
