#pragma once

#include "http2_frame.h"
#include "hpack.h"
#include "../core/result.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dualmeter {
namespace http2 {

/**
 * HTTP/2 Stream States (RFC 7540 Section 5.1)
 *
 * Server side only: push is never used, so the reserved states are absent.
 *
 *                          +--------+
 *                          |  idle  |
 *                          +--------+
 *                              | recv H
 *                              v
 *        +----------+  recv ES +--------+ send ES +----------+
 *        |   half   |<---------|  open  |-------->|   half   |
 *        |  closed  |          +--------+         |  closed  |
 *        | (remote) |              |              | (local)  |
 *        +----------+              | send R /     +----------+
 *             | send ES /          | recv R            | recv ES /
 *             | send R /           v                   | send R /
 *             | recv R        +--------+               | recv R
 *             `-------------->| closed |<--------------'
 *                             +--------+
 */
enum class StreamState : uint8_t {
    IDLE = 0,
    OPEN = 1,
    HALF_CLOSED_LOCAL = 2,   // We sent END_STREAM
    HALF_CLOSED_REMOTE = 3,  // Peer sent END_STREAM
    CLOSED = 4
};

/**
 * HTTP/2 Stream.
 *
 * One request/response exchange: state machine, flow-control windows,
 * decoded request headers and the response being emitted.
 */
class Http2Stream {
public:
    friend class StreamManager;

    Http2Stream(uint32_t stream_id, int32_t send_window, int32_t recv_window);

    uint32_t id() const noexcept { return stream_id_; }
    StreamState state() const noexcept { return state_; }

    /**
     * State transitions.
     */
    void on_headers_received(bool end_stream) noexcept;
    void on_data_received(bool end_stream) noexcept;
    void on_end_stream_sent() noexcept;
    void on_rst_stream() noexcept;

    bool is_closed() const noexcept { return state_ == StreamState::CLOSED; }

    bool can_send() const noexcept {
        return state_ == StreamState::OPEN || state_ == StreamState::HALF_CLOSED_REMOTE;
    }

    bool can_receive() const noexcept {
        return state_ == StreamState::OPEN || state_ == StreamState::HALF_CLOSED_LOCAL;
    }

    /**
     * Flow control - send window (may go negative after a SETTINGS change).
     */
    int32_t send_window() const noexcept { return send_window_; }
    int32_t recv_window() const noexcept { return recv_window_; }

    /**
     * Peer granted more send window (WINDOW_UPDATE).
     *
     * @return protocol_violation if the window would exceed 2^31-1
     */
    core::result<void> update_send_window(int32_t increment) noexcept;

    /**
     * We granted more receive window.
     */
    core::result<void> update_recv_window(int32_t increment) noexcept;

    core::result<void> consume_send_window(uint32_t size) noexcept;

    /**
     * @return protocol_violation if the peer overran the window
     */
    core::result<void> consume_recv_window(uint32_t size) noexcept;

    /**
     * Request headers (after HPACK decoding). Names are lowercase on the
     * wire, so lookups are case-insensitive by construction.
     */
    const std::unordered_map<std::string, std::string>& request_headers() const noexcept {
        return request_headers_;
    }

    void add_request_header(std::string name, std::string value) {
        auto it = request_headers_.find(name);
        if (it == request_headers_.end()) {
            request_headers_.emplace(std::move(name), std::move(value));
        } else if (name == "cookie") {
            it->second.append("; ").append(value);
        } else {
            it->second.append(", ").append(value);
        }
    }

    std::string request_header(const std::string& name) const {
        auto it = request_headers_.find(name);
        return it == request_headers_.end() ? std::string() : it->second;
    }

    /**
     * Response staged by the application, emitted by the connection.
     */
    void set_response(uint16_t status,
                      std::vector<http::HPACKHeader> headers,
                      std::shared_ptr<const std::string> body) {
        response_status_ = status;
        response_headers_ = std::move(headers);
        response_body_ = std::move(body);
        body_offset_ = 0;
        has_response_ = true;
    }

    bool has_response() const noexcept { return has_response_; }
    bool headers_sent() const noexcept { return headers_sent_; }
    bool response_complete() const noexcept { return response_complete_; }
    uint16_t response_status() const noexcept { return response_status_; }

    size_t body_remaining() const noexcept {
        return response_body_ ? response_body_->size() - body_offset_ : 0;
    }

    /**
     * Body bytes handed to the connection so far.
     */
    size_t body_sent() const noexcept { return body_offset_; }

    ErrorCode error_code() const noexcept { return error_code_; }
    void set_error_code(ErrorCode code) noexcept { error_code_ = code; }

private:
    friend class Http2Connection;

    uint32_t stream_id_;
    StreamState state_{StreamState::IDLE};

    int32_t send_window_;
    int32_t recv_window_;
    uint32_t recv_unacked_{0};  // Received DATA not yet returned by WINDOW_UPDATE

    std::unordered_map<std::string, std::string> request_headers_;

    bool has_response_{false};
    bool headers_sent_{false};
    bool response_complete_{false};
    bool queued_{false};        // In the connection's send queue
    uint16_t response_status_{200};
    std::vector<http::HPACKHeader> response_headers_;
    std::shared_ptr<const std::string> response_body_;
    size_t body_offset_{0};

    ErrorCode error_code_{ErrorCode::NO_ERROR};
};

/**
 * HTTP/2 Stream Manager.
 *
 * Owns all live streams of one connection.
 */
class StreamManager {
public:
    StreamManager(int32_t initial_send_window, int32_t initial_recv_window);

    /**
     * @return Stream pointer, or invalid_state if the id is in use
     */
    core::result<Http2Stream*> create_stream(uint32_t stream_id) noexcept;

    Http2Stream* get_stream(uint32_t stream_id) noexcept;

    void remove_stream(uint32_t stream_id) noexcept;

    size_t stream_count() const noexcept { return streams_.size(); }

    /**
     * Apply a new SETTINGS_INITIAL_WINDOW_SIZE from the peer to every open
     * stream (RFC 7540 Section 6.9.2).
     *
     * @return protocol_violation if any window would exceed 2^31-1
     */
    core::result<void> update_initial_window_size(uint32_t new_size) noexcept;

    int32_t initial_send_window() const noexcept { return initial_send_window_; }

    template<typename Fn>
    void for_each(Fn&& fn) {
        for (auto& pair : streams_) {
            fn(pair.second);
        }
    }

private:
    std::unordered_map<uint32_t, Http2Stream> streams_;
    int32_t initial_send_window_;
    int32_t initial_recv_window_;
};

} // namespace http2
} // namespace dualmeter
