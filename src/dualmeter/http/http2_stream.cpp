#include "http2_stream.h"

#include <climits>

namespace dualmeter {
namespace http2 {

using core::result;
using core::error_code;
using core::ok;
using core::err;

// Http2Stream implementation

Http2Stream::Http2Stream(uint32_t stream_id, int32_t send_window, int32_t recv_window)
    : stream_id_(stream_id),
      send_window_(send_window),
      recv_window_(recv_window) {}

void Http2Stream::on_headers_received(bool end_stream) noexcept {
    switch (state_) {
    case StreamState::IDLE:
        state_ = end_stream ? StreamState::HALF_CLOSED_REMOTE : StreamState::OPEN;
        break;
    case StreamState::OPEN:
        if (end_stream) {
            state_ = StreamState::HALF_CLOSED_REMOTE;
        }
        break;
    case StreamState::HALF_CLOSED_LOCAL:
        if (end_stream) {
            state_ = StreamState::CLOSED;
        }
        break;
    default:
        break;
    }
}

void Http2Stream::on_data_received(bool end_stream) noexcept {
    if (!end_stream) {
        return;
    }
    switch (state_) {
    case StreamState::OPEN:
        state_ = StreamState::HALF_CLOSED_REMOTE;
        break;
    case StreamState::HALF_CLOSED_LOCAL:
        state_ = StreamState::CLOSED;
        break;
    default:
        break;
    }
}

void Http2Stream::on_end_stream_sent() noexcept {
    switch (state_) {
    case StreamState::OPEN:
        state_ = StreamState::HALF_CLOSED_LOCAL;
        break;
    case StreamState::HALF_CLOSED_REMOTE:
        state_ = StreamState::CLOSED;
        break;
    default:
        break;
    }
}

void Http2Stream::on_rst_stream() noexcept {
    state_ = StreamState::CLOSED;
}

result<void> Http2Stream::update_send_window(int32_t increment) noexcept {
    if (increment <= 0) {
        return err(error_code::protocol_violation);
    }

    // RFC 7540 Section 6.9.1
    if (send_window_ > INT32_MAX - increment) {
        return err(error_code::protocol_violation);
    }

    send_window_ += increment;
    return ok();
}

result<void> Http2Stream::update_recv_window(int32_t increment) noexcept {
    if (increment <= 0 || recv_window_ > INT32_MAX - increment) {
        return err(error_code::internal_error);
    }

    recv_window_ += increment;
    return ok();
}

result<void> Http2Stream::consume_send_window(uint32_t size) noexcept {
    if (static_cast<int64_t>(size) > send_window_) {
        return err(error_code::internal_error);
    }

    send_window_ -= static_cast<int32_t>(size);
    return ok();
}

result<void> Http2Stream::consume_recv_window(uint32_t size) noexcept {
    if (static_cast<int64_t>(size) > recv_window_) {
        return err(error_code::protocol_violation);
    }

    recv_window_ -= static_cast<int32_t>(size);
    return ok();
}

// StreamManager implementation

StreamManager::StreamManager(int32_t initial_send_window, int32_t initial_recv_window)
    : initial_send_window_(initial_send_window),
      initial_recv_window_(initial_recv_window) {}

result<Http2Stream*> StreamManager::create_stream(uint32_t stream_id) noexcept {
    auto inserted = streams_.emplace(
        std::piecewise_construct,
        std::forward_as_tuple(stream_id),
        std::forward_as_tuple(stream_id, initial_send_window_, initial_recv_window_)
    );

    if (!inserted.second) {
        return error_code::invalid_state;
    }

    return &inserted.first->second;
}

Http2Stream* StreamManager::get_stream(uint32_t stream_id) noexcept {
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return nullptr;
    }
    return &it->second;
}

void StreamManager::remove_stream(uint32_t stream_id) noexcept {
    streams_.erase(stream_id);
}

result<void> StreamManager::update_initial_window_size(uint32_t new_size) noexcept {
    int64_t diff = static_cast<int64_t>(new_size) - initial_send_window_;

    for (auto& pair : streams_) {
        Http2Stream& stream = pair.second;
        int64_t updated = static_cast<int64_t>(stream.send_window_) + diff;
        if (updated > INT32_MAX) {
            return err(error_code::protocol_violation);
        }
        // May go negative (RFC 7540 Section 6.9.2)
        stream.send_window_ = static_cast<int32_t>(updated);
    }

    initial_send_window_ = static_cast<int32_t>(new_size);
    return ok();
}

} // namespace http2
} // namespace dualmeter
