#include "http2_connection.h"
#include "../core/logger.h"

#include <algorithm>
#include <climits>
#include <cstdio>
#include <cstring>

namespace dualmeter {
namespace http2 {

using core::result;
using core::error_code;
using core::ok;
using core::err;

namespace {

// Largest header block accepted across HEADERS + CONTINUATION
constexpr size_t MAX_HEADER_BLOCK = 256 * 1024;

bool has_uppercase(const std::string& name) noexcept {
    for (char c : name) {
        if (c >= 'A' && c <= 'Z') {
            return true;
        }
    }
    return false;
}

} // namespace

Http2Connection::Http2Connection(uint64_t conn_id, const ConnectionSettings& local)
    : conn_id_(conn_id),
      local_settings_(local),
      stream_manager_(DEFAULT_WINDOW_SIZE, static_cast<int32_t>(local.initial_window_size)),
      hpack_encoder_(http::HPACKDynamicTable::DEFAULT_MAX_SIZE),
      hpack_decoder_(local.header_table_size) {
    // Server connection preface (RFC 7540 Section 3.5)
    send_settings();
}

result<void> Http2Connection::process_input(const uint8_t* data, size_t len) {
    if (state_ == ConnectionState::CLOSED) {
        return err(error_code::invalid_state);
    }

    input_buffer_.insert(input_buffer_.end(), data, data + len);
    size_t pos = 0;

    if (state_ == ConnectionState::PREFACE_PENDING) {
        size_t needed = CONNECTION_PREFACE_LEN - preface_bytes_validated_;
        size_t available = std::min(needed, input_buffer_.size());

        if (std::memcmp(CONNECTION_PREFACE + preface_bytes_validated_,
                        input_buffer_.data(), available) != 0) {
            input_buffer_.clear();
            return connection_error(ErrorCode::PROTOCOL_ERROR, "invalid connection preface");
        }

        preface_bytes_validated_ += available;
        pos = available;

        if (preface_bytes_validated_ < CONNECTION_PREFACE_LEN) {
            input_buffer_.clear();
            return ok();
        }
        state_ = ConnectionState::ACTIVE;
    }

    while (input_buffer_.size() - pos >= FRAME_HEADER_SIZE) {
        FrameHeader header = parse_frame_header(input_buffer_.data() + pos);

        if (header.length > local_settings_.max_frame_size) {
            input_buffer_.clear();
            return connection_error(ErrorCode::FRAME_SIZE_ERROR, "frame exceeds SETTINGS_MAX_FRAME_SIZE");
        }

        size_t frame_size = FRAME_HEADER_SIZE + header.length;
        if (input_buffer_.size() - pos < frame_size) {
            break;
        }

        auto frame_result = process_frame(header, input_buffer_.data() + pos + FRAME_HEADER_SIZE);
        pos += frame_size;

        if (frame_result.is_err()) {
            input_buffer_.clear();
            return frame_result;
        }
    }

    input_buffer_.erase(input_buffer_.begin(), input_buffer_.begin() + pos);
    return ok();
}

result<void> Http2Connection::process_frame(const FrameHeader& header, const uint8_t* payload) {
    if (expecting_continuation_) {
        if (header.type != FrameType::CONTINUATION || header.stream_id != header_stream_id_) {
            return connection_error(ErrorCode::PROTOCOL_ERROR, "expected CONTINUATION");
        }
        return handle_continuation_frame(header, payload);
    }

    // First frame after the preface must be SETTINGS
    if (!settings_received_ && header.type != FrameType::SETTINGS) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "preface not followed by SETTINGS");
    }

    switch (header.type) {
    case FrameType::SETTINGS:
        return handle_settings_frame(header, payload);
    case FrameType::HEADERS:
        return handle_headers_frame(header, payload);
    case FrameType::CONTINUATION:
        return connection_error(ErrorCode::PROTOCOL_ERROR, "unexpected CONTINUATION");
    case FrameType::DATA:
        return handle_data_frame(header, payload);
    case FrameType::WINDOW_UPDATE:
        return handle_window_update_frame(header, payload);
    case FrameType::PING:
        return handle_ping_frame(header, payload);
    case FrameType::RST_STREAM:
        return handle_rst_stream_frame(header, payload);
    case FrameType::GOAWAY:
        return handle_goaway_frame(header, payload);
    case FrameType::PRIORITY:
        if (header.stream_id == 0) {
            return connection_error(ErrorCode::PROTOCOL_ERROR, "PRIORITY on stream 0");
        }
        if (header.length != 5) {
            stream_error(header.stream_id, ErrorCode::FRAME_SIZE_ERROR);
        }
        return ok();
    case FrameType::PUSH_PROMISE:
        return connection_error(ErrorCode::PROTOCOL_ERROR, "PUSH_PROMISE from client");
    default:
        // Unknown frame types are ignored (RFC 7540 Section 4.1)
        return ok();
    }
}

// ============================================================================
// Frame handlers
// ============================================================================

result<void> Http2Connection::handle_settings_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id != 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "SETTINGS on a stream");
    }

    if (header.flags & FrameFlags::ACK) {
        if (header.length != 0) {
            return connection_error(ErrorCode::FRAME_SIZE_ERROR, "SETTINGS ACK with payload");
        }
        return ok();
    }

    auto params = parse_settings_frame(payload, header.length);
    if (params.is_err()) {
        return connection_error(ErrorCode::FRAME_SIZE_ERROR, "SETTINGS length not a multiple of 6");
    }

    auto applied = apply_settings(params.value());
    if (applied.is_err()) {
        return applied;
    }

    settings_received_ = true;
    write_settings_ack(control_out_);
    return ok();
}

result<void> Http2Connection::apply_settings(const std::vector<SettingsParameter>& params) {
    for (const auto& param : params) {
        switch (param.id) {
        case SettingsId::HEADER_TABLE_SIZE:
            remote_settings_.header_table_size = param.value;
            hpack_encoder_.set_max_table_size(param.value);
            break;
        case SettingsId::ENABLE_PUSH:
            if (param.value > 1) {
                return connection_error(ErrorCode::PROTOCOL_ERROR, "invalid SETTINGS_ENABLE_PUSH");
            }
            remote_settings_.enable_push = (param.value != 0);
            break;
        case SettingsId::MAX_CONCURRENT_STREAMS:
            remote_settings_.max_concurrent_streams = param.value;
            break;
        case SettingsId::INITIAL_WINDOW_SIZE: {
            if (param.value > static_cast<uint32_t>(MAX_WINDOW_SIZE)) {
                return connection_error(ErrorCode::FLOW_CONTROL_ERROR, "SETTINGS_INITIAL_WINDOW_SIZE too large");
            }
            if (stream_manager_.update_initial_window_size(param.value).is_err()) {
                return connection_error(ErrorCode::FLOW_CONTROL_ERROR, "stream window overflow");
            }
            remote_settings_.initial_window_size = param.value;
            // Streams blocked on their own window may now proceed
            stream_manager_.for_each([this](Http2Stream& stream) {
                if (!stream.queued_ && stream.headers_sent_ && !stream.response_complete_ &&
                    stream.send_window_ > 0) {
                    enqueue_stream(stream);
                }
            });
            break;
        }
        case SettingsId::MAX_FRAME_SIZE:
            if (param.value < DEFAULT_MAX_FRAME_SIZE || param.value > MAX_ALLOWED_FRAME_SIZE) {
                return connection_error(ErrorCode::PROTOCOL_ERROR, "invalid SETTINGS_MAX_FRAME_SIZE");
            }
            remote_settings_.max_frame_size = param.value;
            break;
        case SettingsId::MAX_HEADER_LIST_SIZE:
            remote_settings_.max_header_list_size = param.value;
            break;
        default:
            // Unknown settings are ignored
            break;
        }
    }
    return ok();
}

result<void> Http2Connection::handle_headers_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id == 0 || (header.stream_id & 1) == 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "HEADERS on invalid stream id");
    }

    size_t offset = 0;
    size_t length = 0;
    if (unpad_payload(header, payload, offset, length).is_err()) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "bad HEADERS padding");
    }

    header_block_.assign(payload + offset, payload + offset + length);
    header_stream_id_ = header.stream_id;
    header_flags_ = header.flags;

    if (header.flags & FrameFlags::END_HEADERS) {
        return finish_header_block();
    }

    expecting_continuation_ = true;
    return ok();
}

result<void> Http2Connection::handle_continuation_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header_block_.size() + header.length > MAX_HEADER_BLOCK) {
        return connection_error(ErrorCode::ENHANCE_YOUR_CALM, "header block too large");
    }

    header_block_.insert(header_block_.end(), payload, payload + header.length);

    if (header.flags & FrameFlags::END_HEADERS) {
        expecting_continuation_ = false;
        return finish_header_block();
    }
    return ok();
}

result<void> Http2Connection::finish_header_block() {
    // Always decode, so the HPACK state stays in sync even for refused streams
    std::vector<http::HPACKHeader> decoded;
    if (hpack_decoder_.decode(header_block_.data(), header_block_.size(), decoded,
                              local_settings_.max_header_list_size) != 0) {
        return connection_error(ErrorCode::COMPRESSION_ERROR, "HPACK decoding failed");
    }
    header_block_.clear();

    const uint32_t stream_id = header_stream_id_;
    const bool end_stream = (header_flags_ & FrameFlags::END_STREAM) != 0;

    Http2Stream* existing = stream_manager_.get_stream(stream_id);
    if (existing) {
        // Trailers: must end the stream
        if (!existing->can_receive()) {
            stream_error(stream_id, ErrorCode::STREAM_CLOSED);
        } else if (!end_stream) {
            stream_error(stream_id, ErrorCode::PROTOCOL_ERROR);
        } else {
            existing->on_headers_received(true);
        }
        return ok();
    }

    if (stream_id <= last_stream_id_) {
        // Stream already finished and dropped
        stream_error(stream_id, ErrorCode::STREAM_CLOSED);
        return ok();
    }
    last_stream_id_ = stream_id;

    if (state_ != ConnectionState::ACTIVE ||
        stream_manager_.stream_count() >= local_settings_.max_concurrent_streams) {
        LOG_DEBUG("HTTP2", "conn=%llu stream=%u refused", (unsigned long long)conn_id_, stream_id);
        write_rst_stream_frame(control_out_, stream_id, ErrorCode::REFUSED_STREAM);
        return ok();
    }

    // Request validation (RFC 7540 Section 8.1.2)
    bool has_method = false, has_path = false, has_scheme = false;
    bool regular_seen = false;
    for (const auto& field : decoded) {
        if (has_uppercase(field.name)) {
            stream_error(stream_id, ErrorCode::PROTOCOL_ERROR);
            return ok();
        }
        if (!field.name.empty() && field.name[0] == ':') {
            if (regular_seen) {
                stream_error(stream_id, ErrorCode::PROTOCOL_ERROR);
                return ok();
            }
            has_method |= field.name == ":method";
            has_path |= field.name == ":path" && !field.value.empty();
            has_scheme |= field.name == ":scheme";
        } else {
            regular_seen = true;
        }
    }
    if (!has_method || !has_path || !has_scheme) {
        stream_error(stream_id, ErrorCode::PROTOCOL_ERROR);
        return ok();
    }

    auto created = stream_manager_.create_stream(stream_id);
    if (created.is_err()) {
        return connection_error(ErrorCode::INTERNAL_ERROR, "stream id collision");
    }
    Http2Stream* stream = created.value();

    for (auto& field : decoded) {
        stream->add_request_header(std::move(field.name), std::move(field.value));
    }
    stream->on_headers_received(end_stream);

    LOG_DEBUG("HTTP2", "conn=%llu stream=%u %s %s", (unsigned long long)conn_id_, stream_id,
              stream->request_header(":method").c_str(), stream->request_header(":path").c_str());

    if (request_callback_) {
        request_callback_(*stream, end_stream);
    }
    return ok();
}

result<void> Http2Connection::handle_data_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id == 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "DATA on stream 0");
    }

    // Connection window covers the whole payload including padding
    if (static_cast<int64_t>(header.length) > connection_recv_window_) {
        return connection_error(ErrorCode::FLOW_CONTROL_ERROR, "connection window exceeded");
    }
    connection_recv_window_ -= static_cast<int32_t>(header.length);
    connection_recv_unacked_ += header.length;

    if (connection_recv_unacked_ >= static_cast<uint32_t>(DEFAULT_WINDOW_SIZE / 2)) {
        write_window_update_frame(control_out_, 0, connection_recv_unacked_);
        connection_recv_window_ += static_cast<int32_t>(connection_recv_unacked_);
        connection_recv_unacked_ = 0;
    }

    Http2Stream* stream = stream_manager_.get_stream(header.stream_id);
    if (!stream) {
        if (header.stream_id > last_stream_id_) {
            return connection_error(ErrorCode::PROTOCOL_ERROR, "DATA on idle stream");
        }
        // Frames in flight for a stream we already finished
        return ok();
    }

    if (!stream->can_receive()) {
        stream_error(header.stream_id, ErrorCode::STREAM_CLOSED);
        return ok();
    }

    size_t offset = 0;
    size_t length = 0;
    if (unpad_payload(header, payload, offset, length).is_err()) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "bad DATA padding");
    }

    if (stream->consume_recv_window(header.length).is_err()) {
        stream_error(header.stream_id, ErrorCode::FLOW_CONTROL_ERROR);
        return ok();
    }

    // Request bodies are not used by any route; only flow control matters
    const bool end_stream = (header.flags & FrameFlags::END_STREAM) != 0;
    stream->on_data_received(end_stream);

    if (!end_stream) {
        stream->recv_unacked_ += header.length;
        if (stream->recv_unacked_ >= local_settings_.initial_window_size / 2) {
            write_window_update_frame(control_out_, stream->id(), stream->recv_unacked_);
            (void)stream->update_recv_window(static_cast<int32_t>(stream->recv_unacked_));
            stream->recv_unacked_ = 0;
        }
    }
    return ok();
}

result<void> Http2Connection::handle_window_update_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.length != 4) {
        return connection_error(ErrorCode::FRAME_SIZE_ERROR, "WINDOW_UPDATE length != 4");
    }

    uint32_t increment = parse_window_update_frame(payload);

    if (header.stream_id == 0) {
        if (increment == 0) {
            return connection_error(ErrorCode::PROTOCOL_ERROR, "zero WINDOW_UPDATE increment");
        }
        if (static_cast<int64_t>(connection_send_window_) + increment > MAX_WINDOW_SIZE) {
            return connection_error(ErrorCode::FLOW_CONTROL_ERROR, "connection window overflow");
        }
        connection_send_window_ += static_cast<int32_t>(increment);

        while (!conn_blocked_.empty()) {
            send_queue_.push_back(conn_blocked_.front());
            conn_blocked_.pop_front();
        }
        return ok();
    }

    Http2Stream* stream = stream_manager_.get_stream(header.stream_id);
    if (!stream) {
        if (header.stream_id > last_stream_id_) {
            return connection_error(ErrorCode::PROTOCOL_ERROR, "WINDOW_UPDATE on idle stream");
        }
        return ok();
    }

    if (increment == 0) {
        stream_error(header.stream_id, ErrorCode::PROTOCOL_ERROR);
        return ok();
    }

    if (stream->update_send_window(static_cast<int32_t>(increment)).is_err()) {
        stream_error(header.stream_id, ErrorCode::FLOW_CONTROL_ERROR);
        return ok();
    }

    if (!stream->queued_ && stream->has_response_ && !stream->response_complete_ &&
        stream->send_window_ > 0) {
        enqueue_stream(*stream);
    }
    return ok();
}

result<void> Http2Connection::handle_ping_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id != 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "PING on a stream");
    }
    if (header.length != 8) {
        return connection_error(ErrorCode::FRAME_SIZE_ERROR, "PING length != 8");
    }

    if (!(header.flags & FrameFlags::ACK)) {
        write_ping_frame(control_out_, payload, true);
    }
    return ok();
}

result<void> Http2Connection::handle_rst_stream_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id == 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "RST_STREAM on stream 0");
    }
    if (header.length != 4) {
        return connection_error(ErrorCode::FRAME_SIZE_ERROR, "RST_STREAM length != 4");
    }
    if (header.stream_id > last_stream_id_) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "RST_STREAM on idle stream");
    }

    Http2Stream* stream = stream_manager_.get_stream(header.stream_id);
    if (!stream) {
        return ok();
    }

    ErrorCode code = parse_rst_stream_frame(payload);
    LOG_DEBUG("HTTP2", "conn=%llu stream=%u reset by peer: %s",
              (unsigned long long)conn_id_, header.stream_id, error_code_name(code));

    stream->on_rst_stream();
    stream->set_error_code(code);
    if (!stream->response_complete_) {
        notify(*stream, StreamEvent::RESET);
    }
    stream_manager_.remove_stream(header.stream_id);
    return ok();
}

result<void> Http2Connection::handle_goaway_frame(const FrameHeader& header, const uint8_t* payload) {
    if (header.stream_id != 0) {
        return connection_error(ErrorCode::PROTOCOL_ERROR, "GOAWAY on a stream");
    }

    auto info = parse_goaway_frame(payload, header.length);
    if (info.is_err()) {
        return connection_error(ErrorCode::FRAME_SIZE_ERROR, "GOAWAY too short");
    }

    LOG_DEBUG("HTTP2", "conn=%llu GOAWAY from peer: %s last_stream=%u",
              (unsigned long long)conn_id_, error_code_name(info.value().error),
              info.value().last_stream_id);
    peer_goaway_ = true;
    return ok();
}

// ============================================================================
// Responses and output
// ============================================================================

result<void> Http2Connection::submit_response(
    uint32_t stream_id,
    uint16_t status,
    std::vector<http::HPACKHeader> headers,
    std::shared_ptr<const std::string> body
) {
    Http2Stream* stream = stream_manager_.get_stream(stream_id);
    if (!stream || stream->has_response_ || !stream->can_send()) {
        return err(error_code::invalid_state);
    }

    stream->set_response(status, std::move(headers), std::move(body));
    enqueue_stream(*stream);
    return ok();
}

void Http2Connection::reset_stream(uint32_t stream_id, ErrorCode error) {
    stream_error(stream_id, error);
}

bool Http2Connection::start_drain() {
    if (state_ != ConnectionState::ACTIVE && state_ != ConnectionState::PREFACE_PENDING) {
        return false;
    }
    write_goaway_frame(control_out_, last_stream_id_, ErrorCode::NO_ERROR);
    state_ = ConnectionState::GOAWAY_SENT;
    return true;
}

size_t Http2Connection::produce_output(std::vector<uint8_t>& out, size_t budget) {
    const size_t start = out.size();

    out.insert(out.end(), control_out_.begin(), control_out_.end());
    control_out_.clear();

    while (!send_queue_.empty() && out.size() - start < budget) {
        uint32_t stream_id = send_queue_.front();
        send_queue_.pop_front();

        Http2Stream* stream = stream_manager_.get_stream(stream_id);
        if (!stream || stream->response_complete_) {
            continue;
        }
        stream->queued_ = false;

        if (!stream->headers_sent_) {
            // Encode at emission time so HPACK table order matches wire order
            std::vector<http::HPACKHeader> fields;
            fields.reserve(stream->response_headers_.size() + 1);
            char status_buf[8];
            std::snprintf(status_buf, sizeof(status_buf), "%u", stream->response_status_);
            fields.push_back({":status", status_buf, false});
            for (auto& field : stream->response_headers_) {
                fields.push_back(std::move(field));
            }
            stream->response_headers_.clear();

            std::vector<uint8_t> block;
            hpack_encoder_.encode(fields, block);

            const bool end_stream = stream->body_remaining() == 0;
            write_headers_frames(out, stream_id, block, end_stream, remote_settings_.max_frame_size);
            stream->headers_sent_ = true;
            notify(*stream, StreamEvent::FIRST_BYTE);

            if (end_stream) {
                finish_stream(*stream, out);
            } else {
                enqueue_stream(*stream);
            }
            continue;
        }

        if (connection_send_window_ <= 0) {
            stream->queued_ = true;
            conn_blocked_.push_back(stream_id);
            continue;
        }
        if (stream->send_window_ <= 0) {
            // Re-queued by WINDOW_UPDATE or SETTINGS
            continue;
        }

        size_t chunk = stream->body_remaining();
        chunk = std::min(chunk, static_cast<size_t>(stream->send_window_));
        chunk = std::min(chunk, static_cast<size_t>(connection_send_window_));
        chunk = std::min(chunk, static_cast<size_t>(remote_settings_.max_frame_size));

        const bool end_stream = chunk == stream->body_remaining();
        const uint8_t* data = reinterpret_cast<const uint8_t*>(stream->response_body_->data()) +
                              stream->body_offset_;
        write_data_frame(out, stream_id, data, chunk, end_stream);

        (void)stream->consume_send_window(static_cast<uint32_t>(chunk));
        connection_send_window_ -= static_cast<int32_t>(chunk);
        stream->body_offset_ += chunk;

        if (end_stream) {
            finish_stream(*stream, out);
        } else {
            enqueue_stream(*stream);
        }
    }

    return out.size() - start;
}

void Http2Connection::finish_stream(Http2Stream& stream, std::vector<uint8_t>& out) {
    const uint32_t stream_id = stream.id();
    stream.response_complete_ = true;
    stream.on_end_stream_sent();
    notify(stream, StreamEvent::COMPLETE);

    if (!stream.is_closed()) {
        // Client still sending a body nobody reads (RFC 7540 Section 8.1)
        write_rst_stream_frame(out, stream_id, ErrorCode::NO_ERROR);
    }
    stream_manager_.remove_stream(stream_id);
}

void Http2Connection::enqueue_stream(Http2Stream& stream) {
    if (!stream.queued_) {
        stream.queued_ = true;
        send_queue_.push_back(stream.id());
    }
}

void Http2Connection::notify(const Http2Stream& stream, StreamEvent event) {
    if (event_callback_) {
        event_callback_(stream, event);
    }
}

// ============================================================================
// Errors and settings
// ============================================================================

result<void> Http2Connection::connection_error(ErrorCode error, const char* reason) {
    LOG_WARN("HTTP2", "conn=%llu connection error %s: %s",
             (unsigned long long)conn_id_, error_code_name(error), reason);

    if (state_ != ConnectionState::CLOSED) {
        write_goaway_frame(control_out_, last_stream_id_, error, reason);
        state_ = ConnectionState::CLOSED;
        last_error_ = error;
    }
    send_queue_.clear();
    conn_blocked_.clear();
    return err(error_code::protocol_violation);
}

void Http2Connection::stream_error(uint32_t stream_id, ErrorCode error) {
    LOG_DEBUG("HTTP2", "conn=%llu stream=%u stream error %s",
              (unsigned long long)conn_id_, stream_id, error_code_name(error));

    write_rst_stream_frame(control_out_, stream_id, error);

    Http2Stream* stream = stream_manager_.get_stream(stream_id);
    if (!stream) {
        return;
    }
    stream->on_rst_stream();
    stream->set_error_code(error);
    if (!stream->response_complete_) {
        notify(*stream, StreamEvent::RESET);
    }
    stream_manager_.remove_stream(stream_id);
}

void Http2Connection::send_settings() {
    std::vector<SettingsParameter> params;
    params.push_back({SettingsId::HEADER_TABLE_SIZE, local_settings_.header_table_size});
    params.push_back({SettingsId::ENABLE_PUSH, 0u});
    params.push_back({SettingsId::MAX_CONCURRENT_STREAMS, local_settings_.max_concurrent_streams});
    params.push_back({SettingsId::INITIAL_WINDOW_SIZE, local_settings_.initial_window_size});
    params.push_back({SettingsId::MAX_FRAME_SIZE, local_settings_.max_frame_size});
    params.push_back({SettingsId::MAX_HEADER_LIST_SIZE, local_settings_.max_header_list_size});

    write_settings_frame(control_out_, params);
}

} // namespace http2
} // namespace dualmeter
