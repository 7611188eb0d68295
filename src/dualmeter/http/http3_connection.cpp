#include "http3_connection.h"
#include "../core/logger.h"
#include <algorithm>
#include <string>

namespace dualmeter {
namespace http3 {

namespace {

constexpr size_t kMaxControlFrame = 4096;
constexpr size_t kReadChunk = 16384;

inline unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

bool is_request_stream(uint64_t stream_id) noexcept { return (stream_id & 0x02) == 0; }
bool is_client_initiated(uint64_t stream_id) noexcept { return (stream_id & 0x01) == 0; }

bool has_uppercase(const std::string& name) noexcept {
    for (char c : name) {
        if (c >= 'A' && c <= 'Z') return true;
    }
    return false;
}

bool is_connection_specific(const qpack::HeaderField& field) noexcept {
    const std::string& n = field.name;
    if (n == "connection" || n == "keep-alive" || n == "proxy-connection" ||
        n == "transfer-encoding" || n == "upgrade") {
        return true;
    }
    return n == "te" && field.value != "trailers";
}

} // namespace

Http3Connection::Http3Connection(std::unique_ptr<quic::QUICConnection> quic,
                                 const ConnectionSettings& settings)
    : quic_(std::move(quic)),
      settings_(settings),
      is_server_(quic_->is_server()),
      decoder_(settings.max_field_section_size) {
    local_settings_.max_field_section_size = settings.max_field_section_size;

    quic::QUICConnection::Callbacks callbacks;
    callbacks.on_handshake_complete = [this]() { on_handshake_complete(); };
    callbacks.on_stream_readable = [this](uint64_t id) { on_stream_readable(id); };
    callbacks.on_stream_reset = [this](uint64_t id, uint64_t code) { on_stream_reset(id, code); };
    callbacks.on_stop_sending = [this](uint64_t id, uint64_t code) { on_stop_sending(id, code); };
    callbacks.on_stream_closed = [this](uint64_t id) { on_stream_closed(id); };
    callbacks.on_stream_sent = [this](uint64_t id, bool first, bool fin) {
        on_stream_sent(id, first, fin);
    };
    quic_->set_callbacks(std::move(callbacks));
}

// ============================================================================
// Transport I/O
// ============================================================================

void Http3Connection::process_datagram(const uint8_t* data, size_t len, uint64_t now) noexcept {
    now_ = now;
    quic_->process_datagram(data, len, now);
    check_teardown();
}

size_t Http3Connection::generate_datagram(uint8_t* out, size_t capacity, uint64_t now) noexcept {
    now_ = now;
    pump();
    size_t n = quic_->generate_datagram(out, capacity, now);
    check_teardown();
    return n;
}

void Http3Connection::on_timeout(uint64_t now) noexcept {
    now_ = now;
    quic_->on_timeout(now);
    check_teardown();
}

void Http3Connection::close(ErrorCode error, const char* reason, uint64_t now) noexcept {
    now_ = now;
    quic_->close(static_cast<uint64_t>(error), true, reason, now);
    check_teardown();
}

// ============================================================================
// QUIC callbacks
// ============================================================================

void Http3Connection::on_handshake_complete() {
    int64_t id = quic_->open_stream(false);
    if (id < 0) {
        connection_error(ErrorCode::STREAM_CREATION_ERROR, "no unidirectional stream credit");
        return;
    }
    control_stream_id_ = id;

    std::vector<uint8_t> out;
    write_varint(static_cast<uint64_t>(UniStreamType::CONTROL), out);
    write_settings(local_settings_, out);
    if (draining_) {
        write_goaway(goaway_id_, out);
    }
    quic_->write_stream(static_cast<uint64_t>(id), out.data(), out.size());

    LOG_DEBUG("HTTP3", "conn=%llu control stream %lld opened",
              ull(quic_->conn_id()), static_cast<long long>(id));

    if (handshake_callback_) handshake_callback_();
}

void Http3Connection::on_stream_readable(uint64_t stream_id) {
    if (quic_->is_closing() || quic_->is_closed()) return;
    if (is_request_stream(stream_id)) {
        process_request_stream(stream_id);
    } else {
        process_uni_stream(stream_id);
    }
}

void Http3Connection::on_stream_reset(uint64_t stream_id, uint64_t error_code) {
    if (static_cast<int64_t>(stream_id) == peer_control_stream_id_) {
        connection_error(ErrorCode::CLOSED_CRITICAL_STREAM, "control stream reset");
        return;
    }

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return;
    RequestStream& rs = it->second;

    LOG_DEBUG("HTTP3", "conn=%llu stream=%llu reset by peer: %s",
              ull(quic_->conn_id()), ull(stream_id), error_code_name(error_code));

    if (is_server_) {
        if (rs.complete) {
            rs.recv_done = true;
            return;
        }
        quic_->reset_stream(stream_id, static_cast<uint64_t>(ErrorCode::REQUEST_CANCELLED));
        if (rs.headers_done) notify(stream_id, StreamEvent::RESET);
    } else {
        Response response = std::move(rs.response);
        requests_.erase(it);
        if (response_callback_) response_callback_(response);
        return;
    }
    requests_.erase(stream_id);
}

void Http3Connection::on_stop_sending(uint64_t stream_id, uint64_t error_code) {
    if (static_cast<int64_t>(stream_id) == control_stream_id_) {
        connection_error(ErrorCode::CLOSED_CRITICAL_STREAM, "control stream stopped");
        return;
    }

    auto it = requests_.find(stream_id);
    if (it == requests_.end() || !is_server_) return;

    LOG_DEBUG("HTTP3", "conn=%llu stream=%llu STOP_SENDING: %s",
              ull(quic_->conn_id()), ull(stream_id), error_code_name(error_code));

    if (!it->second.complete) {
        bool surfaced = it->second.headers_done;
        requests_.erase(it);
        quic_->stop_sending(stream_id, static_cast<uint64_t>(ErrorCode::REQUEST_CANCELLED));
        if (surfaced) notify(stream_id, StreamEvent::RESET);
    }
}

void Http3Connection::on_stream_closed(uint64_t stream_id) {
    uni_streams_.erase(stream_id);

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return;

    RequestStream rs = std::move(it->second);
    requests_.erase(it);
    if (is_server_) {
        if (rs.headers_done && !rs.complete) notify(stream_id, StreamEvent::RESET);
    } else if (response_callback_) {
        response_callback_(rs.response);
    }
}

void Http3Connection::on_stream_sent(uint64_t stream_id, bool first_byte, bool fin) {
    auto it = requests_.find(stream_id);
    if (it == requests_.end() || !is_server_) return;
    RequestStream& rs = it->second;

    if (first_byte && !rs.first_byte) {
        rs.first_byte = true;
        notify(stream_id, StreamEvent::FIRST_BYTE);
        it = requests_.find(stream_id);
        if (it == requests_.end()) return;
    }
    if (fin && !it->second.complete) {
        it->second.complete = true;
        bool recv_done = it->second.recv_done;
        notify(stream_id, StreamEvent::COMPLETE);
        // Response done; the rest of the request is not needed
        if (!recv_done) {
            quic_->stop_sending(stream_id, static_cast<uint64_t>(ErrorCode::NO_ERROR));
        }
    }
}

// ============================================================================
// Request streams
// ============================================================================

void Http3Connection::process_request_stream(uint64_t stream_id) {
    quic::QUICStream* qs = quic_->get_stream(stream_id);
    if (qs == nullptr || qs->receive_stopped()) return;

    if (requests_.find(stream_id) == requests_.end()) {
        if (!is_server_) {
            if (!is_client_initiated(stream_id)) {
                connection_error(ErrorCode::STREAM_CREATION_ERROR, "server-initiated bidirectional stream");
            } else {
                // Response for an abandoned request
                quic_->stop_sending(stream_id, static_cast<uint64_t>(ErrorCode::REQUEST_CANCELLED));
            }
            return;
        }
        if (qs->reset_sent()) return;
        if (draining_ && stream_id >= goaway_id_) {
            LOG_DEBUG("HTTP3", "conn=%llu stream=%llu rejected after GOAWAY",
                      ull(quic_->conn_id()), ull(stream_id));
            stream_error(stream_id, ErrorCode::REQUEST_REJECTED);
            return;
        }
        RequestStream rs;
        rs.id = stream_id;
        requests_.emplace(stream_id, std::move(rs));
        if (static_cast<int64_t>(stream_id) > highest_request_id_) {
            highest_request_id_ = static_cast<int64_t>(stream_id);
        }
    }

    uint8_t chunk[kReadChunk];
    while (true) {
        auto it = requests_.find(stream_id);
        if (it == requests_.end() || quic_->is_closing() || quic_->is_closed()) return;
        RequestStream& rs = it->second;

        qs = quic_->get_stream(stream_id);
        if (qs == nullptr || qs->receive_stopped()) return;
        const core::RingBuffer& buf = qs->recv_buffer();
        size_t avail = buf.available();

        if (rs.frame_remaining > 0) {
            if (avail == 0) break;
            size_t n = static_cast<size_t>(std::min<uint64_t>(rs.frame_remaining, avail));
            n = std::min(n, sizeof(chunk));
            if (!is_server_ && rs.in_data) {
                n = quic_->read_stream(stream_id, chunk, n);
                rs.response.body.append(reinterpret_cast<const char*>(chunk), n);
            } else {
                n = quic_->discard_stream(stream_id, n);
            }
            rs.frame_remaining -= n;
            continue;
        }

        if (avail == 0) break;

        uint8_t hdr[16];
        size_t peeked = buf.peek_at(0, hdr, std::min(avail, sizeof(hdr)));
        FrameHeader header;
        size_t header_len = 0;
        if (parse_frame_header(hdr, peeked, header, header_len) != 0) break;

        if (!allowed_on_request_stream(header.type)) {
            connection_error(ErrorCode::FRAME_UNEXPECTED, "control frame on request stream");
            return;
        }

        switch (static_cast<FrameType>(header.type)) {
            case FrameType::HEADERS: {
                if (header.length > settings_.max_field_section_size) {
                    stream_error(stream_id, ErrorCode::EXCESSIVE_LOAD);
                    return;
                }
                if (avail < header_len + header.length) {
                    if (qs->fin_received()) {
                        connection_error(ErrorCode::FRAME_ERROR, "truncated HEADERS frame");
                    }
                    return;
                }
                std::vector<uint8_t> block(static_cast<size_t>(header.length));
                quic_->discard_stream(stream_id, header_len);
                if (!block.empty()) {
                    quic_->read_stream(stream_id, block.data(), block.size());
                }
                if (!handle_headers(stream_id, block)) return;
                continue;
            }
            case FrameType::DATA:
                if (!rs.headers_done) {
                    connection_error(ErrorCode::FRAME_UNEXPECTED, "DATA before HEADERS");
                    return;
                }
                quic_->discard_stream(stream_id, header_len);
                rs.frame_remaining = header.length;
                rs.in_data = true;
                continue;
            case FrameType::PUSH_PROMISE:
                // Pushes are never enabled (no MAX_PUSH_ID is sent)
                connection_error(is_server_ ? ErrorCode::FRAME_UNEXPECTED : ErrorCode::ID_ERROR,
                                 "unexpected PUSH_PROMISE");
                return;
            default:
                // Reserved and unknown frame types are skipped
                quic_->discard_stream(stream_id, header_len);
                rs.frame_remaining = header.length;
                rs.in_data = false;
                continue;
        }
    }

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return;
    RequestStream& rs = it->second;
    qs = quic_->get_stream(stream_id);
    if (qs == nullptr || !qs->fin_received() || rs.recv_done) return;

    if (!qs->recv_buffer().is_empty() || rs.frame_remaining > 0) {
        connection_error(ErrorCode::FRAME_ERROR, "stream ended inside a frame");
        return;
    }
    finish_request_stream(stream_id);
}

bool Http3Connection::handle_headers(uint64_t stream_id, const std::vector<uint8_t>& block) {
    std::vector<qpack::HeaderField> fields;
    auto decoded = decoder_.decode_field_section(block.data(), block.size(), fields);
    if (decoded.is_err()) {
        connection_error(ErrorCode::QPACK_DECOMPRESSION_FAILED, "bad field section");
        return false;
    }

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return false;
    RequestStream& rs = it->second;

    if (rs.headers_done) {
        // Trailers carry nothing this endpoint uses
        return true;
    }
    if (is_server_) {
        return handle_request_headers(stream_id, fields);
    }
    return handle_response_headers(stream_id, fields);
}

bool Http3Connection::handle_request_headers(uint64_t stream_id,
                                             std::vector<qpack::HeaderField>& fields) {
    Request request;
    request.stream_id = stream_id;

    bool regular_seen = false;
    bool malformed = false;
    for (auto& field : fields) {
        if (has_uppercase(field.name)) {
            malformed = true;
            break;
        }
        if (!field.name.empty() && field.name[0] == ':') {
            if (regular_seen) {
                malformed = true;
                break;
            }
            std::string* target = nullptr;
            if (field.name == ":method") target = &request.method;
            else if (field.name == ":scheme") target = &request.scheme;
            else if (field.name == ":authority") target = &request.authority;
            else if (field.name == ":path") target = &request.path;
            if (target == nullptr || !target->empty()) {
                malformed = true;
                break;
            }
            *target = std::move(field.value);
            continue;
        }
        if (is_connection_specific(field)) {
            malformed = true;
            break;
        }
        regular_seen = true;
        request.headers.push_back(std::move(field));
    }

    if (!malformed) {
        if (request.method.empty()) {
            malformed = true;
        } else if (request.method != "CONNECT") {
            malformed = request.scheme.empty() || request.path.empty();
        }
    }
    if (malformed) {
        LOG_DEBUG("HTTP3", "conn=%llu stream=%llu malformed request",
                  ull(quic_->conn_id()), ull(stream_id));
        stream_error(stream_id, ErrorCode::MESSAGE_ERROR);
        return false;
    }

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return false;
    it->second.headers_done = true;
    it->second.is_head = request.method == "HEAD";

    LOG_DEBUG("HTTP3", "conn=%llu stream=%llu %s %s", ull(quic_->conn_id()),
              ull(stream_id), request.method.c_str(), request.path.c_str());

    if (request_callback_) request_callback_(request);
    return requests_.find(stream_id) != requests_.end();
}

bool Http3Connection::handle_response_headers(uint64_t stream_id,
                                              std::vector<qpack::HeaderField>& fields) {
    auto it = requests_.find(stream_id);
    RequestStream& rs = it->second;

    uint16_t status = 0;
    std::vector<qpack::HeaderField> regular;
    for (auto& field : fields) {
        if (field.name == ":status") {
            if (field.value.size() != 3 ||
                !std::all_of(field.value.begin(), field.value.end(),
                             [](char c) { return c >= '0' && c <= '9'; })) {
                break;
            }
            status = static_cast<uint16_t>(std::stoi(field.value));
        } else if (!field.name.empty() && field.name[0] != ':') {
            regular.push_back(std::move(field));
        }
    }

    if (status == 0) {
        stream_error(stream_id, ErrorCode::MESSAGE_ERROR);
        return false;
    }
    if (status < 200) {
        // Interim response; the final one follows
        return true;
    }
    rs.headers_done = true;
    rs.response.status = status;
    rs.response.headers = std::move(regular);
    return true;
}

void Http3Connection::finish_request_stream(uint64_t stream_id) {
    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return;
    RequestStream& rs = it->second;
    rs.recv_done = true;

    if (is_server_) {
        if (!rs.headers_done) {
            stream_error(stream_id, ErrorCode::REQUEST_INCOMPLETE);
        }
        return;
    }

    if (!rs.headers_done) {
        stream_error(stream_id, ErrorCode::MESSAGE_ERROR);
        return;
    }
    Response response = std::move(rs.response);
    response.complete = true;
    requests_.erase(it);
    if (response_callback_) response_callback_(response);
}

// ============================================================================
// Unidirectional streams
// ============================================================================

void Http3Connection::process_uni_stream(uint64_t stream_id) {
    quic::QUICStream* qs = quic_->get_stream(stream_id);
    if (qs == nullptr || qs->is_local() || qs->receive_stopped()) return;

    UniStream& us = uni_streams_[stream_id];

    if (!us.type_known) {
        const core::RingBuffer& buf = qs->recv_buffer();
        uint8_t tmp[8];
        size_t peeked = buf.peek_at(0, tmp, std::min<size_t>(buf.available(), sizeof(tmp)));
        uint64_t type = 0;
        int consumed = quic::VarInt::decode(tmp, peeked, type);
        if (consumed < 0) {
            if (qs->fin_received()) {
                // Stream closed before naming its type
                uni_streams_.erase(stream_id);
            }
            return;
        }
        quic_->discard_stream(stream_id, static_cast<size_t>(consumed));
        us.type_known = true;
        us.type = type;

        switch (static_cast<UniStreamType>(type)) {
            case UniStreamType::CONTROL:
                if (peer_control_stream_id_ >= 0) {
                    connection_error(ErrorCode::STREAM_CREATION_ERROR, "second control stream");
                    return;
                }
                peer_control_stream_id_ = static_cast<int64_t>(stream_id);
                break;
            case UniStreamType::PUSH:
                if (is_server_) {
                    connection_error(ErrorCode::STREAM_CREATION_ERROR, "push stream from client");
                    return;
                }
                connection_error(ErrorCode::ID_ERROR, "push stream without MAX_PUSH_ID");
                return;
            case UniStreamType::QPACK_ENCODER:
            case UniStreamType::QPACK_DECODER: {
                int64_t& slot = type == static_cast<uint64_t>(UniStreamType::QPACK_ENCODER)
                                    ? peer_encoder_stream_id_
                                    : peer_decoder_stream_id_;
                if (slot >= 0) {
                    connection_error(ErrorCode::STREAM_CREATION_ERROR, "duplicate QPACK stream");
                    return;
                }
                slot = static_cast<int64_t>(stream_id);
                us.ignored = true;
                break;
            }
            default:
                // Unknown and reserved stream types are refused
                us.ignored = true;
                quic_->stop_sending(stream_id, static_cast<uint64_t>(ErrorCode::STREAM_CREATION_ERROR));
                return;
        }
    }

    if (us.ignored) {
        // Dynamic table capacity is zero, so QPACK streams carry nothing
        // this decoder needs
        quic_->discard_stream(stream_id, qs->recv_buffer().available());
        return;
    }

    process_control_frames(stream_id, us);
}

void Http3Connection::process_control_frames(uint64_t stream_id, UniStream& us) {
    std::vector<uint8_t> payload;
    while (true) {
        if (quic_->is_closing() || quic_->is_closed()) return;
        quic::QUICStream* qs = quic_->get_stream(stream_id);
        if (qs == nullptr) return;
        const core::RingBuffer& buf = qs->recv_buffer();
        size_t avail = buf.available();

        if (us.frame_remaining > 0) {
            if (avail == 0) break;
            size_t n = static_cast<size_t>(std::min<uint64_t>(us.frame_remaining, avail));
            us.frame_remaining -= quic_->discard_stream(stream_id, n);
            continue;
        }
        if (avail == 0) break;

        uint8_t hdr[16];
        size_t peeked = buf.peek_at(0, hdr, std::min(avail, sizeof(hdr)));
        FrameHeader header;
        size_t header_len = 0;
        if (parse_frame_header(hdr, peeked, header, header_len) != 0) break;

        bool known = header.type == static_cast<uint64_t>(FrameType::SETTINGS) ||
                     header.type == static_cast<uint64_t>(FrameType::GOAWAY) ||
                     header.type == static_cast<uint64_t>(FrameType::MAX_PUSH_ID) ||
                     header.type == static_cast<uint64_t>(FrameType::CANCEL_PUSH);
        if (!known || !allowed_on_control_stream(header.type)) {
            if (!handle_control_frame(header, nullptr)) return;
            quic_->discard_stream(stream_id, header_len);
            us.frame_remaining = header.length;
            continue;
        }

        if (header.length > kMaxControlFrame) {
            connection_error(ErrorCode::EXCESSIVE_LOAD, "oversized control frame");
            return;
        }
        if (avail < header_len + header.length) break;

        payload.resize(static_cast<size_t>(header.length));
        quic_->discard_stream(stream_id, header_len);
        if (!payload.empty()) {
            quic_->read_stream(stream_id, payload.data(), payload.size());
        }
        if (!handle_control_frame(header, payload.data())) return;
    }

    quic::QUICStream* qs = quic_->get_stream(stream_id);
    if (qs != nullptr && qs->fin_received()) {
        connection_error(ErrorCode::CLOSED_CRITICAL_STREAM, "control stream closed");
    }
}

bool Http3Connection::handle_control_frame(const FrameHeader& header, const uint8_t* payload) {
    if (!peer_settings_received_) {
        if (header.type != static_cast<uint64_t>(FrameType::SETTINGS)) {
            connection_error(ErrorCode::MISSING_SETTINGS, "first control frame is not SETTINGS");
            return false;
        }
        if (parse_settings(payload, static_cast<size_t>(header.length), peer_settings_) != 0) {
            connection_error(ErrorCode::SETTINGS_ERROR, "malformed SETTINGS");
            return false;
        }
        peer_settings_received_ = true;
        LOG_DEBUG("HTTP3", "conn=%llu peer SETTINGS max_field_section_size=%llu",
                  ull(quic_->conn_id()), ull(peer_settings_.max_field_section_size));
        return true;
    }

    if (!allowed_on_control_stream(header.type)) {
        connection_error(ErrorCode::FRAME_UNEXPECTED, "frame not allowed on control stream");
        return false;
    }

    switch (static_cast<FrameType>(header.type)) {
        case FrameType::SETTINGS:
            connection_error(ErrorCode::FRAME_UNEXPECTED, "second SETTINGS");
            return false;
        case FrameType::GOAWAY: {
            uint64_t id = 0;
            int consumed = quic::VarInt::decode(payload, static_cast<size_t>(header.length), id);
            if (consumed < 0 || static_cast<uint64_t>(consumed) != header.length) {
                connection_error(ErrorCode::FRAME_ERROR, "malformed GOAWAY");
                return false;
            }
            if (!is_server_ && (!is_request_stream(id) || !is_client_initiated(id))) {
                connection_error(ErrorCode::ID_ERROR, "GOAWAY names a non-request stream");
                return false;
            }
            if (peer_goaway_ && id > peer_goaway_id_) {
                connection_error(ErrorCode::ID_ERROR, "GOAWAY id increased");
                return false;
            }
            peer_goaway_ = true;
            peer_goaway_id_ = id;
            LOG_DEBUG("HTTP3", "conn=%llu GOAWAY from peer: id=%llu", ull(quic_->conn_id()), ull(id));
            return true;
        }
        case FrameType::MAX_PUSH_ID:
            if (!is_server_) {
                connection_error(ErrorCode::FRAME_UNEXPECTED, "MAX_PUSH_ID from server");
                return false;
            }
            return true;
        default:
            // CANCEL_PUSH and unknown types
            return true;
    }
}

// ============================================================================
// Sending
// ============================================================================

core::result<void> Http3Connection::submit_response(
    uint64_t stream_id,
    uint16_t status,
    std::vector<qpack::HeaderField> headers,
    std::shared_ptr<const std::string> body) {

    auto it = requests_.find(stream_id);
    if (!is_server_ || it == requests_.end()) {
        return core::err(core::error_code::invalid_state);
    }
    RequestStream& rs = it->second;
    if (!rs.headers_done || rs.responded) {
        return core::err(core::error_code::invalid_state);
    }

    std::vector<uint8_t> block;
    encoder_.encode_response(status, headers, block);
    write_frame_header(FrameType::HEADERS, block.size(), rs.head);
    rs.head.insert(rs.head.end(), block.begin(), block.end());

    if (body && !body->empty() && !rs.is_head) {
        write_frame_header(FrameType::DATA, body->size(), rs.head);
        rs.body = std::move(body);
    }
    rs.responded = true;
    pump();
    return core::ok();
}

void Http3Connection::reset_stream(uint64_t stream_id, ErrorCode error) {
    stream_error(stream_id, error);
}

void Http3Connection::pump() noexcept {
    for (auto& entry : requests_) {
        RequestStream& rs = entry.second;
        if (!rs.responded || rs.fin_queued) continue;

        quic::QUICStream* qs = quic_->get_stream(rs.id);
        if (qs == nullptr || qs->reset_sent()) continue;

        while (qs->send_buffered() < settings_.send_buffer_target) {
            size_t room = settings_.send_buffer_target - qs->send_buffered();
            if (rs.head_offset < rs.head.size()) {
                size_t n = quic_->write_stream(rs.id, rs.head.data() + rs.head_offset,
                                               rs.head.size() - rs.head_offset);
                if (n == 0) break;
                rs.head_offset += n;
                continue;
            }
            if (rs.body && rs.body_offset < rs.body->size()) {
                size_t len = std::min(room, rs.body->size() - rs.body_offset);
                size_t n = quic_->write_stream(
                    rs.id, reinterpret_cast<const uint8_t*>(rs.body->data()) + rs.body_offset, len);
                if (n == 0) break;
                rs.body_offset += n;
                continue;
            }
            quic_->finish_stream(rs.id);
            rs.fin_queued = true;
            rs.head.clear();
            rs.head.shrink_to_fit();
            rs.body.reset();
            break;
        }
    }
}

void Http3Connection::track_request(uint64_t stream_id, bool is_head) {
    RequestStream rs;
    rs.id = stream_id;
    rs.is_head = is_head;
    rs.responded = true;
    rs.fin_queued = true;
    rs.response.stream_id = stream_id;
    requests_.emplace(stream_id, std::move(rs));
}

bool Http3Connection::start_drain() {
    if (draining_ || quic_->is_closing() || quic_->is_closed()) {
        return false;
    }
    draining_ = true;
    goaway_id_ = highest_request_id_ < 0 ? 0 : static_cast<uint64_t>(highest_request_id_) + 4;

    if (control_stream_id_ >= 0) {
        std::vector<uint8_t> out;
        write_goaway(goaway_id_, out);
        quic_->write_stream(static_cast<uint64_t>(control_stream_id_), out.data(), out.size());
    }
    LOG_DEBUG("HTTP3", "conn=%llu GOAWAY id=%llu, %zu request(s) in flight",
              ull(quic_->conn_id()), ull(goaway_id_), requests_.size());
    return true;
}

// ============================================================================
// Errors and teardown
// ============================================================================

void Http3Connection::connection_error(ErrorCode error, const char* reason) {
    LOG_WARN("HTTP3", "conn=%llu connection error %s: %s", ull(quic_->conn_id()),
             error_code_name(static_cast<uint64_t>(error)), reason);
    quic_->close(static_cast<uint64_t>(error), true, reason, now_);
}

void Http3Connection::stream_error(uint64_t stream_id, ErrorCode error) {
    quic_->stop_sending(stream_id, static_cast<uint64_t>(error));
    quic_->reset_stream(stream_id, static_cast<uint64_t>(error));

    auto it = requests_.find(stream_id);
    if (it == requests_.end()) return;
    RequestStream rs = std::move(it->second);
    requests_.erase(it);

    if (is_server_) {
        if (rs.headers_done && !rs.complete) notify(stream_id, StreamEvent::RESET);
    } else if (response_callback_) {
        response_callback_(rs.response);
    }
}

void Http3Connection::notify(uint64_t stream_id, StreamEvent event) {
    if (event_callback_) event_callback_(stream_id, event);
}

void Http3Connection::check_teardown() {
    if (torn_down_ || !(quic_->is_closing() || quic_->is_closed())) {
        return;
    }
    torn_down_ = true;

    std::map<uint64_t, RequestStream> remaining;
    remaining.swap(requests_);
    for (auto& entry : remaining) {
        RequestStream& rs = entry.second;
        if (is_server_) {
            if (rs.headers_done && !rs.complete) notify(entry.first, StreamEvent::RESET);
        } else if (response_callback_) {
            response_callback_(rs.response);
        }
    }
}

} // namespace http3
} // namespace dualmeter
