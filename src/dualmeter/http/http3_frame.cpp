#include "http3_frame.h"

namespace dualmeter {
namespace http3 {

using quic::VarInt;

int parse_frame_header(const uint8_t* data, size_t len,
                       FrameHeader& out_header, size_t& out_consumed) noexcept {
    if (data == nullptr || len == 0) {
        return -1;
    }

    size_t pos = 0;
    int consumed = VarInt::decode(data, len, out_header.type);
    if (consumed < 0) {
        return -1;
    }
    pos += consumed;

    consumed = VarInt::decode(data + pos, len - pos, out_header.length);
    if (consumed < 0) {
        return -1;
    }
    pos += consumed;

    out_consumed = pos;
    return 0;
}

int parse_settings(const uint8_t* data, size_t len, Settings& out_settings) noexcept {
    size_t pos = 0;
    bool seen_capacity = false;
    bool seen_field_size = false;
    bool seen_blocked = false;

    while (pos < len) {
        uint64_t id;
        int consumed = VarInt::decode(data + pos, len - pos, id);
        if (consumed < 0) return 1;
        pos += consumed;

        uint64_t value;
        consumed = VarInt::decode(data + pos, len - pos, value);
        if (consumed < 0) return 1;
        pos += consumed;

        switch (id) {
            case SETTINGS_QPACK_MAX_TABLE_CAPACITY:
                if (seen_capacity) return 1;
                seen_capacity = true;
                out_settings.qpack_max_table_capacity = value;
                break;
            case SETTINGS_MAX_FIELD_SECTION_SIZE:
                if (seen_field_size) return 1;
                seen_field_size = true;
                out_settings.max_field_section_size = value;
                break;
            case SETTINGS_QPACK_BLOCKED_STREAMS:
                if (seen_blocked) return 1;
                seen_blocked = true;
                out_settings.qpack_blocked_streams = value;
                break;
            case 0x02:  // HTTP/2 ENABLE_PUSH
            case 0x03:  // HTTP/2 MAX_CONCURRENT_STREAMS
            case 0x04:  // HTTP/2 INITIAL_WINDOW_SIZE
            case 0x05:  // HTTP/2 MAX_FRAME_SIZE
                return 1;
            default:
                break;  // Unknown or GREASE
        }
    }

    return 0;
}

bool allowed_on_request_stream(uint64_t type) noexcept {
    switch (static_cast<FrameType>(type)) {
        case FrameType::CANCEL_PUSH:
        case FrameType::SETTINGS:
        case FrameType::GOAWAY:
        case FrameType::MAX_PUSH_ID:
            return false;
        default:
            // HTTP/2 frame types with no HTTP/3 equivalent
            return !(type == 0x02 || type == 0x06 || type == 0x08 || type == 0x09);
    }
}

bool allowed_on_control_stream(uint64_t type) noexcept {
    switch (static_cast<FrameType>(type)) {
        case FrameType::DATA:
        case FrameType::HEADERS:
        case FrameType::PUSH_PROMISE:
            return false;
        default:
            return !(type == 0x02 || type == 0x06 || type == 0x08 || type == 0x09);
    }
}

void write_varint(uint64_t value, std::vector<uint8_t>& out) {
    uint8_t buf[8];
    size_t n = VarInt::encode(value, buf);
    out.insert(out.end(), buf, buf + n);
}

void write_frame_header(FrameType type, uint64_t length, std::vector<uint8_t>& out) {
    write_varint(static_cast<uint64_t>(type), out);
    write_varint(length, out);
}

void write_settings(const Settings& settings, std::vector<uint8_t>& out) {
    std::vector<uint8_t> payload;
    write_varint(SETTINGS_QPACK_MAX_TABLE_CAPACITY, payload);
    write_varint(settings.qpack_max_table_capacity, payload);
    write_varint(SETTINGS_MAX_FIELD_SECTION_SIZE, payload);
    write_varint(settings.max_field_section_size, payload);
    write_varint(SETTINGS_QPACK_BLOCKED_STREAMS, payload);
    write_varint(settings.qpack_blocked_streams, payload);

    write_frame_header(FrameType::SETTINGS, payload.size(), out);
    out.insert(out.end(), payload.begin(), payload.end());
}

void write_goaway(uint64_t id, std::vector<uint8_t>& out) {
    write_frame_header(FrameType::GOAWAY, VarInt::encoded_size(id), out);
    write_varint(id, out);
}

const char* error_code_name(uint64_t code) noexcept {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::NO_ERROR: return "H3_NO_ERROR";
        case ErrorCode::GENERAL_PROTOCOL_ERROR: return "H3_GENERAL_PROTOCOL_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "H3_INTERNAL_ERROR";
        case ErrorCode::STREAM_CREATION_ERROR: return "H3_STREAM_CREATION_ERROR";
        case ErrorCode::CLOSED_CRITICAL_STREAM: return "H3_CLOSED_CRITICAL_STREAM";
        case ErrorCode::FRAME_UNEXPECTED: return "H3_FRAME_UNEXPECTED";
        case ErrorCode::FRAME_ERROR: return "H3_FRAME_ERROR";
        case ErrorCode::EXCESSIVE_LOAD: return "H3_EXCESSIVE_LOAD";
        case ErrorCode::ID_ERROR: return "H3_ID_ERROR";
        case ErrorCode::SETTINGS_ERROR: return "H3_SETTINGS_ERROR";
        case ErrorCode::MISSING_SETTINGS: return "H3_MISSING_SETTINGS";
        case ErrorCode::REQUEST_REJECTED: return "H3_REQUEST_REJECTED";
        case ErrorCode::REQUEST_CANCELLED: return "H3_REQUEST_CANCELLED";
        case ErrorCode::REQUEST_INCOMPLETE: return "H3_REQUEST_INCOMPLETE";
        case ErrorCode::MESSAGE_ERROR: return "H3_MESSAGE_ERROR";
        case ErrorCode::QPACK_DECOMPRESSION_FAILED: return "QPACK_DECOMPRESSION_FAILED";
    }
    return "UNKNOWN";
}

} // namespace http3
} // namespace dualmeter
