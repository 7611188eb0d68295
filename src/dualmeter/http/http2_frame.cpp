#include "http2_frame.h"

#include <algorithm>
#include <cstring>

namespace dualmeter {
namespace http2 {

using core::ok;

static uint16_t read_uint16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

static uint32_t read_uint24(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 16) |
           (static_cast<uint32_t>(data[1]) << 8) |
           static_cast<uint32_t>(data[2]);
}

static uint32_t read_uint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

static void append_uint16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

static void append_uint32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

static void append_header(std::vector<uint8_t>& out, uint32_t length, FrameType type,
                          uint8_t flags, uint32_t stream_id) {
    uint8_t buf[FRAME_HEADER_SIZE];
    write_frame_header(FrameHeader(length, type, flags, stream_id), buf);
    out.insert(out.end(), buf, buf + FRAME_HEADER_SIZE);
}

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NO_ERROR: return "NO_ERROR";
        case ErrorCode::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::FLOW_CONTROL_ERROR: return "FLOW_CONTROL_ERROR";
        case ErrorCode::SETTINGS_TIMEOUT: return "SETTINGS_TIMEOUT";
        case ErrorCode::STREAM_CLOSED: return "STREAM_CLOSED";
        case ErrorCode::FRAME_SIZE_ERROR: return "FRAME_SIZE_ERROR";
        case ErrorCode::REFUSED_STREAM: return "REFUSED_STREAM";
        case ErrorCode::CANCEL: return "CANCEL";
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";
        case ErrorCode::CONNECT_ERROR: return "CONNECT_ERROR";
        case ErrorCode::ENHANCE_YOUR_CALM: return "ENHANCE_YOUR_CALM";
        case ErrorCode::INADEQUATE_SECURITY: return "INADEQUATE_SECURITY";
        case ErrorCode::HTTP_1_1_REQUIRED: return "HTTP_1_1_REQUIRED";
    }
    return "UNKNOWN";
}

FrameHeader parse_frame_header(const uint8_t* data) noexcept {
    FrameHeader header;
    header.length = read_uint24(data);
    header.type = static_cast<FrameType>(data[3]);
    header.flags = data[4];
    header.stream_id = read_uint32(data + 5) & 0x7FFFFFFF;  // drop reserved bit
    return header;
}

void write_frame_header(const FrameHeader& header, uint8_t* out) noexcept {
    out[0] = static_cast<uint8_t>(header.length >> 16);
    out[1] = static_cast<uint8_t>(header.length >> 8);
    out[2] = static_cast<uint8_t>(header.length);
    out[3] = static_cast<uint8_t>(header.type);
    out[4] = header.flags;
    uint32_t sid = header.stream_id & 0x7FFFFFFF;
    out[5] = static_cast<uint8_t>(sid >> 24);
    out[6] = static_cast<uint8_t>(sid >> 16);
    out[7] = static_cast<uint8_t>(sid >> 8);
    out[8] = static_cast<uint8_t>(sid);
}

result<void> unpad_payload(
    const FrameHeader& header,
    const uint8_t* payload,
    size_t& out_offset,
    size_t& out_length
) noexcept {
    size_t payload_len = header.length;
    size_t offset = 0;
    size_t pad_length = 0;

    if (header.flags & FrameFlags::PADDED) {
        if (payload_len < 1) {
            return core::err(error_code::protocol_violation);
        }
        pad_length = payload[0];
        offset = 1;
    }

    if (header.type == FrameType::HEADERS && (header.flags & FrameFlags::PRIORITY)) {
        offset += 5;  // stream dependency + weight, ignored
    }

    if (offset + pad_length > payload_len) {
        return core::err(error_code::protocol_violation);
    }

    out_offset = offset;
    out_length = payload_len - offset - pad_length;
    return ok();
}

result<std::vector<SettingsParameter>> parse_settings_frame(
    const uint8_t* payload,
    size_t payload_len
) {
    if (payload_len % 6 != 0) {
        return result<std::vector<SettingsParameter>>(error_code::protocol_violation);
    }

    std::vector<SettingsParameter> params;
    params.reserve(payload_len / 6);
    for (size_t offset = 0; offset < payload_len; offset += 6) {
        SettingsParameter param;
        param.id = static_cast<SettingsId>(read_uint16(payload + offset));
        param.value = read_uint32(payload + offset + 2);
        params.push_back(param);
    }
    return result<std::vector<SettingsParameter>>(std::move(params));
}

ErrorCode parse_rst_stream_frame(const uint8_t* payload) noexcept {
    return static_cast<ErrorCode>(read_uint32(payload));
}

uint32_t parse_window_update_frame(const uint8_t* payload) noexcept {
    return read_uint32(payload) & 0x7FFFFFFF;
}

result<GoawayInfo> parse_goaway_frame(const uint8_t* payload, size_t payload_len) {
    if (payload_len < 8) {
        return result<GoawayInfo>(error_code::protocol_violation);
    }

    GoawayInfo info;
    info.last_stream_id = read_uint32(payload) & 0x7FFFFFFF;
    info.error = static_cast<ErrorCode>(read_uint32(payload + 4));
    info.debug_data.assign(reinterpret_cast<const char*>(payload + 8), payload_len - 8);
    return result<GoawayInfo>(std::move(info));
}

void write_data_frame(std::vector<uint8_t>& out, uint32_t stream_id,
                      const uint8_t* data, size_t len, bool end_stream) {
    append_header(out, static_cast<uint32_t>(len), FrameType::DATA,
                  end_stream ? FrameFlags::END_STREAM : 0, stream_id);
    if (len > 0) {
        out.insert(out.end(), data, data + len);
    }
}

void write_headers_frames(std::vector<uint8_t>& out, uint32_t stream_id,
                          const std::vector<uint8_t>& header_block,
                          bool end_stream, uint32_t max_frame_size) {
    size_t total = header_block.size();
    size_t first = std::min<size_t>(total, max_frame_size);

    uint8_t flags = end_stream ? FrameFlags::END_STREAM : 0;
    if (first == total) {
        flags |= FrameFlags::END_HEADERS;
    }
    append_header(out, static_cast<uint32_t>(first), FrameType::HEADERS, flags, stream_id);
    out.insert(out.end(), header_block.begin(), header_block.begin() + first);

    size_t offset = first;
    while (offset < total) {
        size_t chunk = std::min<size_t>(total - offset, max_frame_size);
        uint8_t cont_flags = (offset + chunk == total) ? FrameFlags::END_HEADERS : 0;
        append_header(out, static_cast<uint32_t>(chunk), FrameType::CONTINUATION,
                      cont_flags, stream_id);
        out.insert(out.end(), header_block.begin() + offset,
                   header_block.begin() + offset + chunk);
        offset += chunk;
    }
}

void write_settings_frame(std::vector<uint8_t>& out,
                          const std::vector<SettingsParameter>& params) {
    append_header(out, static_cast<uint32_t>(params.size() * 6), FrameType::SETTINGS, 0, 0);
    for (const auto& param : params) {
        append_uint16(out, static_cast<uint16_t>(param.id));
        append_uint32(out, param.value);
    }
}

void write_settings_ack(std::vector<uint8_t>& out) {
    append_header(out, 0, FrameType::SETTINGS, FrameFlags::ACK, 0);
}

void write_window_update_frame(std::vector<uint8_t>& out, uint32_t stream_id,
                               uint32_t increment) {
    append_header(out, 4, FrameType::WINDOW_UPDATE, 0, stream_id);
    append_uint32(out, increment & 0x7FFFFFFF);
}

void write_ping_frame(std::vector<uint8_t>& out, const uint8_t* opaque_data, bool ack) {
    append_header(out, 8, FrameType::PING, ack ? FrameFlags::ACK : 0, 0);
    out.insert(out.end(), opaque_data, opaque_data + 8);
}

void write_goaway_frame(std::vector<uint8_t>& out, uint32_t last_stream_id,
                        ErrorCode error, const std::string& debug_data) {
    append_header(out, static_cast<uint32_t>(8 + debug_data.size()), FrameType::GOAWAY, 0, 0);
    append_uint32(out, last_stream_id & 0x7FFFFFFF);
    append_uint32(out, static_cast<uint32_t>(error));
    out.insert(out.end(), debug_data.begin(), debug_data.end());
}

void write_rst_stream_frame(std::vector<uint8_t>& out, uint32_t stream_id, ErrorCode error) {
    append_header(out, 4, FrameType::RST_STREAM, 0, stream_id);
    append_uint32(out, static_cast<uint32_t>(error));
}

} // namespace http2
} // namespace dualmeter
