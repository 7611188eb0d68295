#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../core/result.h"

namespace dualmeter {
namespace http2 {

/**
 * HTTP/2 Frame Types (RFC 7540 Section 6)
 */
enum class FrameType : uint8_t {
    DATA          = 0x0,
    HEADERS       = 0x1,
    PRIORITY      = 0x2,
    RST_STREAM    = 0x3,
    SETTINGS      = 0x4,
    PUSH_PROMISE  = 0x5,
    PING          = 0x6,
    GOAWAY        = 0x7,
    WINDOW_UPDATE = 0x8,
    CONTINUATION  = 0x9
};

/**
 * Frame Flags (RFC 7540 Section 6)
 */
namespace FrameFlags {
    constexpr uint8_t END_STREAM  = 0x1;
    constexpr uint8_t ACK         = 0x1;   // SETTINGS, PING
    constexpr uint8_t END_HEADERS = 0x4;
    constexpr uint8_t PADDED      = 0x8;
    constexpr uint8_t PRIORITY    = 0x20;
}

/**
 * HTTP/2 Error Codes (RFC 7540 Section 7)
 */
enum class ErrorCode : uint32_t {
    NO_ERROR            = 0x0,
    PROTOCOL_ERROR      = 0x1,
    INTERNAL_ERROR      = 0x2,
    FLOW_CONTROL_ERROR  = 0x3,
    SETTINGS_TIMEOUT    = 0x4,
    STREAM_CLOSED       = 0x5,
    FRAME_SIZE_ERROR    = 0x6,
    REFUSED_STREAM      = 0x7,
    CANCEL              = 0x8,
    COMPRESSION_ERROR   = 0x9,
    CONNECT_ERROR       = 0xa,
    ENHANCE_YOUR_CALM   = 0xb,
    INADEQUATE_SECURITY = 0xc,
    HTTP_1_1_REQUIRED   = 0xd
};

const char* error_code_name(ErrorCode code) noexcept;

/**
 * SETTINGS Parameters (RFC 7540 Section 6.5.2)
 */
enum class SettingsId : uint16_t {
    HEADER_TABLE_SIZE      = 0x1,
    ENABLE_PUSH            = 0x2,
    MAX_CONCURRENT_STREAMS = 0x3,
    INITIAL_WINDOW_SIZE    = 0x4,
    MAX_FRAME_SIZE         = 0x5,
    MAX_HEADER_LIST_SIZE   = 0x6
};

constexpr size_t FRAME_HEADER_SIZE = 9;
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 16384;
constexpr uint32_t MAX_ALLOWED_FRAME_SIZE = 16777215;
constexpr int32_t DEFAULT_WINDOW_SIZE = 65535;
constexpr int32_t MAX_WINDOW_SIZE = 0x7FFFFFFF;

/**
 * HTTP/2 Frame Header (RFC 7540 Section 4.1)
 *
 * +-----------------------------------------------+
 * |                 Length (24)                   |
 * +---------------+---------------+---------------+
 * |   Type (8)    |   Flags (8)   |
 * +-+-------------+---------------+-------------------------------+
 * |R|                 Stream Identifier (31)                      |
 * +=+=============================================================+
 */
struct FrameHeader {
    uint32_t length = 0;
    FrameType type = FrameType::DATA;
    uint8_t flags = 0;
    uint32_t stream_id = 0;

    FrameHeader() = default;
    FrameHeader(uint32_t len, FrameType t, uint8_t f, uint32_t sid)
        : length(len), type(t), flags(f), stream_id(sid) {}
};

struct SettingsParameter {
    SettingsId id;
    uint32_t value;
};

struct GoawayInfo {
    uint32_t last_stream_id = 0;
    ErrorCode error = ErrorCode::NO_ERROR;
    std::string debug_data;
};

using core::result;
using core::error_code;

/**
 * Parse the 9-byte frame header.
 */
FrameHeader parse_frame_header(const uint8_t* data) noexcept;

void write_frame_header(const FrameHeader& header, uint8_t* out) noexcept;

/**
 * Strip padding from a DATA or HEADERS payload (and the priority block
 * of a HEADERS frame).
 *
 * @param out_offset Start of the unpadded fragment within payload
 * @param out_length Length of the unpadded fragment
 * @return ok, or protocol_violation if the padding overruns the payload
 */
result<void> unpad_payload(
    const FrameHeader& header,
    const uint8_t* payload,
    size_t& out_offset,
    size_t& out_length
) noexcept;

/**
 * Parse SETTINGS payload (multiple of 6 bytes).
 */
result<std::vector<SettingsParameter>> parse_settings_frame(
    const uint8_t* payload,
    size_t payload_len
);

/**
 * Parse RST_STREAM payload (4 bytes).
 */
ErrorCode parse_rst_stream_frame(const uint8_t* payload) noexcept;

/**
 * Parse WINDOW_UPDATE payload (4 bytes).
 *
 * @return Increment (0 is a protocol error the caller must reject)
 */
uint32_t parse_window_update_frame(const uint8_t* payload) noexcept;

/**
 * Parse GOAWAY payload (>= 8 bytes).
 */
result<GoawayInfo> parse_goaway_frame(const uint8_t* payload, size_t payload_len);

// Frame serialization (appends to `out`)

void write_data_frame(std::vector<uint8_t>& out, uint32_t stream_id,
                      const uint8_t* data, size_t len, bool end_stream);

/**
 * HEADERS plus as many CONTINUATION frames as max_frame_size requires.
 */
void write_headers_frames(std::vector<uint8_t>& out, uint32_t stream_id,
                          const std::vector<uint8_t>& header_block,
                          bool end_stream, uint32_t max_frame_size);

void write_settings_frame(std::vector<uint8_t>& out,
                          const std::vector<SettingsParameter>& params);

void write_settings_ack(std::vector<uint8_t>& out);

void write_window_update_frame(std::vector<uint8_t>& out, uint32_t stream_id,
                               uint32_t increment);

void write_ping_frame(std::vector<uint8_t>& out, const uint8_t* opaque_data, bool ack);

void write_goaway_frame(std::vector<uint8_t>& out, uint32_t last_stream_id,
                        ErrorCode error, const std::string& debug_data = "");

void write_rst_stream_frame(std::vector<uint8_t>& out, uint32_t stream_id, ErrorCode error);

/**
 * HTTP/2 Connection Preface (RFC 7540 Section 3.5)
 */
constexpr const char* CONNECTION_PREFACE = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";
constexpr size_t CONNECTION_PREFACE_LEN = 24;

} // namespace http2
} // namespace dualmeter
