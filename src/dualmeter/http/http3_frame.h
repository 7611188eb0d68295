#pragma once

#include "quic/quic_varint.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dualmeter {
namespace http3 {

/**
 * HTTP/3 frame types (RFC 9114 Section 7.2).
 */
enum class FrameType : uint64_t {
    DATA = 0x00,
    HEADERS = 0x01,
    CANCEL_PUSH = 0x03,
    SETTINGS = 0x04,
    PUSH_PROMISE = 0x05,
    GOAWAY = 0x07,
    MAX_PUSH_ID = 0x0D,
};

/**
 * Unidirectional stream types (RFC 9114 Section 6.2, RFC 9204 Section 4.2).
 */
enum class UniStreamType : uint64_t {
    CONTROL = 0x00,
    PUSH = 0x01,
    QPACK_ENCODER = 0x02,
    QPACK_DECODER = 0x03,
};

/**
 * HTTP/3 error codes (RFC 9114 Section 8.1, RFC 9204 Section 6).
 */
enum class ErrorCode : uint64_t {
    NO_ERROR = 0x100,
    GENERAL_PROTOCOL_ERROR = 0x101,
    INTERNAL_ERROR = 0x102,
    STREAM_CREATION_ERROR = 0x103,
    CLOSED_CRITICAL_STREAM = 0x104,
    FRAME_UNEXPECTED = 0x105,
    FRAME_ERROR = 0x106,
    EXCESSIVE_LOAD = 0x107,
    ID_ERROR = 0x108,
    SETTINGS_ERROR = 0x109,
    MISSING_SETTINGS = 0x10A,
    REQUEST_REJECTED = 0x10B,
    REQUEST_CANCELLED = 0x10C,
    REQUEST_INCOMPLETE = 0x10D,
    MESSAGE_ERROR = 0x10E,
    QPACK_DECOMPRESSION_FAILED = 0x200,
};

/**
 * Setting identifiers.
 */
constexpr uint64_t SETTINGS_QPACK_MAX_TABLE_CAPACITY = 0x01;
constexpr uint64_t SETTINGS_MAX_FIELD_SECTION_SIZE = 0x06;
constexpr uint64_t SETTINGS_QPACK_BLOCKED_STREAMS = 0x07;

/**
 * HTTP/3 frame header.
 */
struct FrameHeader {
    uint64_t type{0};
    uint64_t length{0};
};

/**
 * HTTP/3 SETTINGS frame parameters (RFC 9114 Section 7.2.4).
 */
struct Settings {
    uint64_t qpack_max_table_capacity{0};
    uint64_t max_field_section_size{16384};
    uint64_t qpack_blocked_streams{0};
};

/**
 * Parse frame header.
 *
 * @param out_consumed Bytes consumed
 * @return 0 on success, -1 if need more data
 */
int parse_frame_header(const uint8_t* data, size_t len,
                       FrameHeader& out_header, size_t& out_consumed) noexcept;

/**
 * Parse SETTINGS frame payload. Unknown identifiers are ignored.
 *
 * @return 0 on success, 1 on error (truncated pair, HTTP/2-only identifier,
 *         or a repeated identifier)
 */
int parse_settings(const uint8_t* data, size_t len, Settings& out_settings) noexcept;

/**
 * Frames that are never valid on the given stream kind
 * (RFC 9114 Section 7.2).
 */
bool allowed_on_request_stream(uint64_t type) noexcept;
bool allowed_on_control_stream(uint64_t type) noexcept;

void write_varint(uint64_t value, std::vector<uint8_t>& out);
void write_frame_header(FrameType type, uint64_t length, std::vector<uint8_t>& out);
void write_settings(const Settings& settings, std::vector<uint8_t>& out);
void write_goaway(uint64_t id, std::vector<uint8_t>& out);

const char* error_code_name(uint64_t code) noexcept;

} // namespace http3
} // namespace dualmeter
