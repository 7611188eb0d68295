#pragma once

#include "quic_varint.h"
#include <cstdint>
#include <cstring>

namespace dualmeter {
namespace quic {

/**
 * QUIC frame types (RFC 9000 Section 19).
 */
enum class FrameType : uint64_t {
    PADDING = 0x00,
    PING = 0x01,
    ACK = 0x02,
    ACK_ECN = 0x03,
    RESET_STREAM = 0x04,
    STOP_SENDING = 0x05,
    CRYPTO = 0x06,
    NEW_TOKEN = 0x07,
    STREAM = 0x08,          // Base value, flags in low bits
    MAX_DATA = 0x10,
    MAX_STREAM_DATA = 0x11,
    MAX_STREAMS_BIDI = 0x12,
    MAX_STREAMS_UNI = 0x13,
    DATA_BLOCKED = 0x14,
    STREAM_DATA_BLOCKED = 0x15,
    STREAMS_BLOCKED_BIDI = 0x16,
    STREAMS_BLOCKED_UNI = 0x17,
    NEW_CONNECTION_ID = 0x18,
    RETIRE_CONNECTION_ID = 0x19,
    PATH_CHALLENGE = 0x1A,
    PATH_RESPONSE = 0x1B,
    CONNECTION_CLOSE = 0x1C,
    CONNECTION_CLOSE_APP = 0x1D,
    HANDSHAKE_DONE = 0x1E,
};

/**
 * Transport error codes (RFC 9000 Section 20.1).
 */
enum class TransportError : uint64_t {
    NO_ERROR = 0x00,
    INTERNAL_ERROR = 0x01,
    CONNECTION_REFUSED = 0x02,
    FLOW_CONTROL_ERROR = 0x03,
    STREAM_LIMIT_ERROR = 0x04,
    STREAM_STATE_ERROR = 0x05,
    FINAL_SIZE_ERROR = 0x06,
    FRAME_ENCODING_ERROR = 0x07,
    TRANSPORT_PARAMETER_ERROR = 0x08,
    PROTOCOL_VIOLATION = 0x0A,
    CRYPTO_BUFFER_EXCEEDED = 0x0D,
    CRYPTO_ERROR = 0x100,   // Plus the TLS alert, up to 0x1ff
};

inline bool is_stream_frame_type(uint64_t type) noexcept {
    return type >= 0x08 && type <= 0x0F;
}

/**
 * STREAM frame.
 *
 * Format:
 *   0b00001XXX
 *   XXX bits: OFF|LEN|FIN
 *
 * Serialized frames always carry an explicit length so several frames can
 * share a packet.
 */
struct StreamFrame {
    uint64_t stream_id{0};
    uint64_t offset{0};        // Only if OFF bit set
    uint64_t length{0};        // Only if LEN bit set
    bool fin{false};           // FIN bit
    const uint8_t* data{nullptr};

    static constexpr uint8_t FLAG_FIN = 0x01;
    static constexpr uint8_t FLAG_LEN = 0x02;
    static constexpr uint8_t FLAG_OFF = 0x04;

    /**
     * Parse STREAM frame.
     *
     * @param data_buf Input buffer, starting at the type byte
     * @param len Buffer length
     * @param out_consumed Bytes consumed
     * @return 0 on success, -1 if need more data, 1 on error
     */
    int parse(const uint8_t* data_buf, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;

        uint8_t type_byte = data_buf[0];
        uint8_t flags = type_byte & 0x07;

        fin = (flags & FLAG_FIN) != 0;
        bool has_length = (flags & FLAG_LEN) != 0;
        bool has_offset = (flags & FLAG_OFF) != 0;

        size_t pos = 1;

        int consumed = VarInt::decode(data_buf + pos, len - pos, stream_id);
        if (consumed < 0) return -1;
        pos += consumed;

        if (has_offset) {
            consumed = VarInt::decode(data_buf + pos, len - pos, offset);
            if (consumed < 0) return -1;
            pos += consumed;
        } else {
            offset = 0;
        }

        if (has_length) {
            consumed = VarInt::decode(data_buf + pos, len - pos, length);
            if (consumed < 0) return -1;
            pos += consumed;
        } else {
            // Length extends to end of packet
            length = len - pos;
        }

        if (len - pos < length) return -1;
        if (offset + length > VarInt::MAX) return 1;
        data = data_buf + pos;
        pos += length;

        out_consumed = pos;
        return 0;
    }

    /**
     * Bytes needed to serialize a frame header (everything but data).
     */
    static size_t header_size(uint64_t stream_id, uint64_t offset, uint64_t length) noexcept {
        size_t size = 1 + VarInt::encoded_size(stream_id) + VarInt::encoded_size(length);
        if (offset > 0) size += VarInt::encoded_size(offset);
        return size;
    }

    /**
     * Serialize STREAM frame.
     *
     * @param out Output buffer
     * @return Number of bytes written
     */
    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;

        uint8_t type_byte = 0x08 | FLAG_LEN;
        if (fin) type_byte |= FLAG_FIN;
        if (offset > 0) type_byte |= FLAG_OFF;
        out[pos++] = type_byte;

        pos += VarInt::encode(stream_id, out + pos);

        if (offset > 0) {
            pos += VarInt::encode(offset, out + pos);
        }

        pos += VarInt::encode(length, out + pos);

        if (length > 0) {
            std::memcpy(out + pos, data, length);
            pos += length;
        }

        return pos;
    }
};

/**
 * ACK frame.
 *
 * Format (RFC 9000 Section 19.3):
 *   Type (i) = 0x02 or 0x03
 *   Largest Acknowledged (i)
 *   ACK Delay (i)
 *   ACK Range Count (i)
 *   First ACK Range (i)
 *   ACK Range (..) ...
 *   [ECN Counts (..)]  // type 0x03 only, skipped
 */
struct AckRange {
    uint64_t gap;      // Gap from previous range
    uint64_t length;   // Length of this range
};

struct AckFrame {
    static constexpr size_t MAX_RANGES = 64;

    uint64_t largest_acked{0};
    uint64_t ack_delay{0};
    uint64_t first_ack_range{0};
    AckRange ranges[MAX_RANGES];
    size_t range_count{0};

    /**
     * Parse ACK frame.
     *
     * @return 0 on success, -1 if need more data, 1 on error
     */
    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;

        bool ecn = data[0] == 0x03;
        size_t pos = 1;

        int consumed = VarInt::decode(data + pos, len - pos, largest_acked);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, ack_delay);
        if (consumed < 0) return -1;
        pos += consumed;

        uint64_t range_cnt;
        consumed = VarInt::decode(data + pos, len - pos, range_cnt);
        if (consumed < 0) return -1;
        pos += consumed;

        if (range_cnt > MAX_RANGES) return 1;
        range_count = static_cast<size_t>(range_cnt);

        consumed = VarInt::decode(data + pos, len - pos, first_ack_range);
        if (consumed < 0) return -1;
        pos += consumed;
        if (first_ack_range > largest_acked) return 1;

        uint64_t smallest = largest_acked - first_ack_range;
        for (size_t i = 0; i < range_count; i++) {
            consumed = VarInt::decode(data + pos, len - pos, ranges[i].gap);
            if (consumed < 0) return -1;
            pos += consumed;

            consumed = VarInt::decode(data + pos, len - pos, ranges[i].length);
            if (consumed < 0) return -1;
            pos += consumed;

            // Ranges must not run below packet number 0
            if (smallest < ranges[i].gap + 2 + ranges[i].length) return 1;
            smallest -= ranges[i].gap + 2 + ranges[i].length;
        }

        if (ecn) {
            for (int i = 0; i < 3; i++) {
                uint64_t count;
                consumed = VarInt::decode(data + pos, len - pos, count);
                if (consumed < 0) return -1;
                pos += consumed;
            }
        }

        out_consumed = pos;
        return 0;
    }

    /**
     * Serialize ACK frame.
     *
     * @return Number of bytes written
     */
    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;

        out[pos++] = 0x02;
        pos += VarInt::encode(largest_acked, out + pos);
        pos += VarInt::encode(ack_delay, out + pos);
        pos += VarInt::encode(range_count, out + pos);
        pos += VarInt::encode(first_ack_range, out + pos);

        for (size_t i = 0; i < range_count; i++) {
            pos += VarInt::encode(ranges[i].gap, out + pos);
            pos += VarInt::encode(ranges[i].length, out + pos);
        }

        return pos;
    }

    size_t serialized_size() const noexcept {
        size_t size = 1 + VarInt::encoded_size(largest_acked) +
                      VarInt::encoded_size(ack_delay) +
                      VarInt::encoded_size(range_count) +
                      VarInt::encoded_size(first_ack_range);
        for (size_t i = 0; i < range_count; i++) {
            size += VarInt::encoded_size(ranges[i].gap) +
                    VarInt::encoded_size(ranges[i].length);
        }
        return size;
    }
};

/**
 * CRYPTO frame. Carries the cleartext transport parameters during the
 * handshake.
 */
struct CryptoFrame {
    uint64_t offset{0};
    uint64_t length{0};
    const uint8_t* data{nullptr};

    int parse(const uint8_t* data_buf, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;

        size_t pos = 1;  // Skip type byte

        int consumed = VarInt::decode(data_buf + pos, len - pos, offset);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data_buf + pos, len - pos, length);
        if (consumed < 0) return -1;
        pos += consumed;

        if (len - pos < length) return -1;
        data = data_buf + pos;
        pos += length;

        out_consumed = pos;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;

        out[pos++] = 0x06;
        pos += VarInt::encode(offset, out + pos);
        pos += VarInt::encode(length, out + pos);
        std::memcpy(out + pos, data, length);
        pos += length;

        return pos;
    }
};

/**
 * CONNECTION_CLOSE frame (0x1c transport, 0x1d application).
 */
struct ConnectionCloseFrame {
    bool is_app_error{false};
    uint64_t error_code{0};
    uint64_t frame_type{0};     // Only for transport-level errors
    uint64_t reason_length{0};
    const char* reason_phrase{nullptr};

    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;

        is_app_error = data[0] == 0x1D;
        size_t pos = 1;

        int consumed = VarInt::decode(data + pos, len - pos, error_code);
        if (consumed < 0) return -1;
        pos += consumed;

        if (!is_app_error) {
            consumed = VarInt::decode(data + pos, len - pos, frame_type);
            if (consumed < 0) return -1;
            pos += consumed;
        }

        consumed = VarInt::decode(data + pos, len - pos, reason_length);
        if (consumed < 0) return -1;
        pos += consumed;

        if (len - pos < reason_length) return -1;
        reason_phrase = reinterpret_cast<const char*>(data + pos);
        pos += reason_length;

        out_consumed = pos;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;

        out[pos++] = is_app_error ? 0x1D : 0x1C;
        pos += VarInt::encode(error_code, out + pos);
        if (!is_app_error) {
            pos += VarInt::encode(frame_type, out + pos);
        }
        pos += VarInt::encode(reason_length, out + pos);
        if (reason_length > 0) {
            std::memcpy(out + pos, reason_phrase, reason_length);
            pos += reason_length;
        }

        return pos;
    }
};

/**
 * RESET_STREAM frame.
 */
struct ResetStreamFrame {
    uint64_t stream_id{0};
    uint64_t error_code{0};
    uint64_t final_size{0};

    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;
        size_t pos = 1;

        int consumed = VarInt::decode(data + pos, len - pos, stream_id);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, error_code);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, final_size);
        if (consumed < 0) return -1;
        pos += consumed;

        out_consumed = pos;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;
        out[pos++] = 0x04;
        pos += VarInt::encode(stream_id, out + pos);
        pos += VarInt::encode(error_code, out + pos);
        pos += VarInt::encode(final_size, out + pos);
        return pos;
    }
};

/**
 * STOP_SENDING frame.
 */
struct StopSendingFrame {
    uint64_t stream_id{0};
    uint64_t error_code{0};

    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;
        size_t pos = 1;

        int consumed = VarInt::decode(data + pos, len - pos, stream_id);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, error_code);
        if (consumed < 0) return -1;
        pos += consumed;

        out_consumed = pos;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;
        out[pos++] = 0x05;
        pos += VarInt::encode(stream_id, out + pos);
        pos += VarInt::encode(error_code, out + pos);
        return pos;
    }
};

/**
 * MAX_DATA, MAX_STREAMS and the *_BLOCKED frames all carry one varint.
 */
struct SingleValueFrame {
    uint8_t type{0};
    uint64_t value{0};

    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;
        type = data[0];
        int consumed = VarInt::decode(data + 1, len - 1, value);
        if (consumed < 0) return -1;
        out_consumed = 1 + consumed;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        out[0] = type;
        return 1 + VarInt::encode(value, out + 1);
    }
};

/**
 * MAX_STREAM_DATA frame.
 */
struct MaxStreamDataFrame {
    uint64_t stream_id{0};
    uint64_t max_data{0};

    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
        if (len == 0) return -1;
        size_t pos = 1;

        int consumed = VarInt::decode(data + pos, len - pos, stream_id);
        if (consumed < 0) return -1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, max_data);
        if (consumed < 0) return -1;
        pos += consumed;

        out_consumed = pos;
        return 0;
    }

    size_t serialize(uint8_t* out) const noexcept {
        size_t pos = 0;
        out[pos++] = 0x11;
        pos += VarInt::encode(stream_id, out + pos);
        pos += VarInt::encode(max_data, out + pos);
        return pos;
    }
};

/**
 * Skip a frame this endpoint parses but does not act on
 * (NEW_TOKEN, STREAM_DATA_BLOCKED, NEW_CONNECTION_ID, RETIRE_CONNECTION_ID,
 * PATH_CHALLENGE, PATH_RESPONSE).
 *
 * @return 0 on success, -1 if need more data, 1 on unknown frame type
 */
inline int skip_frame(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
    if (len == 0) return -1;
    uint8_t type = data[0];
    size_t pos = 1;
    uint64_t v;
    int consumed;

    switch (type) {
        case 0x07: {  // NEW_TOKEN
            consumed = VarInt::decode(data + pos, len - pos, v);
            if (consumed < 0) return -1;
            pos += consumed;
            if (len - pos < v) return -1;
            pos += v;
            break;
        }
        case 0x15: {  // STREAM_DATA_BLOCKED
            for (int i = 0; i < 2; i++) {
                consumed = VarInt::decode(data + pos, len - pos, v);
                if (consumed < 0) return -1;
                pos += consumed;
            }
            break;
        }
        case 0x18: {  // NEW_CONNECTION_ID
            for (int i = 0; i < 2; i++) {
                consumed = VarInt::decode(data + pos, len - pos, v);
                if (consumed < 0) return -1;
                pos += consumed;
            }
            if (len - pos < 1) return -1;
            uint8_t cid_len = data[pos++];
            if (cid_len < 1 || cid_len > 20) return 1;
            if (len - pos < static_cast<size_t>(cid_len) + 16) return -1;
            pos += cid_len + 16;  // CID + stateless reset token
            break;
        }
        case 0x19: {  // RETIRE_CONNECTION_ID
            consumed = VarInt::decode(data + pos, len - pos, v);
            if (consumed < 0) return -1;
            pos += consumed;
            break;
        }
        case 0x1A:    // PATH_CHALLENGE
        case 0x1B: {  // PATH_RESPONSE
            if (len - pos < 8) return -1;
            pos += 8;
            break;
        }
        default:
            return 1;
    }

    out_consumed = pos;
    return 0;
}

} // namespace quic
} // namespace dualmeter
