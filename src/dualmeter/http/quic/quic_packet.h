#pragma once

#include "quic_varint.h"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace dualmeter {
namespace quic {

/**
 * QUIC packet types (RFC 9000 Section 17).
 */
enum class PacketType : uint8_t {
    INITIAL = 0x00,
    ZERO_RTT = 0x01,
    HANDSHAKE = 0x02,
    RETRY = 0x03,
    ONE_RTT = 0x04,  // Short header packet
    VERSION_NEGOTIATION = 0x05
};

constexpr uint32_t QUIC_VERSION_1 = 0x00000001;
constexpr uint8_t MAX_CID_LENGTH = 20;
constexpr uint8_t LOCAL_CID_LENGTH = 8;        // Length of every CID we issue
constexpr uint8_t MIN_INITIAL_DCID_LENGTH = 8;  // RFC 9000 Section 7.2
constexpr size_t MIN_INITIAL_DATAGRAM_SIZE = 1200;
constexpr size_t MAX_DATAGRAM_SIZE = 1200;

/**
 * QUIC connection ID.
 *
 * Max length is 20 bytes (RFC 9000).
 */
struct ConnectionID {
    uint8_t data[MAX_CID_LENGTH];
    uint8_t length;

    ConnectionID() : length(0) {
        std::memset(data, 0, sizeof(data));
    }

    ConnectionID(const uint8_t* bytes, uint8_t len) : length(len) {
        std::memset(data, 0, sizeof(data));
        std::memcpy(data, bytes, len);
    }

    bool operator==(const ConnectionID& other) const noexcept {
        return length == other.length &&
               std::memcmp(data, other.data, length) == 0;
    }

    bool operator!=(const ConnectionID& other) const noexcept {
        return !(*this == other);
    }

    std::string to_hex() const;

    struct Hash {
        size_t operator()(const ConnectionID& cid) const noexcept {
            // FNV-1a
            uint64_t h = 1469598103934665603ULL;
            for (uint8_t i = 0; i < cid.length; ++i) {
                h ^= cid.data[i];
                h *= 1099511628211ULL;
            }
            return static_cast<size_t>(h);
        }
    };
};

/**
 * QUIC long header (Initial, 0-RTT, Handshake, Retry).
 *
 * The low bits of the first byte and the packet number are header
 * protected on the wire (RFC 9001 Section 5.4). parse() reads them as
 * they are, so it yields the real values only once protection has been
 * removed; the offset of the packet number is valid either way.
 *
 * Format (RFC 9000 Section 17.2):
 * +-+-+-+-+-+-+-+-+
 * |1|1|T T|R R|P P|
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         Version (32)                          |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | DCID Len (8)  |  Destination Connection ID (0..160)         ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | SCID Len (8)  |  Source Connection ID (0..160)              ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | Token Length (i), Token (Initial only) | Length (i) | PN (8..32)
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 */
struct LongHeader {
    PacketType type{PacketType::INITIAL};
    uint32_t version{QUIC_VERSION_1};
    ConnectionID dest_conn_id;
    ConnectionID source_conn_id;
    uint64_t token_length{0};
    const uint8_t* token{nullptr};
    uint64_t packet_length{0};       // Packet number + payload
    uint64_t packet_number{0};       // Truncated on the wire
    uint8_t packet_number_length{4};

    /**
     * Parse a version 1 long header up to and including the packet number.
     *
     * @param out_consumed Header bytes consumed
     * @return 0 on success, -1 if truncated, 1 on malformed header
     */
    int parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept;

    /**
     * Serialize header. packet_length must already be set and below
     * 16384: the Length field is always written in two bytes.
     *
     * @param out Output buffer (must be large enough)
     * @return Number of bytes written
     */
    size_t serialize(uint8_t* out) const noexcept;
};

/**
 * QUIC short header (1-RTT packets).
 *
 * Format (RFC 9000 Section 17.3):
 * +-+-+-+-+-+-+-+-+
 * |0|1|S|R|R|K|P P|
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |               Destination Connection ID (0..160)            ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                     Packet Number (8/16/24/32)              ...
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 */
struct ShortHeader {
    bool spin_bit{false};
    bool key_phase{false};
    ConnectionID dest_conn_id;
    uint64_t packet_number{0};
    uint8_t packet_number_length{4};

    /**
     * Parse short header.
     *
     * The DCID length is not on the wire: it is the length of the
     * receiver's own connection IDs.
     *
     * @return 0 on success, -1 if truncated, 1 on malformed header
     */
    int parse(const uint8_t* data, size_t len, uint8_t dcid_len, size_t& out_consumed) noexcept;

    size_t serialize(uint8_t* out) const noexcept;
};

/**
 * Version-independent fields of a long header (RFC 8999 Section 5.1).
 *
 * @return 0 on success, -1 if truncated, 1 on malformed header
 */
int parse_long_header_invariants(
    const uint8_t* data,
    size_t len,
    uint32_t& version,
    ConnectionID& dcid,
    ConnectionID& scid
) noexcept;

/**
 * Write a Version Negotiation packet listing QUIC v1 (RFC 9000 Section 17.2.1).
 *
 * @param dcid Source CID of the offending client packet
 * @param scid Destination CID of the offending client packet
 * @return Bytes written, 0 if capacity is too small
 */
size_t write_version_negotiation(
    const ConnectionID& dcid,
    const ConnectionID& scid,
    uint8_t* out,
    size_t capacity
) noexcept;

/**
 * Parse a Version Negotiation packet and report whether v1 is offered.
 *
 * @return 0 on success, 1 on malformed packet
 */
int parse_version_negotiation(
    const uint8_t* data,
    size_t len,
    bool& offers_v1
) noexcept;

/**
 * Packet number encoding/decoding helpers (RFC 9000 Section 17.1).
 */
uint8_t encode_packet_number_length(uint64_t full_pn, uint64_t largest_acked, bool any_acked) noexcept;
uint64_t decode_packet_number(uint64_t truncated_pn, uint64_t largest_received, uint8_t pn_nbits) noexcept;

bool validate_fixed_bit(uint8_t first_byte) noexcept;
bool is_long_header(uint8_t first_byte) noexcept;

/**
 * Random connection ID from the OpenSSL CSPRNG.
 *
 * @return false if the RNG failed
 */
bool generate_connection_id(uint8_t length, ConnectionID& out) noexcept;

const char* packet_type_to_string(PacketType type) noexcept;

} // namespace quic
} // namespace dualmeter
