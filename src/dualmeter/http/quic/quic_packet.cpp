// QUIC packet parsing and serialization (RFC 9000 Section 17)

#include "quic_packet.h"

#include <openssl/rand.h>

#include <algorithm>
#include <cstdio>

namespace dualmeter {
namespace quic {

namespace {

uint32_t read_uint32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

void write_uint32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

} // namespace

std::string ConnectionID::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (uint8_t i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// ============================================================================
// Long header
// ============================================================================

int parse_long_header_invariants(
    const uint8_t* data,
    size_t len,
    uint32_t& version,
    ConnectionID& dcid,
    ConnectionID& scid
) noexcept {
    if (len < 7) return -1;
    if ((data[0] & 0x80) == 0) return 1;

    size_t pos = 1;
    version = read_uint32(data + pos);
    pos += 4;

    uint8_t dcid_len = data[pos++];
    if (dcid_len > MAX_CID_LENGTH) return 1;
    if (len < pos + dcid_len + 1) return -1;
    dcid = ConnectionID(data + pos, dcid_len);
    pos += dcid_len;

    uint8_t scid_len = data[pos++];
    if (scid_len > MAX_CID_LENGTH) return 1;
    if (len < pos + scid_len) return -1;
    scid = ConnectionID(data + pos, scid_len);
    return 0;
}

int LongHeader::parse(const uint8_t* data, size_t len, size_t& out_consumed) noexcept {
    if (len < 1) return -1;

    uint8_t first_byte = data[0];
    if ((first_byte & 0x80) == 0 || !validate_fixed_bit(first_byte)) {
        return 1;
    }

    int rc = parse_long_header_invariants(data, len, version, dest_conn_id, source_conn_id);
    if (rc != 0) return rc;
    if (version != QUIC_VERSION_1) return 1;

    type = static_cast<PacketType>((first_byte >> 4) & 0x03);
    packet_number_length = static_cast<uint8_t>((first_byte & 0x03) + 1);

    size_t pos = 1 + 4 + 1 + dest_conn_id.length + 1 + source_conn_id.length;

    if (type == PacketType::RETRY) {
        return 1;  // Never sent by a client, not used by us
    }

    if (type == PacketType::INITIAL) {
        int consumed = VarInt::decode(data + pos, len - pos, token_length);
        if (consumed < 0) return -1;
        pos += consumed;
        if (len - pos < token_length) return -1;
        token = data + pos;
        pos += token_length;
    } else {
        token_length = 0;
        token = nullptr;
    }

    int consumed = VarInt::decode(data + pos, len - pos, packet_length);
    if (consumed < 0) return -1;
    pos += consumed;

    if (packet_length < packet_number_length || len - pos < packet_length) {
        return 1;
    }

    packet_number = 0;
    for (uint8_t i = 0; i < packet_number_length; ++i) {
        packet_number = (packet_number << 8) | data[pos++];
    }

    out_consumed = pos;
    return 0;
}

size_t LongHeader::serialize(uint8_t* out) const noexcept {
    size_t pos = 0;

    out[pos++] = static_cast<uint8_t>(0xC0 | (static_cast<uint8_t>(type) << 4) |
                                      ((packet_number_length - 1) & 0x03));

    write_uint32(out + pos, version);
    pos += 4;

    out[pos++] = dest_conn_id.length;
    std::memcpy(out + pos, dest_conn_id.data, dest_conn_id.length);
    pos += dest_conn_id.length;

    out[pos++] = source_conn_id.length;
    std::memcpy(out + pos, source_conn_id.data, source_conn_id.length);
    pos += source_conn_id.length;

    if (type == PacketType::INITIAL) {
        pos += VarInt::encode(token_length, out + pos);
        if (token_length > 0) {
            std::memcpy(out + pos, token, token_length);
            pos += token_length;
        }
    }

    pos += VarInt::encode_fixed(packet_length, 2, out + pos);

    for (int i = packet_number_length - 1; i >= 0; --i) {
        out[pos++] = static_cast<uint8_t>((packet_number >> (i * 8)) & 0xFF);
    }

    return pos;
}

// ============================================================================
// Short header
// ============================================================================

int ShortHeader::parse(const uint8_t* data, size_t len, uint8_t dcid_len, size_t& out_consumed) noexcept {
    if (len < 1) return -1;

    uint8_t first_byte = data[0];
    if ((first_byte & 0x80) != 0 || !validate_fixed_bit(first_byte)) {
        return 1;
    }

    spin_bit = (first_byte & 0x20) != 0;
    key_phase = (first_byte & 0x04) != 0;
    packet_number_length = static_cast<uint8_t>((first_byte & 0x03) + 1);

    size_t pos = 1;

    if (dcid_len > MAX_CID_LENGTH) return 1;
    if (len < pos + dcid_len) return -1;
    dest_conn_id = ConnectionID(data + pos, dcid_len);
    pos += dcid_len;

    if (len < pos + packet_number_length) return -1;
    packet_number = 0;
    for (uint8_t i = 0; i < packet_number_length; i++) {
        packet_number = (packet_number << 8) | data[pos++];
    }

    out_consumed = pos;
    return 0;
}

size_t ShortHeader::serialize(uint8_t* out) const noexcept {
    size_t pos = 0;

    uint8_t first = 0x40;
    if (spin_bit) first |= 0x20;
    if (key_phase) first |= 0x04;
    first |= (packet_number_length - 1) & 0x03;
    out[pos++] = first;

    std::memcpy(out + pos, dest_conn_id.data, dest_conn_id.length);
    pos += dest_conn_id.length;

    for (int i = packet_number_length - 1; i >= 0; i--) {
        out[pos++] = static_cast<uint8_t>((packet_number >> (i * 8)) & 0xFF);
    }

    return pos;
}

// ============================================================================
// Version Negotiation
// ============================================================================

size_t write_version_negotiation(
    const ConnectionID& dcid,
    const ConnectionID& scid,
    uint8_t* out,
    size_t capacity
) noexcept {
    size_t needed = 1 + 4 + 1 + dcid.length + 1 + scid.length + 4;
    if (capacity < needed) {
        return 0;
    }

    size_t pos = 0;
    uint8_t unused = 0;
    if (RAND_bytes(&unused, 1) != 1) {
        unused = 0x2A;
    }
    out[pos++] = static_cast<uint8_t>(0x80 | (unused & 0x7F));

    write_uint32(out + pos, 0);  // Version 0 marks Version Negotiation
    pos += 4;

    out[pos++] = dcid.length;
    std::memcpy(out + pos, dcid.data, dcid.length);
    pos += dcid.length;

    out[pos++] = scid.length;
    std::memcpy(out + pos, scid.data, scid.length);
    pos += scid.length;

    write_uint32(out + pos, QUIC_VERSION_1);
    pos += 4;

    return pos;
}

int parse_version_negotiation(const uint8_t* data, size_t len, bool& offers_v1) noexcept {
    uint32_t version = 0;
    ConnectionID dcid, scid;
    if (parse_long_header_invariants(data, len, version, dcid, scid) != 0 || version != 0) {
        return 1;
    }

    size_t pos = 1 + 4 + 1 + dcid.length + 1 + scid.length;
    if ((len - pos) % 4 != 0 || len == pos) {
        return 1;
    }

    offers_v1 = false;
    for (; pos < len; pos += 4) {
        if (read_uint32(data + pos) == QUIC_VERSION_1) {
            offers_v1 = true;
        }
    }
    return 0;
}

// ============================================================================
// Packet Number Encoding/Decoding (RFC 9000 Section 17.1, Appendix A)
// ============================================================================

uint8_t encode_packet_number_length(uint64_t full_pn, uint64_t largest_acked, bool any_acked) noexcept {
    uint64_t num_unacked = any_acked ? full_pn - largest_acked : full_pn + 1;

    // Twice the range of unacknowledged packets must fit
    uint64_t range = num_unacked * 2;

    if (range < 0x100) return 1;
    if (range < 0x10000) return 2;
    if (range < 0x1000000) return 3;
    return 4;
}

uint64_t decode_packet_number(uint64_t truncated_pn,
                              uint64_t largest_received,
                              uint8_t pn_nbits) noexcept {
    uint64_t expected_pn = largest_received + 1;
    uint64_t pn_win = 1ULL << pn_nbits;
    uint64_t pn_hwin = pn_win / 2;
    uint64_t pn_mask = pn_win - 1;

    uint64_t candidate_pn = (expected_pn & ~pn_mask) | truncated_pn;

    if (expected_pn > pn_hwin && candidate_pn <= expected_pn - pn_hwin &&
        candidate_pn < (1ULL << 62) - pn_win) {
        return candidate_pn + pn_win;
    }

    if (candidate_pn > expected_pn + pn_hwin && candidate_pn >= pn_win) {
        return candidate_pn - pn_win;
    }

    return candidate_pn;
}

bool validate_fixed_bit(uint8_t first_byte) noexcept {
    return (first_byte & 0x40) != 0;
}

bool is_long_header(uint8_t first_byte) noexcept {
    return (first_byte & 0x80) != 0;
}

bool generate_connection_id(uint8_t length, ConnectionID& out) noexcept {
    out = ConnectionID();
    out.length = std::min(length, MAX_CID_LENGTH);
    return RAND_bytes(out.data, out.length) == 1;
}

const char* packet_type_to_string(PacketType type) noexcept {
    switch (type) {
        case PacketType::INITIAL: return "Initial";
        case PacketType::ZERO_RTT: return "0-RTT";
        case PacketType::HANDSHAKE: return "Handshake";
        case PacketType::RETRY: return "Retry";
        case PacketType::ONE_RTT: return "1-RTT";
        case PacketType::VERSION_NEGOTIATION: return "VersionNegotiation";
    }
    return "Unknown";
}

} // namespace quic
} // namespace dualmeter
