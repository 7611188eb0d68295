#include "quic_transport_params.h"

namespace dualmeter {
namespace quic {

namespace {

void put_varint(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t buf[8];
    size_t n = VarInt::encode(value, buf);
    out.insert(out.end(), buf, buf + n);
}

void put_int_param(std::vector<uint8_t>& out, uint64_t id, uint64_t value) {
    put_varint(out, id);
    put_varint(out, VarInt::encoded_size(value));
    put_varint(out, value);
}

void put_cid_param(std::vector<uint8_t>& out, uint64_t id, const ConnectionID& cid) {
    put_varint(out, id);
    put_varint(out, cid.length);
    out.insert(out.end(), cid.data, cid.data + cid.length);
}

} // namespace

void TransportParameters::serialize(std::vector<uint8_t>& out) const {
    if (has_original_dcid) {
        put_cid_param(out, ORIGINAL_DESTINATION_CONNECTION_ID, original_dcid);
    }
    put_int_param(out, MAX_IDLE_TIMEOUT, max_idle_timeout_ms);
    put_int_param(out, MAX_UDP_PAYLOAD_SIZE, max_udp_payload_size);
    put_int_param(out, INITIAL_MAX_DATA, initial_max_data);
    put_int_param(out, INITIAL_MAX_STREAM_DATA_BIDI_LOCAL, initial_max_stream_data_bidi_local);
    put_int_param(out, INITIAL_MAX_STREAM_DATA_BIDI_REMOTE, initial_max_stream_data_bidi_remote);
    put_int_param(out, INITIAL_MAX_STREAM_DATA_UNI, initial_max_stream_data_uni);
    put_int_param(out, INITIAL_MAX_STREAMS_BIDI, initial_max_streams_bidi);
    put_int_param(out, INITIAL_MAX_STREAMS_UNI, initial_max_streams_uni);
    put_int_param(out, ACK_DELAY_EXPONENT, ack_delay_exponent);
    put_int_param(out, MAX_ACK_DELAY, max_ack_delay_ms);
    put_int_param(out, ACTIVE_CONNECTION_ID_LIMIT, active_connection_id_limit);
    if (has_initial_scid) {
        put_cid_param(out, INITIAL_SOURCE_CONNECTION_ID, initial_scid);
    }
}

int TransportParameters::parse(const uint8_t* data, size_t len) noexcept {
    // Absent parameters take their RFC 9000 defaults
    *this = TransportParameters();
    max_idle_timeout_ms = 0;
    initial_max_data = 0;
    initial_max_stream_data_bidi_local = 0;
    initial_max_stream_data_bidi_remote = 0;
    initial_max_stream_data_uni = 0;
    initial_max_streams_bidi = 0;
    initial_max_streams_uni = 0;

    size_t pos = 0;

    while (pos < len) {
        uint64_t id, param_len;
        int consumed = VarInt::decode(data + pos, len - pos, id);
        if (consumed < 0) return 1;
        pos += consumed;

        consumed = VarInt::decode(data + pos, len - pos, param_len);
        if (consumed < 0) return 1;
        pos += consumed;

        if (len - pos < param_len) return 1;
        const uint8_t* value = data + pos;
        pos += param_len;

        if (id == ORIGINAL_DESTINATION_CONNECTION_ID || id == INITIAL_SOURCE_CONNECTION_ID) {
            if (param_len > MAX_CID_LENGTH) return 1;
            ConnectionID cid(value, static_cast<uint8_t>(param_len));
            if (id == ORIGINAL_DESTINATION_CONNECTION_ID) {
                original_dcid = cid;
                has_original_dcid = true;
            } else {
                initial_scid = cid;
                has_initial_scid = true;
            }
            continue;
        }

        uint64_t* target = nullptr;
        switch (id) {
            case MAX_IDLE_TIMEOUT: target = &max_idle_timeout_ms; break;
            case MAX_UDP_PAYLOAD_SIZE: target = &max_udp_payload_size; break;
            case INITIAL_MAX_DATA: target = &initial_max_data; break;
            case INITIAL_MAX_STREAM_DATA_BIDI_LOCAL: target = &initial_max_stream_data_bidi_local; break;
            case INITIAL_MAX_STREAM_DATA_BIDI_REMOTE: target = &initial_max_stream_data_bidi_remote; break;
            case INITIAL_MAX_STREAM_DATA_UNI: target = &initial_max_stream_data_uni; break;
            case INITIAL_MAX_STREAMS_BIDI: target = &initial_max_streams_bidi; break;
            case INITIAL_MAX_STREAMS_UNI: target = &initial_max_streams_uni; break;
            case ACK_DELAY_EXPONENT: target = &ack_delay_exponent; break;
            case MAX_ACK_DELAY: target = &max_ack_delay_ms; break;
            case ACTIVE_CONNECTION_ID_LIMIT: target = &active_connection_id_limit; break;
            default:
                continue;  // Unknown or unused parameter
        }

        uint64_t v;
        consumed = VarInt::decode(value, param_len, v);
        if (consumed < 0 || static_cast<uint64_t>(consumed) != param_len) return 1;
        *target = v;
    }

    if (max_udp_payload_size < 1200 || ack_delay_exponent > 20 ||
        max_ack_delay_ms >= (1ULL << 14) ||
        initial_max_streams_bidi > (1ULL << 60) ||
        initial_max_streams_uni > (1ULL << 60)) {
        return 1;
    }

    return 0;
}

} // namespace quic
} // namespace dualmeter
