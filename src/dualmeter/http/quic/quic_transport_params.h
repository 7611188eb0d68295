#pragma once

#include "quic_packet.h"
#include <cstdint>
#include <vector>

namespace dualmeter {
namespace quic {

/**
 * QUIC transport parameters (RFC 9000 Section 18).
 *
 * Exchanged in the CRYPTO frames of the Initial packets. Both endpoints
 * advertise the limits the *peer* must respect when sending to them.
 */
struct TransportParameters {
    enum Id : uint64_t {
        ORIGINAL_DESTINATION_CONNECTION_ID = 0x00,
        MAX_IDLE_TIMEOUT = 0x01,
        MAX_UDP_PAYLOAD_SIZE = 0x03,
        INITIAL_MAX_DATA = 0x04,
        INITIAL_MAX_STREAM_DATA_BIDI_LOCAL = 0x05,
        INITIAL_MAX_STREAM_DATA_BIDI_REMOTE = 0x06,
        INITIAL_MAX_STREAM_DATA_UNI = 0x07,
        INITIAL_MAX_STREAMS_BIDI = 0x08,
        INITIAL_MAX_STREAMS_UNI = 0x09,
        ACK_DELAY_EXPONENT = 0x0A,
        MAX_ACK_DELAY = 0x0B,
        ACTIVE_CONNECTION_ID_LIMIT = 0x0E,
        INITIAL_SOURCE_CONNECTION_ID = 0x0F,
    };

    uint64_t max_idle_timeout_ms{60000};
    uint64_t max_udp_payload_size{65527};
    uint64_t initial_max_data{4 * 1024 * 1024};
    uint64_t initial_max_stream_data_bidi_local{1024 * 1024};
    uint64_t initial_max_stream_data_bidi_remote{1024 * 1024};
    uint64_t initial_max_stream_data_uni{1024 * 1024};
    uint64_t initial_max_streams_bidi{100};
    uint64_t initial_max_streams_uni{3};
    uint64_t ack_delay_exponent{3};
    uint64_t max_ack_delay_ms{25};
    uint64_t active_connection_id_limit{2};

    bool has_original_dcid{false};
    ConnectionID original_dcid;      // Server only
    bool has_initial_scid{false};
    ConnectionID initial_scid;

    /**
     * Append the encoded parameter list.
     */
    void serialize(std::vector<uint8_t>& out) const;

    /**
     * Parse a parameter list. Unknown parameters are skipped.
     *
     * @return 0 on success, 1 on malformed or out-of-range values
     */
    int parse(const uint8_t* data, size_t len) noexcept;
};

} // namespace quic
} // namespace dualmeter
