#pragma once

#include "quic_packet.h"
#include "quic_frames.h"
#include "quic_stream.h"
#include "quic_flow_control.h"
#include "quic_congestion.h"
#include "quic_ack_tracker.h"
#include "quic_transport_params.h"
#include "quic_crypto.h"
#include "quic_tls.h"
#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace dualmeter {
namespace quic {

/**
 * QUIC connection state (RFC 9000 Section 10).
 */
enum class ConnectionState {
    HANDSHAKE,    // Transport parameters not yet exchanged
    ESTABLISHED,
    CLOSING,      // CONNECTION_CLOSE sent
    DRAINING,     // CONNECTION_CLOSE received
    CLOSED,
};

/**
 * What a server should do with a datagram that matches no connection.
 */
enum class InitialDisposition {
    ACCEPT,                // Valid client Initial: create a connection
    VERSION_NEGOTIATION,   // Long header for an unsupported version
    MALFORMED,             // Version 1 Initial failing validation (handshake failure)
    IGNORE,                // Anything else
};

/**
 * Classify a datagram addressed to an unknown connection ID.
 *
 * A v1 Initial is accepted only with a destination connection ID of at
 * least 8 bytes in a datagram of at least 1200 bytes.
 */
InitialDisposition classify_client_initial(const uint8_t* data, size_t len,
                                           LongHeader& out_header) noexcept;

/**
 * QUIC connection.
 *
 * Sans-IO engine for one connection, usable as server or client.
 * Datagrams go in through process_datagram(), come out of
 * generate_datagram(); the owner drives timers with next_timeout() and
 * on_timeout(). All times are microseconds on a monotonic clock.
 *
 * Manages:
 * - Streams and their flow control
 * - Connection flow control and stream limits
 * - Congestion control
 * - Loss detection and retransmission
 * - Packet numbering per space
 * - The TLS 1.3 handshake and packet protection (RFC 9001)
 *
 * Initial, Handshake and 1-RTT packets are protected with AES-128-GCM and
 * header protection. The handshake is complete for the server once the
 * client's Finished arrives, and confirmed for the client by
 * HANDSHAKE_DONE. A TLS failure closes the connection with CRYPTO_ERROR
 * (0x100 plus the alert). Key updates and 0-RTT are not supported.
 */
class QUICConnection {
public:
    /**
     * Stream notifications. Delivered after a datagram or timer has been
     * fully processed, never from inside frame parsing.
     */
    struct Callbacks {
        std::function<void(uint64_t stream_id)> on_stream_readable;
        std::function<void(uint64_t stream_id, uint64_t error_code)> on_stream_reset;
        std::function<void(uint64_t stream_id, uint64_t error_code)> on_stop_sending;
        std::function<void(uint64_t stream_id)> on_stream_closed;
        std::function<void(uint64_t stream_id, bool first_byte, bool fin)> on_stream_sent;
        std::function<void()> on_handshake_complete;
    };

    /**
     * Server-side connection for a validated client Initial.
     *
     * @param local_cid Connection ID issued by the server
     * @param initial Header of the client's first Initial
     * @param tls_ctx Server context prepared by QuicTls::configure_context()
     * @return nullptr if the TLS session could not be created
     */
    static std::unique_ptr<QUICConnection> accept(
        uint64_t conn_id,
        const ConnectionID& local_cid,
        const LongHeader& initial,
        const TransportParameters& local_params,
        SSL_CTX* tls_ctx,
        uint64_t now
    );

    QUICConnection(bool is_server,
                   uint64_t conn_id,
                   const ConnectionID& local_cid,
                   const ConnectionID& peer_cid,
                   const ConnectionID& original_dcid,
                   const TransportParameters& local_params,
                   uint64_t now);

    QUICConnection(const QUICConnection&) = delete;
    QUICConnection& operator=(const QUICConnection&) = delete;

    /**
     * Derive the Initial keys and create the TLS session. A client queues
     * its ClientHello, so the first Initial is ready to send afterwards.
     *
     * @param ctx Context prepared by QuicTls::configure_context()
     * @param server_name SNI, client only
     * @return false if the TLS session could not be created or failed at once
     */
    bool start_tls(SSL_CTX* ctx, const std::string& server_name, uint64_t now) noexcept;

    /**
     * Process one received UDP datagram (possibly several coalesced
     * packets). Malformed packets are dropped; protocol errors close the
     * connection.
     */
    void process_datagram(const uint8_t* data, size_t len, uint64_t now) noexcept;

    /**
     * Write the next datagram to send.
     *
     * @param capacity At least MAX_DATAGRAM_SIZE
     * @return Datagram size, 0 if nothing to send
     */
    size_t generate_datagram(uint8_t* out, size_t capacity, uint64_t now) noexcept;

    /**
     * Earliest pending timer, 0 if none.
     */
    uint64_t next_timeout() const noexcept;

    /**
     * Fire expired timers (delayed ACK, loss detection, PTO, idle, close).
     */
    void on_timeout(uint64_t now) noexcept;

    /**
     * Close with CONNECTION_CLOSE.
     *
     * @param is_app Application error (0x1d) rather than transport (0x1c)
     */
    void close(uint64_t error_code, bool is_app, const char* reason, uint64_t now) noexcept;

    // ------------------------------------------------------------------
    // Streams
    // ------------------------------------------------------------------

    /**
     * Open a locally-initiated stream.
     *
     * @return Stream ID, or -1 if the peer's stream limit is reached
     */
    int64_t open_stream(bool bidirectional) noexcept;

    QUICStream* get_stream(uint64_t stream_id) noexcept;

    /**
     * Queue bytes on a stream.
     *
     * @return Bytes accepted (0 on unknown or closed stream)
     */
    size_t write_stream(uint64_t stream_id, const uint8_t* data, size_t len) noexcept;

    /**
     * Send FIN after the queued data.
     */
    void finish_stream(uint64_t stream_id) noexcept;

    /**
     * Abandon sending with RESET_STREAM.
     */
    void reset_stream(uint64_t stream_id, uint64_t error_code) noexcept;

    /**
     * Abandon receiving with STOP_SENDING.
     */
    void stop_sending(uint64_t stream_id, uint64_t error_code) noexcept;

    /**
     * Consume received bytes, replenishing flow control credit.
     *
     * @return Bytes consumed
     */
    size_t read_stream(uint64_t stream_id, uint8_t* buffer, size_t len) noexcept;
    size_t discard_stream(uint64_t stream_id, size_t len) noexcept;

    size_t stream_count() const noexcept { return streams_.size(); }

    // ------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------

    ConnectionState state() const noexcept { return state_; }
    bool is_established() const noexcept { return state_ == ConnectionState::ESTABLISHED; }
    bool is_closed() const noexcept { return state_ == ConnectionState::CLOSED; }
    bool is_closing() const noexcept {
        return state_ == ConnectionState::CLOSING || state_ == ConnectionState::DRAINING;
    }

    /**
     * Server: TLS handshake finished (client Finished received).
     * Client: HANDSHAKE_DONE received.
     */
    bool handshake_complete() const noexcept { return handshake_complete_; }
    uint64_t handshake_duration_us() const noexcept {
        return handshake_complete_ ? handshake_time_ - created_time_ : 0;
    }

    /**
     * Closed because the TLS handshake failed, locally or at the peer.
     */
    bool handshake_failed() const noexcept { return handshake_failed_; }
    std::string alpn() const { return tls_ ? tls_->alpn() : std::string(); }

    bool is_server() const noexcept { return is_server_; }
    uint64_t conn_id() const noexcept { return conn_id_; }
    const ConnectionID& local_cid() const noexcept { return local_cid_; }
    const ConnectionID& peer_cid() const noexcept { return peer_cid_; }
    const ConnectionID& original_dcid() const noexcept { return original_dcid_; }
    const TransportParameters& peer_params() const noexcept { return peer_params_; }

    uint64_t close_error_code() const noexcept { return close_error_code_; }
    bool close_is_app() const noexcept { return close_is_app_; }
    bool closed_by_peer() const noexcept { return closed_by_peer_; }
    bool idle_timed_out() const noexcept { return idle_timed_out_; }

    const NewRenoCongestionControl& congestion_control() const noexcept { return cc_; }
    const RttStats& rtt() const noexcept { return rtt_; }
    const FlowControl& flow_control() const noexcept { return flow_control_; }
    uint64_t packets_sent() const noexcept { return packets_sent_; }
    uint64_t packets_received() const noexcept { return packets_received_; }
    uint64_t packets_lost() const noexcept { return packets_lost_; }
    uint64_t bytes_sent() const noexcept { return bytes_sent_; }
    uint64_t bytes_received() const noexcept { return bytes_received_; }

    void set_callbacks(Callbacks callbacks) { callbacks_ = std::move(callbacks); }

private:
    struct SpaceState {
        explicit SpaceState(RttStats& rtt, uint64_t max_ack_delay_us)
            : sent(rtt), received(max_ack_delay_us) {}

        AckTracker sent;
        ReceivedPacketTracker received;
        uint64_t next_packet_number{0};
        bool discarded{false};
        bool ping_pending{false};

        // CRYPTO stream
        std::vector<uint8_t> crypto_send;              // Everything queued, from offset 0
        uint64_t crypto_sent{0};                       // Bytes sent at least once
        std::map<uint64_t, uint64_t> crypto_lost;      // offset -> length to resend
        uint64_t crypto_recv_offset{0};                // Bytes handed to TLS
        std::map<uint64_t, std::string> crypto_out_of_order;

        bool has_crypto_output() const noexcept {
            return !crypto_lost.empty() || crypto_sent < crypto_send.size();
        }
    };

    /**
     * One packet of the datagram being assembled, kept in clear until
     * the datagram is complete so the last packet can take the padding.
     */
    struct PacketPlan {
        PacketSpace space{PacketSpace::INITIAL};
        size_t start{0};            // Offset in the datagram
        size_t pn_offset{0};        // Relative to start
        size_t length_offset{0};    // Relative to start, 0 for short headers
        uint8_t pn_length{0};
        uint64_t packet_number{0};
        size_t payload_length{0};   // Plaintext, without the tag
        std::vector<SentFrame> frames;
    };

    struct PendingReset {
        uint64_t stream_id;
        uint64_t error_code;
        uint64_t final_size;
    };

    struct StreamEvent {
        enum class Kind : uint8_t { READABLE, RESET, STOP_SENDING, CLOSED, SENT };
        Kind kind;
        uint64_t stream_id;
        uint64_t error_code;
        bool first_byte;
        bool fin;
    };

    // Receive path
    /**
     * Remove protection from one packet in place and process it.
     *
     * @param header Long header of the packet, nullptr for 1-RTT
     */
    void open_packet(PacketSpace space, uint8_t* packet, size_t packet_len, size_t pn_offset,
                     const LongHeader* header, uint64_t now) noexcept;
    void process_packet(PacketSpace space, uint64_t pn,
                        const uint8_t* payload, size_t len, uint64_t now) noexcept;
    TransportError process_frames(PacketSpace space, const uint8_t* payload, size_t len,
                                  uint64_t now, bool& ack_eliciting, uint64_t& frame_type) noexcept;
    TransportError handle_ack(PacketSpace space, const AckFrame& ack, uint64_t now) noexcept;
    TransportError handle_crypto(PacketSpace space, const CryptoFrame& frame) noexcept;
    TransportError handle_stream(const StreamFrame& frame) noexcept;
    TransportError handle_reset_stream(const ResetStreamFrame& frame) noexcept;
    TransportError handle_stop_sending(const StopSendingFrame& frame) noexcept;
    TransportError handle_max_stream_data(const MaxStreamDataFrame& frame) noexcept;
    TransportError apply_peer_params(const uint8_t* data, size_t len) noexcept;

    /**
     * Run TLS on newly delivered CRYPTO data: install keys, queue
     * handshake bytes, apply the peer's transport parameters.
     */
    void drive_tls(uint64_t now) noexcept;
    void install_keys() noexcept;

    /**
     * Find a stream for an incoming frame, opening peer streams as needed.
     *
     * @param out Stream, or nullptr for a stream already closed
     */
    TransportError stream_for_frame(uint64_t stream_id, bool receiving, QUICStream*& out) noexcept;

    // Send path
    /**
     * Write header and plaintext payload of a packet for one space.
     *
     * @return Bytes used including room for the tag, 0 if nothing to send
     */
    size_t build_packet(PacketSpace space, uint8_t* out, size_t capacity, uint64_t now,
                        bool closing, PacketPlan& plan) noexcept;
    size_t write_packet_header(PacketSpace space, uint8_t* out, PacketPlan& plan) noexcept;

    /**
     * Pad, seal and header-protect the planned packets.
     *
     * @param track Record the packets for loss detection
     * @return Datagram size, 0 on a cipher failure
     */
    size_t finish_datagram(uint8_t* out, size_t size, std::vector<PacketPlan>& plans,
                           bool track, uint64_t now) noexcept;
    size_t write_crypto_frames(SpaceState& sp, uint8_t* out, size_t capacity,
                               std::vector<SentFrame>& frames) noexcept;
    size_t write_close_frame(PacketSpace space, uint8_t* out, size_t capacity) noexcept;
    size_t write_control_frames(uint8_t* out, size_t capacity, std::vector<SentFrame>& frames) noexcept;
    size_t write_stream_frames(uint8_t* out, size_t capacity, std::vector<SentFrame>& frames) noexcept;
    bool can_send_eliciting() const noexcept {
        return pto_sends_pending_ > 0 || cc_.available_capacity() > 0;
    }
    bool has_output(PacketSpace space, uint64_t now) const noexcept;
    bool has_app_output(uint64_t now) const noexcept;
    bool can_write(PacketSpace space) const noexcept {
        return !this->space(space).discarded && write_keys_[static_cast<size_t>(space)].valid();
    }
    void on_packet_built(PacketSpace space, uint64_t pn, size_t size,
                         std::vector<SentFrame>&& frames, uint64_t now);

    // Recovery
    void on_frames_acked(const SentPacket& pkt) noexcept;
    void on_frames_lost(PacketSpace space, const SentPacket& pkt) noexcept;
    uint64_t pto_deadline(PacketSpace& out_space) const noexcept;
    uint64_t idle_deadline() const noexcept;
    uint64_t close_deadline() const noexcept;
    void discard_space(PacketSpace space) noexcept;
    void complete_handshake(uint64_t now) noexcept;

    void queue_max_stream_data(QUICStream& stream) noexcept;
    void account_consumed(QUICStream& stream, size_t bytes) noexcept;
    void cleanup_streams() noexcept;
    void dispatch_events() noexcept;
    void enter_closed(const char* why) noexcept;

    SpaceState& space(PacketSpace s) noexcept { return spaces_[static_cast<size_t>(s)]; }
    const SpaceState& space(PacketSpace s) const noexcept { return spaces_[static_cast<size_t>(s)]; }

    bool is_server_;
    uint64_t conn_id_;
    ConnectionState state_{ConnectionState::HANDSHAKE};
    ConnectionID local_cid_;
    ConnectionID peer_cid_;
    ConnectionID original_dcid_;
    bool peer_cid_confirmed_{false};

    TransportParameters local_params_;
    TransportParameters peer_params_;
    bool peer_params_received_{false};
    bool handshake_complete_{false};
    bool handshake_done_pending_{false};
    bool handshake_done_received_{false};
    bool handshake_event_pending_{false};
    bool handshake_failed_{false};
    bool crypto_delivered_{false};     // CRYPTO data handed to TLS since the last drive
    bool address_validated_;           // Server: a Handshake packet arrived

    // TLS and packet protection
    std::unique_ptr<QuicTls> tls_;
    PacketKeys read_keys_[kNumPacketSpaces];
    PacketKeys write_keys_[kNumPacketSpaces];
    std::vector<uint8_t> rx_;          // Datagram being unprotected

    RttStats rtt_;
    NewRenoCongestionControl cc_;
    std::array<SpaceState, kNumPacketSpaces> spaces_;
    uint32_t pto_count_{0};
    size_t pto_sends_pending_{0};

    // Streams
    std::map<uint64_t, std::unique_ptr<QUICStream>> streams_;
    uint64_t next_local_bidi_{0};     // Stream index, not ID
    uint64_t next_local_uni_{0};
    uint64_t next_peer_bidi_{0};
    uint64_t next_peer_uni_{0};
    uint64_t peer_max_streams_bidi_{0};
    uint64_t peer_max_streams_uni_{0};
    uint64_t local_max_streams_bidi_;
    uint64_t local_max_streams_uni_;
    uint64_t send_cursor_{0};          // Round-robin position

    FlowControl flow_control_;

    // Pending control frames
    bool max_data_pending_{false};
    bool max_streams_bidi_pending_{false};
    bool max_streams_uni_pending_{false};
    std::set<uint64_t> max_stream_data_pending_;
    std::vector<PendingReset> resets_pending_;
    std::vector<std::pair<uint64_t, uint64_t>> stop_sending_pending_;

    std::vector<StreamEvent> events_;
    Callbacks callbacks_;

    // Close
    uint64_t close_error_code_{0};
    bool close_is_app_{false};
    uint64_t close_frame_type_{0};
    std::string close_reason_;
    bool close_pending_{false};
    bool closed_by_peer_{false};
    bool idle_timed_out_{false};
    uint64_t close_time_{0};

    // Timestamps
    uint64_t created_time_;
    uint64_t handshake_time_{0};
    uint64_t last_activity_time_;

    uint64_t packets_sent_{0};
    uint64_t packets_received_{0};
    uint64_t packets_lost_{0};
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};
    uint64_t last_eliciting_time_{0};  // Any space, for the client's handshake PTO
};

} // namespace quic
} // namespace dualmeter
