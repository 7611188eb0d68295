#include "quic_connection.h"
#include "../../core/logger.h"
#include <algorithm>
#include <cstring>

namespace dualmeter {
namespace quic {

namespace {

constexpr size_t kCryptoBufferLimit = 65536;     // Past the delivered offset
constexpr size_t kMinStreamFrameRoom = 32;
constexpr size_t kMaxControlFrameSize = 1 + 8 + 8 + 8;
constexpr size_t kCryptoFrameOverhead = 1 + 8 + 4;
constexpr size_t kMaxCloseReason = 64;
constexpr size_t kMaxLongHeaderSize = 1 + 4 + 1 + MAX_CID_LENGTH + 1 + MAX_CID_LENGTH + 1 + 2 + 4;
constexpr uint64_t kAmplificationFactor = 3;
constexpr uint32_t kMaxPtoBackoff = 10;
constexpr size_t kPtoPackets = 2;

constexpr PacketSpace kAllSpaces[] = {
    PacketSpace::INITIAL, PacketSpace::HANDSHAKE, PacketSpace::APPLICATION
};

bool is_bidi_id(uint64_t id) noexcept { return (id & 0x02) == 0; }
bool is_server_initiated_id(uint64_t id) noexcept { return (id & 0x01) != 0; }

unsigned long long ull(uint64_t v) noexcept { return static_cast<unsigned long long>(v); }

size_t index_of(PacketSpace s) noexcept { return static_cast<size_t>(s); }

SentFrame make_frame(SentFrame::Kind kind, uint64_t stream_id = 0) noexcept {
    SentFrame f;
    f.kind = kind;
    f.stream_id = stream_id;
    return f;
}

} // namespace

InitialDisposition classify_client_initial(const uint8_t* data, size_t len,
                                           LongHeader& out_header) noexcept {
    if (len == 0 || !is_long_header(data[0])) {
        return InitialDisposition::IGNORE;
    }

    uint32_t version = 0;
    ConnectionID dcid, scid;
    if (parse_long_header_invariants(data, len, version, dcid, scid) != 0) {
        return InitialDisposition::IGNORE;
    }
    if (version == 0) {
        return InitialDisposition::IGNORE;  // Clients never send Version Negotiation
    }
    if (version != QUIC_VERSION_1) {
        // Only datagrams that could carry an Initial earn a response
        if (len < MIN_INITIAL_DATAGRAM_SIZE) {
            return InitialDisposition::IGNORE;
        }
        out_header.version = version;
        out_header.dest_conn_id = dcid;
        out_header.source_conn_id = scid;
        return InitialDisposition::VERSION_NEGOTIATION;
    }
    if (((data[0] >> 4) & 0x03) != static_cast<uint8_t>(PacketType::INITIAL)) {
        return InitialDisposition::IGNORE;
    }

    size_t consumed = 0;
    if (out_header.parse(data, len, consumed) != 0) {
        return InitialDisposition::MALFORMED;
    }
    if (len < MIN_INITIAL_DATAGRAM_SIZE || dcid.length < MIN_INITIAL_DCID_LENGTH) {
        return InitialDisposition::MALFORMED;
    }
    return InitialDisposition::ACCEPT;
}

std::unique_ptr<QUICConnection> QUICConnection::accept(
    uint64_t conn_id,
    const ConnectionID& local_cid,
    const LongHeader& initial,
    const TransportParameters& local_params,
    SSL_CTX* tls_ctx,
    uint64_t now
) {
    auto conn = std::make_unique<QUICConnection>(true, conn_id, local_cid,
                                                 initial.source_conn_id,
                                                 initial.dest_conn_id,
                                                 local_params, now);
    if (!conn->start_tls(tls_ctx, std::string(), now)) {
        return nullptr;
    }
    return conn;
}

QUICConnection::QUICConnection(bool is_server,
                               uint64_t conn_id,
                               const ConnectionID& local_cid,
                               const ConnectionID& peer_cid,
                               const ConnectionID& original_dcid,
                               const TransportParameters& local_params,
                               uint64_t now)
    : is_server_(is_server),
      conn_id_(conn_id),
      local_cid_(local_cid),
      peer_cid_(peer_cid),
      original_dcid_(original_dcid),
      peer_cid_confirmed_(is_server),
      local_params_(local_params),
      address_validated_(!is_server),
      spaces_{{SpaceState(rtt_, 0),
               SpaceState(rtt_, 0),
               SpaceState(rtt_, local_params.max_ack_delay_ms * 1000)}},
      local_max_streams_bidi_(local_params.initial_max_streams_bidi),
      local_max_streams_uni_(local_params.initial_max_streams_uni),
      flow_control_(local_params.initial_max_data, 0),
      created_time_(now),
      last_activity_time_(now) {
    local_params_.has_initial_scid = true;
    local_params_.initial_scid = local_cid_;
    local_params_.has_original_dcid = is_server_;
    if (is_server_) {
        local_params_.original_dcid = original_dcid_;
    }

    LOG_DEBUG("QUIC", "conn=%llu created (%s) scid=%s dcid=%s",
              ull(conn_id_), is_server_ ? "server" : "client",
              local_cid_.to_hex().c_str(), peer_cid_.to_hex().c_str());
}

bool QUICConnection::start_tls(SSL_CTX* ctx, const std::string& server_name, uint64_t now) noexcept {
    if (ctx == nullptr) {
        LOG_ERROR("QUIC", "conn=%llu no TLS context", ull(conn_id_));
        return false;
    }

    // Initial keys depend only on the client's first Destination CID
    uint8_t client_secret[kSecretLength];
    uint8_t server_secret[kSecretLength];
    if (!derive_initial_secrets(original_dcid_.data, original_dcid_.length,
                                client_secret, server_secret)) {
        LOG_ERROR("QUIC", "conn=%llu cannot derive initial secrets", ull(conn_id_));
        return false;
    }
    size_t idx = index_of(PacketSpace::INITIAL);
    const uint8_t* read_secret = is_server_ ? client_secret : server_secret;
    const uint8_t* write_secret = is_server_ ? server_secret : client_secret;
    if (!read_keys_[idx].derive(read_secret, kSecretLength) ||
        !write_keys_[idx].derive(write_secret, kSecretLength)) {
        LOG_ERROR("QUIC", "conn=%llu cannot derive initial keys", ull(conn_id_));
        return false;
    }

    std::vector<uint8_t> params;
    local_params_.serialize(params);
    tls_ = std::make_unique<QuicTls>();
    if (!tls_->init(ctx, is_server_, std::move(params), server_name)) {
        LOG_ERROR("QUIC", "conn=%llu TLS setup failed: %s", ull(conn_id_), tls_->error().c_str());
        return false;
    }

    drive_tls(now);
    return !handshake_failed_;
}

// ============================================================================
// Receive path
// ============================================================================

void QUICConnection::process_datagram(const uint8_t* data, size_t len, uint64_t now) noexcept {
    if (state_ == ConnectionState::CLOSED || state_ == ConnectionState::DRAINING) {
        return;
    }
    if (state_ == ConnectionState::CLOSING) {
        close_pending_ = true;  // Answer with another CONNECTION_CLOSE
        return;
    }

    // Protection is removed in place
    bytes_received_ += len;
    rx_.assign(data, data + len);

    size_t pos = 0;
    while (pos < len && !is_closing() && !is_closed()) {
        uint8_t* p = rx_.data() + pos;
        size_t remaining = len - pos;

        if (p[0] == 0) {
            break;  // Datagram padding
        }

        if (is_long_header(p[0])) {
            LongHeader header;
            size_t header_len = 0;
            if (header.parse(p, remaining, header_len) != 0) {
                LOG_DEBUG("QUIC", "conn=%llu dropping unparseable long header packet",
                          ull(conn_id_));
                break;
            }
            size_t pn_offset = header_len - header.packet_number_length;
            size_t packet_len = pn_offset + header.packet_length;

            bool dcid_ok = header.dest_conn_id == local_cid_ ||
                           (is_server_ && header.dest_conn_id == original_dcid_);
            if (dcid_ok && header.type == PacketType::INITIAL) {
                open_packet(PacketSpace::INITIAL, p, packet_len, pn_offset, &header, now);
            } else if (dcid_ok && header.type == PacketType::HANDSHAKE) {
                open_packet(PacketSpace::HANDSHAKE, p, packet_len, pn_offset, &header, now);
            }
            pos += packet_len;
        } else {
            ShortHeader header;
            size_t header_len = 0;
            if (header.parse(p, remaining, local_cid_.length, header_len) != 0 ||
                header.dest_conn_id != local_cid_) {
                break;
            }
            open_packet(PacketSpace::APPLICATION, p, remaining, 1 + local_cid_.length,
                        nullptr, now);
            break;  // A short header packet runs to the end of the datagram
        }
    }

    dispatch_events();
    cleanup_streams();
    dispatch_events();
}

void QUICConnection::open_packet(PacketSpace s, uint8_t* packet, size_t packet_len,
                                 size_t pn_offset, const LongHeader* header,
                                 uint64_t now) noexcept {
    SpaceState& sp = space(s);
    PacketKeys& keys = read_keys_[index_of(s)];
    if (sp.discarded || !keys.valid()) {
        LOG_DEBUG("QUIC", "conn=%llu no %s read keys, packet dropped",
                  ull(conn_id_), packet_space_name(s));
        return;
    }

    uint8_t pn_len = unprotect_header(keys, packet, packet_len, pn_offset);
    if (pn_len == 0) {
        return;
    }
    if (header == nullptr && (packet[0] & 0x04) != 0) {
        LOG_DEBUG("QUIC", "conn=%llu key update not supported, packet dropped", ull(conn_id_));
        return;
    }
    size_t header_len = pn_offset + pn_len;
    if (packet_len < header_len + PacketKeys::kTagLength) {
        return;
    }

    uint64_t truncated_pn = 0;
    for (uint8_t i = 0; i < pn_len; i++) {
        truncated_pn = (truncated_pn << 8) | packet[pn_offset + i];
    }
    uint64_t largest = sp.received.has_received() ? sp.received.largest_received() : UINT64_MAX;
    uint64_t pn = decode_packet_number(truncated_pn, largest, static_cast<uint8_t>(pn_len * 8));

    uint8_t* payload = packet + header_len;
    size_t payload_len = packet_len - header_len;
    if (!keys.open(pn, packet, header_len, payload, payload_len)) {
        LOG_DEBUG("QUIC", "conn=%llu %s packet %llu failed authentication",
                  ull(conn_id_), packet_space_name(s), ull(pn));
        return;
    }

    uint8_t reserved_bits = header != nullptr ? 0x0c : 0x18;
    if ((packet[0] & reserved_bits) != 0) {
        close(static_cast<uint64_t>(TransportError::PROTOCOL_VIOLATION), false,
              "reserved bits set", now);
        return;
    }

    if (header != nullptr) {
        if (!peer_cid_confirmed_) {
            // First server Initial: switch to the server's chosen CID
            peer_cid_ = header->source_conn_id;
            peer_cid_confirmed_ = true;
        } else if (header->source_conn_id != peer_cid_) {
            return;
        }
    }

    process_packet(s, pn, payload, payload_len - PacketKeys::kTagLength, now);
}

void QUICConnection::process_packet(PacketSpace s, uint64_t pn,
                                    const uint8_t* payload, size_t len, uint64_t now) noexcept {
    SpaceState& sp = space(s);
    if (sp.received.is_duplicate(pn)) {
        return;
    }
    packets_received_++;

    if (len == 0) {
        close(static_cast<uint64_t>(TransportError::PROTOCOL_VIOLATION), false,
              "packet without frames", now);
        return;
    }

    bool ack_eliciting = false;
    uint64_t frame_type = 0;
    TransportError err = process_frames(s, payload, len, now, ack_eliciting, frame_type);
    if (err != TransportError::NO_ERROR) {
        LOG_WARN("QUIC", "conn=%llu transport error 0x%llx in frame 0x%llx (%s space)",
                 ull(conn_id_), ull(static_cast<uint64_t>(err)), ull(frame_type),
                 packet_space_name(s));
        close_frame_type_ = frame_type;
        close(static_cast<uint64_t>(err), false, "transport error", now);
        return;
    }
    if (is_closing()) {
        return;  // Peer closed
    }

    sp.received.on_packet_received(pn, ack_eliciting, now);
    last_activity_time_ = now;

    if (is_server_ && s == PacketSpace::HANDSHAKE && !address_validated_) {
        // Only a client that saw our Initial can send Handshake packets
        address_validated_ = true;
        discard_space(PacketSpace::INITIAL);
    }

    if (crypto_delivered_) {
        crypto_delivered_ = false;
        drive_tls(now);
        if (is_closing()) {
            return;
        }
    }

    if (!is_server_ && handshake_done_received_ && !handshake_complete_) {
        if (!tls_->handshake_complete() || !peer_params_received_) {
            close(static_cast<uint64_t>(TransportError::PROTOCOL_VIOLATION), false,
                  "HANDSHAKE_DONE before the handshake finished", now);
            return;
        }
        complete_handshake(now);
    }
}

TransportError QUICConnection::process_frames(PacketSpace s, const uint8_t* payload, size_t len,
                                              uint64_t now, bool& ack_eliciting,
                                              uint64_t& frame_type) noexcept {
    size_t pos = 0;
    while (pos < len) {
        const uint8_t* p = payload + pos;
        size_t remaining = len - pos;

        uint64_t type = 0;
        int type_len = VarInt::decode(p, remaining, type);
        frame_type = type;
        if (type_len != 1) {
            // Every frame type we know fits in one byte
            return TransportError::FRAME_ENCODING_ERROR;
        }

        if (type == static_cast<uint64_t>(FrameType::PADDING)) {
            while (pos < len && payload[pos] == 0) pos++;
            continue;
        }

        FrameType ft = static_cast<FrameType>(type);
        if (s != PacketSpace::APPLICATION) {
            bool allowed = ft == FrameType::PING || ft == FrameType::ACK ||
                           ft == FrameType::ACK_ECN || ft == FrameType::CRYPTO ||
                           ft == FrameType::CONNECTION_CLOSE;
            if (!allowed) {
                return TransportError::PROTOCOL_VIOLATION;
            }
        }
        if (ft != FrameType::ACK && ft != FrameType::ACK_ECN &&
            ft != FrameType::CONNECTION_CLOSE && ft != FrameType::CONNECTION_CLOSE_APP) {
            ack_eliciting = true;
        }

        size_t consumed = 0;
        int rc = 0;
        TransportError err = TransportError::NO_ERROR;

        if (is_stream_frame_type(type)) {
            StreamFrame frame;
            rc = frame.parse(p, remaining, consumed);
            if (rc == 0) err = handle_stream(frame);
        } else {
            switch (ft) {
                case FrameType::PING:
                    consumed = 1;
                    break;

                case FrameType::ACK:
                case FrameType::ACK_ECN: {
                    AckFrame ack;
                    rc = ack.parse(p, remaining, consumed);
                    if (rc == 0) err = handle_ack(s, ack, now);
                    break;
                }

                case FrameType::RESET_STREAM: {
                    ResetStreamFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc == 0) err = handle_reset_stream(frame);
                    break;
                }

                case FrameType::STOP_SENDING: {
                    StopSendingFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc == 0) err = handle_stop_sending(frame);
                    break;
                }

                case FrameType::CRYPTO: {
                    CryptoFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc == 0) err = handle_crypto(s, frame);
                    break;
                }

                case FrameType::NEW_TOKEN:
                    if (is_server_) return TransportError::PROTOCOL_VIOLATION;
                    rc = skip_frame(p, remaining, consumed);
                    break;

                case FrameType::MAX_DATA: {
                    SingleValueFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc == 0) flow_control_.update_peer_max_data(frame.value);
                    break;
                }

                case FrameType::MAX_STREAM_DATA: {
                    MaxStreamDataFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc == 0) err = handle_max_stream_data(frame);
                    break;
                }

                case FrameType::MAX_STREAMS_BIDI:
                case FrameType::MAX_STREAMS_UNI: {
                    SingleValueFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc != 0) break;
                    if (frame.value > (1ULL << 60)) return TransportError::FRAME_ENCODING_ERROR;
                    uint64_t& limit = ft == FrameType::MAX_STREAMS_BIDI ? peer_max_streams_bidi_
                                                                        : peer_max_streams_uni_;
                    limit = std::max(limit, frame.value);
                    break;
                }

                case FrameType::DATA_BLOCKED:
                case FrameType::STREAMS_BLOCKED_BIDI:
                case FrameType::STREAMS_BLOCKED_UNI: {
                    SingleValueFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    break;
                }

                case FrameType::STREAM_DATA_BLOCKED:
                case FrameType::NEW_CONNECTION_ID:
                case FrameType::RETIRE_CONNECTION_ID:
                case FrameType::PATH_CHALLENGE:
                case FrameType::PATH_RESPONSE:
                    rc = skip_frame(p, remaining, consumed);
                    break;

                case FrameType::CONNECTION_CLOSE:
                case FrameType::CONNECTION_CLOSE_APP: {
                    ConnectionCloseFrame frame;
                    rc = frame.parse(p, remaining, consumed);
                    if (rc != 0) break;
                    state_ = ConnectionState::DRAINING;
                    closed_by_peer_ = true;
                    close_error_code_ = frame.error_code;
                    close_is_app_ = frame.is_app_error;
                    close_time_ = now;
                    if (!frame.is_app_error && !handshake_complete_ &&
                        frame.error_code >= static_cast<uint64_t>(TransportError::CRYPTO_ERROR) &&
                        frame.error_code < static_cast<uint64_t>(TransportError::CRYPTO_ERROR) + 0x100) {
                        handshake_failed_ = true;
                    }
                    LOG_DEBUG("QUIC", "conn=%llu peer closed: %s error 0x%llx",
                              ull(conn_id_), frame.is_app_error ? "application" : "transport",
                              ull(frame.error_code));
                    return TransportError::NO_ERROR;
                }

                case FrameType::HANDSHAKE_DONE:
                    if (is_server_) return TransportError::PROTOCOL_VIOLATION;
                    handshake_done_received_ = true;
                    consumed = 1;
                    break;

                default:
                    return TransportError::FRAME_ENCODING_ERROR;
            }
        }

        if (rc != 0) {
            return TransportError::FRAME_ENCODING_ERROR;
        }
        if (err != TransportError::NO_ERROR) {
            return err;
        }
        pos += consumed;
    }
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_ack(PacketSpace s, const AckFrame& ack, uint64_t now) noexcept {
    SpaceState& sp = space(s);
    uint64_t exponent = peer_params_received_ ? peer_params_.ack_delay_exponent : 3;
    uint64_t ack_delay_us = std::min<uint64_t>(ack.ack_delay, 1ULL << 32) << exponent;
    uint64_t max_ack_delay_us =
        s == PacketSpace::APPLICATION ? peer_params_.max_ack_delay_ms * 1000 : 0;

    std::vector<SentPacket> acked;
    std::vector<SentPacket> lost;
    if (sp.sent.on_ack_received(ack, ack_delay_us, max_ack_delay_us, now, cc_, acked, lost) != 0) {
        return TransportError::PROTOCOL_VIOLATION;
    }

    for (const auto& pkt : acked) {
        on_frames_acked(pkt);
    }
    for (const auto& pkt : lost) {
        on_frames_lost(s, pkt);
    }
    packets_lost_ += lost.size();
    if (!acked.empty()) {
        pto_count_ = 0;
    }
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_crypto(PacketSpace s, const CryptoFrame& frame) noexcept {
    SpaceState& sp = space(s);
    uint64_t end = frame.offset + frame.length;
    if (end <= sp.crypto_recv_offset) {
        return TransportError::NO_ERROR;  // Retransmitted copy
    }
    if (end > sp.crypto_recv_offset + kCryptoBufferLimit) {
        return TransportError::CRYPTO_BUFFER_EXCEEDED;
    }
    if (frame.offset > sp.crypto_recv_offset) {
        std::string& held = sp.crypto_out_of_order[frame.offset];
        if (frame.length > held.size()) {
            held.assign(reinterpret_cast<const char*>(frame.data), frame.length);
        }
        return TransportError::NO_ERROR;
    }

    size_t skip = sp.crypto_recv_offset - frame.offset;
    if (!tls_->provide_data(s, frame.data + skip, frame.length - skip)) {
        LOG_WARN("QUIC", "conn=%llu TLS rejected %s handshake data",
                 ull(conn_id_), packet_space_name(s));
        return TransportError::INTERNAL_ERROR;
    }
    sp.crypto_recv_offset = end;
    crypto_delivered_ = true;

    auto it = sp.crypto_out_of_order.begin();
    while (it != sp.crypto_out_of_order.end() && it->first <= sp.crypto_recv_offset) {
        uint64_t seg_end = it->first + it->second.size();
        if (seg_end > sp.crypto_recv_offset) {
            size_t held_skip = sp.crypto_recv_offset - it->first;
            if (!tls_->provide_data(s,
                                    reinterpret_cast<const uint8_t*>(it->second.data()) + held_skip,
                                    it->second.size() - held_skip)) {
                return TransportError::INTERNAL_ERROR;
            }
            sp.crypto_recv_offset = seg_end;
        }
        it = sp.crypto_out_of_order.erase(it);
    }
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::apply_peer_params(const uint8_t* data, size_t len) noexcept {
    TransportParameters params;
    if (params.parse(data, len) != 0) {
        return TransportError::TRANSPORT_PARAMETER_ERROR;
    }
    if (!params.has_initial_scid || params.initial_scid != peer_cid_) {
        return TransportError::TRANSPORT_PARAMETER_ERROR;
    }
    if (is_server_) {
        if (params.has_original_dcid) {
            return TransportError::TRANSPORT_PARAMETER_ERROR;
        }
    } else if (!params.has_original_dcid || params.original_dcid != original_dcid_) {
        return TransportError::TRANSPORT_PARAMETER_ERROR;
    }

    peer_params_ = params;
    peer_params_received_ = true;
    flow_control_.update_peer_max_data(params.initial_max_data);
    peer_max_streams_bidi_ = std::max(peer_max_streams_bidi_, params.initial_max_streams_bidi);
    peer_max_streams_uni_ = std::max(peer_max_streams_uni_, params.initial_max_streams_uni);

    LOG_DEBUG("QUIC", "conn=%llu peer params: max_data=%llu bidi=%llu uni=%llu idle=%llums",
              ull(conn_id_), ull(params.initial_max_data), ull(params.initial_max_streams_bidi),
              ull(params.initial_max_streams_uni), ull(params.max_idle_timeout_ms));
    return TransportError::NO_ERROR;
}

void QUICConnection::drive_tls(uint64_t now) noexcept {
    if (!tls_ || is_closing() || is_closed()) {
        return;
    }

    bool ok = tls_->advance();
    install_keys();
    for (PacketSpace s : kAllSpaces) {
        if (!tls_->has_output(s)) continue;
        std::vector<uint8_t> bytes = tls_->take_output(s);
        SpaceState& sp = space(s);
        if (!sp.discarded) {
            sp.crypto_send.insert(sp.crypto_send.end(), bytes.begin(), bytes.end());
        }
    }

    if (!ok) {
        handshake_failed_ = true;
        LOG_WARN("QUIC", "conn=%llu TLS handshake failed: %s (alert %u)",
                 ull(conn_id_), tls_->error().c_str(), static_cast<unsigned>(tls_->alert()));
        close(static_cast<uint64_t>(TransportError::CRYPTO_ERROR) + tls_->alert(), false,
              "TLS handshake failure", now);
        return;
    }

    if (!peer_params_received_ && tls_->has_peer_params()) {
        const std::vector<uint8_t>& params = tls_->peer_params();
        TransportError err = apply_peer_params(params.data(), params.size());
        if (err != TransportError::NO_ERROR) {
            LOG_WARN("QUIC", "conn=%llu invalid peer transport parameters", ull(conn_id_));
            close(static_cast<uint64_t>(err), false, "invalid transport parameters", now);
            return;
        }
    }

    if (is_server_ && tls_->handshake_complete() && !handshake_complete_) {
        complete_handshake(now);
    }
}

void QUICConnection::install_keys() noexcept {
    for (PacketSpace s : {PacketSpace::HANDSHAKE, PacketSpace::APPLICATION}) {
        size_t idx = index_of(s);
        if (!read_keys_[idx].valid() && tls_->has_read_secret(s) &&
            !read_keys_[idx].derive(tls_->read_secret(s), kSecretLength)) {
            LOG_ERROR("QUIC", "conn=%llu cannot derive %s read keys",
                      ull(conn_id_), packet_space_name(s));
        }
        if (!write_keys_[idx].valid() && tls_->has_write_secret(s) &&
            !write_keys_[idx].derive(tls_->write_secret(s), kSecretLength)) {
            LOG_ERROR("QUIC", "conn=%llu cannot derive %s write keys",
                      ull(conn_id_), packet_space_name(s));
        }
    }
}

TransportError QUICConnection::stream_for_frame(uint64_t stream_id, bool receiving,
                                                QUICStream*& out) noexcept {
    out = nullptr;
    bool local = is_server_initiated_id(stream_id) == is_server_;
    bool bidi = is_bidi_id(stream_id);
    uint64_t index = stream_id >> 2;

    if (local) {
        if (receiving && !bidi) {
            return TransportError::STREAM_STATE_ERROR;  // Our send-only stream
        }
        uint64_t next = bidi ? next_local_bidi_ : next_local_uni_;
        if (index >= next) {
            return TransportError::STREAM_STATE_ERROR;
        }
        out = get_stream(stream_id);
        return TransportError::NO_ERROR;
    }

    if (!receiving && !bidi) {
        return TransportError::STREAM_STATE_ERROR;  // Peer's send-only stream
    }
    uint64_t limit = bidi ? local_max_streams_bidi_ : local_max_streams_uni_;
    if (index >= limit) {
        return TransportError::STREAM_LIMIT_ERROR;
    }

    // Opening a stream implicitly opens every lower-numbered one of its type
    uint64_t& next = bidi ? next_peer_bidi_ : next_peer_uni_;
    while (next <= index) {
        uint64_t id = (next << 2) | (is_server_ ? 0x00 : 0x01) | (bidi ? 0x00 : 0x02);
        uint64_t recv_window = bidi ? local_params_.initial_max_stream_data_bidi_remote
                                    : local_params_.initial_max_stream_data_uni;
        uint64_t send_limit = bidi ? peer_params_.initial_max_stream_data_bidi_local : 0;
        streams_[id] = std::make_unique<QUICStream>(id, is_server_, recv_window, send_limit);
        next++;
    }
    out = get_stream(stream_id);
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_stream(const StreamFrame& frame) noexcept {
    QUICStream* stream = nullptr;
    TransportError err = stream_for_frame(frame.stream_id, true, stream);
    if (err != TransportError::NO_ERROR || stream == nullptr) {
        return err;
    }

    uint64_t new_bytes = 0;
    if (!stream->flow_control().on_data_received(frame.offset, frame.length, new_bytes) ||
        !flow_control_.on_data_received(new_bytes)) {
        return TransportError::FLOW_CONTROL_ERROR;
    }

    err = stream->on_stream_frame(frame.offset, frame.data, frame.length, frame.fin);
    if (err != TransportError::NO_ERROR) {
        return err;
    }

    if (stream->receive_stopped()) {
        // Nobody will read these bytes; return the connection credit now
        if (flow_control_.on_data_consumed(new_bytes)) max_data_pending_ = true;
        return TransportError::NO_ERROR;
    }

    if (events_.empty() || events_.back().kind != StreamEvent::Kind::READABLE ||
        events_.back().stream_id != frame.stream_id) {
        events_.push_back({StreamEvent::Kind::READABLE, frame.stream_id, 0, false, false});
    }
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_reset_stream(const ResetStreamFrame& frame) noexcept {
    QUICStream* stream = nullptr;
    TransportError err = stream_for_frame(frame.stream_id, true, stream);
    if (err != TransportError::NO_ERROR || stream == nullptr) {
        return err;
    }

    uint64_t new_bytes = 0;
    if (!stream->flow_control().on_data_received(frame.final_size, 0, new_bytes) ||
        !flow_control_.on_data_received(new_bytes)) {
        return TransportError::FLOW_CONTROL_ERROR;
    }
    if (stream->reset_received()) {
        return stream->on_reset(frame.final_size, frame.error_code);
    }

    // Bytes the application will never read go back to the connection window
    uint64_t unread = stream->receive_stopped()
                          ? new_bytes
                          : frame.final_size - stream->flow_control().consumed_offset();
    err = stream->on_reset(frame.final_size, frame.error_code);
    if (err != TransportError::NO_ERROR) {
        return err;
    }
    if (flow_control_.on_data_consumed(unread)) {
        max_data_pending_ = true;
    }

    events_.push_back({StreamEvent::Kind::RESET, frame.stream_id, frame.error_code, false, false});
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_stop_sending(const StopSendingFrame& frame) noexcept {
    QUICStream* stream = nullptr;
    TransportError err = stream_for_frame(frame.stream_id, false, stream);
    if (err != TransportError::NO_ERROR || stream == nullptr) {
        return err;
    }

    if (!stream->reset_sent() && !stream->send_finished()) {
        uint64_t final_size = stream->flow_control().sent_offset();
        stream->reset_send(frame.error_code);
        resets_pending_.push_back({frame.stream_id, frame.error_code, final_size});
        events_.push_back({StreamEvent::Kind::STOP_SENDING, frame.stream_id,
                           frame.error_code, false, false});
    }
    return TransportError::NO_ERROR;
}

TransportError QUICConnection::handle_max_stream_data(const MaxStreamDataFrame& frame) noexcept {
    QUICStream* stream = nullptr;
    TransportError err = stream_for_frame(frame.stream_id, false, stream);
    if (err == TransportError::NO_ERROR && stream != nullptr) {
        stream->flow_control().update_peer_max_stream_data(frame.max_data);
    }
    return err;
}

// ============================================================================
// Send path
// ============================================================================

size_t QUICConnection::generate_datagram(uint8_t* out, size_t capacity, uint64_t now) noexcept {
    if (capacity < MAX_DATAGRAM_SIZE ||
        state_ == ConnectionState::CLOSED || state_ == ConnectionState::DRAINING) {
        return 0;
    }

    std::vector<PacketPlan> plans;
    size_t pos = 0;

    if (state_ == ConnectionState::CLOSING) {
        if (!close_pending_) return 0;
        close_pending_ = false;
        // The peer may lack any of our current keys, so close in every space
        for (PacketSpace s : kAllSpaces) {
            if (!can_write(s)) continue;
            PacketPlan plan;
            size_t n = build_packet(s, out + pos, MAX_DATAGRAM_SIZE - pos, now, true, plan);
            if (n == 0) continue;
            plan.start = pos;
            pos += n;
            plans.push_back(std::move(plan));
        }
        return plans.empty() ? 0 : finish_datagram(out, pos, plans, false, now);
    }

    // Anti-amplification: an unvalidated server sends at most 3x what it received
    if (!address_validated_ &&
        bytes_sent_ + MAX_DATAGRAM_SIZE > kAmplificationFactor * bytes_received_) {
        return 0;
    }

    for (PacketSpace s : kAllSpaces) {
        bool wanted = s == PacketSpace::APPLICATION ? has_app_output(now)
                                                    : can_write(s) && has_output(s, now);
        if (!wanted) continue;
        PacketPlan plan;
        size_t n = build_packet(s, out + pos, MAX_DATAGRAM_SIZE - pos, now, false, plan);
        if (n == 0) continue;
        plan.start = pos;
        pos += n;
        plans.push_back(std::move(plan));
    }

    size_t written = plans.empty() ? 0 : finish_datagram(out, pos, plans, true, now);

    dispatch_events();
    cleanup_streams();
    dispatch_events();
    return written;
}

bool QUICConnection::has_output(PacketSpace s, uint64_t now) const noexcept {
    const SpaceState& sp = space(s);
    if (sp.received.ack_due(now)) {
        return true;
    }
    return (sp.has_crypto_output() || sp.ping_pending) && can_send_eliciting();
}

bool QUICConnection::has_app_output(uint64_t now) const noexcept {
    if (!can_write(PacketSpace::APPLICATION) || !peer_params_received_) {
        return false;
    }
    const SpaceState& sp = space(PacketSpace::APPLICATION);
    if (sp.received.ack_due(now)) {
        return true;
    }
    if (!can_send_eliciting()) {
        return false;
    }
    if (sp.has_crypto_output() || sp.ping_pending || handshake_done_pending_ ||
        max_data_pending_ || max_streams_bidi_pending_ || max_streams_uni_pending_ ||
        !max_stream_data_pending_.empty() || !resets_pending_.empty() ||
        !stop_sending_pending_.empty()) {
        return true;
    }
    uint64_t credit = flow_control_.available_window();
    for (const auto& entry : streams_) {
        if (entry.second->has_data_to_send(credit)) {
            return true;
        }
    }
    return false;
}

size_t QUICConnection::write_packet_header(PacketSpace s, uint8_t* out, PacketPlan& plan) noexcept {
    size_t len = 0;
    if (s == PacketSpace::APPLICATION) {
        ShortHeader header;
        header.dest_conn_id = peer_cid_;
        header.packet_number = plan.packet_number;
        header.packet_number_length = plan.pn_length;
        len = header.serialize(out);
        plan.length_offset = 0;
        plan.pn_offset = len - plan.pn_length;
        return len;
    }

    LongHeader header;
    header.type = s == PacketSpace::INITIAL ? PacketType::INITIAL : PacketType::HANDSHAKE;
    header.dest_conn_id = peer_cid_;
    header.source_conn_id = local_cid_;
    header.packet_number = plan.packet_number;
    header.packet_number_length = plan.pn_length;
    header.packet_length = plan.pn_length;  // Rewritten once the payload is final
    len = header.serialize(out);
    plan.pn_offset = len - plan.pn_length;
    plan.length_offset = plan.pn_offset - 2;
    return len;
}

size_t QUICConnection::build_packet(PacketSpace s, uint8_t* out, size_t capacity, uint64_t now,
                                    bool closing, PacketPlan& plan) noexcept {
    if (capacity < kMaxLongHeaderSize + PacketKeys::kTagLength + kMaxControlFrameSize) {
        return 0;
    }

    SpaceState& sp = space(s);
    plan.space = s;
    plan.packet_number = sp.next_packet_number;
    plan.pn_length = closing ? 4
                             : encode_packet_number_length(plan.packet_number,
                                                           sp.sent.largest_acked(),
                                                           sp.sent.has_largest_acked());
    size_t header_len = write_packet_header(s, out, plan);

    uint8_t* payload = out + header_len;
    size_t budget = capacity - header_len - PacketKeys::kTagLength;
    size_t pos = 0;

    if (closing) {
        pos = write_close_frame(s, payload, budget);
    } else {
        if (sp.received.ack_pending()) {
            AckFrame ack;
            if (sp.received.build_ack_frame(ack, now, local_params_.ack_delay_exponent) &&
                ack.serialized_size() <= budget) {
                pos += ack.serialize(payload + pos);
                sp.received.on_ack_sent();
            }
        }

        if (can_send_eliciting()) {
            pos += write_crypto_frames(sp, payload + pos, budget - pos, plan.frames);
            if (s == PacketSpace::APPLICATION) {
                if (handshake_done_pending_ && budget - pos >= 1) {
                    payload[pos++] = static_cast<uint8_t>(FrameType::HANDSHAKE_DONE);
                    plan.frames.push_back(make_frame(SentFrame::Kind::HANDSHAKE_DONE));
                    handshake_done_pending_ = false;
                }
                pos += write_control_frames(payload + pos, budget - pos, plan.frames);
                pos += write_stream_frames(payload + pos, budget - pos, plan.frames);
            }
            if (sp.ping_pending) {
                if (plan.frames.empty() && budget - pos >= 1) {
                    payload[pos++] = static_cast<uint8_t>(FrameType::PING);
                    plan.frames.push_back(make_frame(SentFrame::Kind::PING));
                }
                sp.ping_pending = false;
            }
        }
    }

    if (pos == 0) {
        return 0;
    }

    // Header protection samples 4 bytes past the start of the packet number
    size_t min_payload = 4 - plan.pn_length;
    if (pos < min_payload) {
        std::memset(payload + pos, 0, min_payload - pos);
        pos = min_payload;
    }
    plan.payload_length = pos;
    return header_len + pos + PacketKeys::kTagLength;
}

size_t QUICConnection::write_crypto_frames(SpaceState& sp, uint8_t* out, size_t capacity,
                                           std::vector<SentFrame>& frames) noexcept {
    size_t pos = 0;
    while (capacity - pos > kCryptoFrameOverhead && sp.has_crypto_output()) {
        bool retransmit = !sp.crypto_lost.empty();
        uint64_t offset = retransmit ? sp.crypto_lost.begin()->first : sp.crypto_sent;
        uint64_t length = retransmit ? sp.crypto_lost.begin()->second
                                     : sp.crypto_send.size() - sp.crypto_sent;
        length = std::min<uint64_t>(length, capacity - pos - kCryptoFrameOverhead);

        CryptoFrame frame;
        frame.offset = offset;
        frame.length = length;
        frame.data = sp.crypto_send.data() + offset;
        pos += frame.serialize(out + pos);

        SentFrame sent = make_frame(SentFrame::Kind::CRYPTO);
        sent.offset = offset;
        sent.length = length;
        frames.push_back(sent);

        if (retransmit) {
            uint64_t rest = sp.crypto_lost.begin()->second - length;
            sp.crypto_lost.erase(sp.crypto_lost.begin());
            if (rest > 0) {
                uint64_t& held = sp.crypto_lost[offset + length];
                held = std::max(held, rest);
            }
        } else {
            sp.crypto_sent += length;
        }
    }
    return pos;
}

size_t QUICConnection::write_close_frame(PacketSpace s, uint8_t* out, size_t capacity) noexcept {
    ConnectionCloseFrame frame;
    frame.is_app_error = close_is_app_;
    frame.error_code = close_error_code_;
    frame.frame_type = close_frame_type_;
    frame.reason_length = std::min(close_reason_.size(), kMaxCloseReason);
    frame.reason_phrase = close_reason_.c_str();

    if (s != PacketSpace::APPLICATION && frame.is_app_error) {
        // Application closes are not allowed in Initial or Handshake packets
        frame.is_app_error = false;
        frame.error_code = 0x0c;  // APPLICATION_ERROR
        frame.frame_type = 0;
        frame.reason_length = 0;
    }
    if (capacity < kMaxControlFrameSize + frame.reason_length) {
        return 0;
    }
    return frame.serialize(out);
}

size_t QUICConnection::finish_datagram(uint8_t* out, size_t size, std::vector<PacketPlan>& plans,
                                       bool track, uint64_t now) noexcept {
    // Client Initials and ack-eliciting server Initials fill the datagram
    bool pad = false;
    for (const auto& plan : plans) {
        if (plan.space == PacketSpace::INITIAL && (!is_server_ || !plan.frames.empty())) {
            pad = true;
        }
    }
    if (pad && size < MIN_INITIAL_DATAGRAM_SIZE) {
        PacketPlan& last = plans.back();
        size_t extra = MIN_INITIAL_DATAGRAM_SIZE - size;
        std::memset(out + last.start + last.pn_offset + last.pn_length + last.payload_length,
                    0, extra);
        last.payload_length += extra;
        size = MIN_INITIAL_DATAGRAM_SIZE;
    }

    bool sent_handshake = false;
    for (auto& plan : plans) {
        uint8_t* packet = out + plan.start;
        size_t header_len = plan.pn_offset + plan.pn_length;
        size_t packet_len = header_len + plan.payload_length + PacketKeys::kTagLength;
        if (plan.length_offset != 0) {
            VarInt::encode_fixed(plan.pn_length + plan.payload_length + PacketKeys::kTagLength,
                                 2, packet + plan.length_offset);
        }

        PacketKeys& keys = write_keys_[index_of(plan.space)];
        if (!keys.seal(plan.packet_number, packet, header_len, packet + header_len,
                       plan.payload_length) ||
            !protect_header(keys, packet, packet_len, plan.pn_offset)) {
            LOG_ERROR("QUIC", "conn=%llu %s packet protection failed",
                      ull(conn_id_), packet_space_name(plan.space));
            return 0;
        }

        if (track) {
            on_packet_built(plan.space, plan.packet_number, packet_len,
                            std::move(plan.frames), now);
        } else {
            space(plan.space).next_packet_number = plan.packet_number + 1;
            packets_sent_++;
        }
        sent_handshake = sent_handshake || plan.space == PacketSpace::HANDSHAKE;
    }
    bytes_sent_ += size;

    if (!is_server_ && track && sent_handshake) {
        discard_space(PacketSpace::INITIAL);
    }
    return size;
}

size_t QUICConnection::write_control_frames(uint8_t* out, size_t capacity,
                                            std::vector<SentFrame>& frames) noexcept {
    size_t pos = 0;
    auto room = [&]() { return capacity - pos >= kMaxControlFrameSize; };

    if (max_data_pending_ && room()) {
        SingleValueFrame frame;
        frame.type = static_cast<uint8_t>(FrameType::MAX_DATA);
        frame.value = flow_control_.recv_max_data();
        pos += frame.serialize(out + pos);
        frames.push_back(make_frame(SentFrame::Kind::MAX_DATA));
        max_data_pending_ = false;
    }
    if (max_streams_bidi_pending_ && room()) {
        SingleValueFrame frame;
        frame.type = static_cast<uint8_t>(FrameType::MAX_STREAMS_BIDI);
        frame.value = local_max_streams_bidi_;
        pos += frame.serialize(out + pos);
        frames.push_back(make_frame(SentFrame::Kind::MAX_STREAMS_BIDI));
        max_streams_bidi_pending_ = false;
    }
    if (max_streams_uni_pending_ && room()) {
        SingleValueFrame frame;
        frame.type = static_cast<uint8_t>(FrameType::MAX_STREAMS_UNI);
        frame.value = local_max_streams_uni_;
        pos += frame.serialize(out + pos);
        frames.push_back(make_frame(SentFrame::Kind::MAX_STREAMS_UNI));
        max_streams_uni_pending_ = false;
    }

    auto it = max_stream_data_pending_.begin();
    while (it != max_stream_data_pending_.end() && room()) {
        QUICStream* stream = get_stream(*it);
        if (stream != nullptr && !stream->final_size_known() && !stream->recv_finished()) {
            MaxStreamDataFrame frame;
            frame.stream_id = *it;
            frame.max_data = stream->flow_control().recv_max_offset();
            pos += frame.serialize(out + pos);
            frames.push_back(make_frame(SentFrame::Kind::MAX_STREAM_DATA, *it));
        }
        it = max_stream_data_pending_.erase(it);
    }

    while (!resets_pending_.empty() && room()) {
        const PendingReset& reset = resets_pending_.back();
        ResetStreamFrame frame;
        frame.stream_id = reset.stream_id;
        frame.error_code = reset.error_code;
        frame.final_size = reset.final_size;
        pos += frame.serialize(out + pos);
        SentFrame sent = make_frame(SentFrame::Kind::RESET_STREAM, reset.stream_id);
        sent.offset = reset.final_size;
        sent.error_code = reset.error_code;
        frames.push_back(sent);
        resets_pending_.pop_back();
    }

    while (!stop_sending_pending_.empty() && room()) {
        const auto& stop = stop_sending_pending_.back();
        StopSendingFrame frame;
        frame.stream_id = stop.first;
        frame.error_code = stop.second;
        pos += frame.serialize(out + pos);
        SentFrame sent = make_frame(SentFrame::Kind::STOP_SENDING, stop.first);
        sent.error_code = stop.second;
        frames.push_back(sent);
        stop_sending_pending_.pop_back();
    }

    return pos;
}

size_t QUICConnection::write_stream_frames(uint8_t* out, size_t capacity,
                                           std::vector<SentFrame>& frames) noexcept {
    size_t pos = 0;
    bool progress = true;

    // Round-robin, starting after the stream served last
    while (progress && capacity - pos > kMinStreamFrameRoom && !streams_.empty()) {
        progress = false;
        auto it = streams_.upper_bound(send_cursor_);
        size_t total = streams_.size();

        for (size_t visited = 0; visited < total && capacity - pos > kMinStreamFrameRoom; ++visited) {
            if (it == streams_.end()) it = streams_.begin();
            QUICStream& stream = *it->second;
            uint64_t credit = flow_control_.available_window();

            if (stream.has_data_to_send(credit)) {
                bool had_first = stream.first_byte_sent();
                bool had_fin = stream.fin_sent();
                StreamFrame frame;
                uint64_t new_bytes = 0;
                if (stream.next_frame(capacity - pos, credit, frame, new_bytes)) {
                    pos += frame.serialize(out + pos);
                    flow_control_.add_sent_data(new_bytes);

                    SentFrame sent = make_frame(SentFrame::Kind::STREAM, frame.stream_id);
                    sent.offset = frame.offset;
                    sent.length = frame.length;
                    sent.fin = frame.fin;
                    frames.push_back(sent);

                    send_cursor_ = it->first;
                    progress = true;

                    bool first_now = !had_first && stream.first_byte_sent();
                    bool fin_now = !had_fin && stream.fin_sent();
                    if (first_now || fin_now) {
                        events_.push_back({StreamEvent::Kind::SENT, frame.stream_id, 0,
                                           first_now, fin_now});
                    }
                }
            }
            ++it;
        }
    }
    return pos;
}

void QUICConnection::on_packet_built(PacketSpace s, uint64_t pn, size_t size,
                                     std::vector<SentFrame>&& frames, uint64_t now) {
    SpaceState& sp = space(s);
    sp.next_packet_number = pn + 1;

    SentPacket pkt;
    pkt.packet_number = pn;
    pkt.time_sent = now;
    pkt.size = size;
    pkt.ack_eliciting = !frames.empty();
    pkt.in_flight = pkt.ack_eliciting;
    pkt.frames = std::move(frames);

    if (pkt.ack_eliciting) {
        last_eliciting_time_ = now;
        if (pto_sends_pending_ > 0) pto_sends_pending_--;
    }
    sp.sent.on_packet_sent(std::move(pkt), cc_);
    packets_sent_++;
}

// ============================================================================
// Recovery
// ============================================================================

void QUICConnection::on_frames_acked(const SentPacket& pkt) noexcept {
    for (const auto& frame : pkt.frames) {
        if (frame.kind != SentFrame::Kind::STREAM) continue;
        QUICStream* stream = get_stream(frame.stream_id);
        if (stream != nullptr) {
            stream->on_frame_acked(frame.offset, frame.length, frame.fin);
        }
    }
}

void QUICConnection::on_frames_lost(PacketSpace s, const SentPacket& pkt) noexcept {
    SpaceState& sp = space(s);
    for (const auto& frame : pkt.frames) {
        switch (frame.kind) {
            case SentFrame::Kind::STREAM: {
                QUICStream* stream = get_stream(frame.stream_id);
                if (stream != nullptr && !stream->reset_sent()) {
                    stream->on_frame_lost(frame.offset, frame.length, frame.fin);
                }
                break;
            }
            case SentFrame::Kind::CRYPTO:
                if (!sp.discarded) {
                    uint64_t& held = sp.crypto_lost[frame.offset];
                    held = std::max(held, frame.length);
                }
                break;
            case SentFrame::Kind::HANDSHAKE_DONE:
                handshake_done_pending_ = true;
                break;
            case SentFrame::Kind::MAX_DATA:
                max_data_pending_ = true;
                break;
            case SentFrame::Kind::MAX_STREAMS_BIDI:
                max_streams_bidi_pending_ = true;
                break;
            case SentFrame::Kind::MAX_STREAMS_UNI:
                max_streams_uni_pending_ = true;
                break;
            case SentFrame::Kind::MAX_STREAM_DATA:
                if (streams_.count(frame.stream_id) != 0) {
                    max_stream_data_pending_.insert(frame.stream_id);
                }
                break;
            case SentFrame::Kind::RESET_STREAM:
                if (streams_.count(frame.stream_id) != 0) {
                    resets_pending_.push_back({frame.stream_id, frame.error_code, frame.offset});
                }
                break;
            case SentFrame::Kind::STOP_SENDING:
                if (streams_.count(frame.stream_id) != 0) {
                    stop_sending_pending_.emplace_back(frame.stream_id, frame.error_code);
                }
                break;
            case SentFrame::Kind::PING:
                break;
        }
    }
}

uint64_t QUICConnection::pto_deadline(PacketSpace& out_space) const noexcept {
    uint64_t deadline = 0;
    uint32_t backoff = std::min(pto_count_, kMaxPtoBackoff);
    for (PacketSpace s : kAllSpaces) {
        const SpaceState& sp = space(s);
        if (sp.discarded || !sp.sent.has_ack_eliciting_in_flight()) continue;
        if (s == PacketSpace::APPLICATION && !handshake_complete_) continue;
        uint64_t max_ack_delay =
            s == PacketSpace::APPLICATION ? peer_params_.max_ack_delay_ms * 1000 : 0;
        uint64_t t = sp.sent.time_of_last_ack_eliciting() + (rtt_.pto(max_ack_delay) << backoff);
        if (deadline == 0 || t < deadline) {
            deadline = t;
            out_space = s;
        }
    }

    // Until the handshake is confirmed the client keeps a PTO armed even
    // with nothing in flight, so a lost server flight cannot stall both ends
    if (deadline == 0 && !is_server_ && !handshake_complete_ && last_eliciting_time_ != 0) {
        out_space = can_write(PacketSpace::HANDSHAKE) ? PacketSpace::HANDSHAKE
                                                      : PacketSpace::INITIAL;
        deadline = last_eliciting_time_ + (rtt_.pto(0) << backoff);
    }
    return deadline;
}

uint64_t QUICConnection::idle_deadline() const noexcept {
    uint64_t timeout_ms = local_params_.max_idle_timeout_ms;
    if (peer_params_received_ && peer_params_.max_idle_timeout_ms != 0 &&
        (timeout_ms == 0 || peer_params_.max_idle_timeout_ms < timeout_ms)) {
        timeout_ms = peer_params_.max_idle_timeout_ms;
    }
    if (timeout_ms == 0) {
        return 0;
    }
    uint64_t timeout_us = std::max(timeout_ms * 1000, 3 * rtt_.pto(0));
    return last_activity_time_ + timeout_us;
}

uint64_t QUICConnection::close_deadline() const noexcept {
    return close_time_ + 3 * rtt_.pto(0);
}

uint64_t QUICConnection::next_timeout() const noexcept {
    if (state_ == ConnectionState::CLOSED) {
        return 0;
    }
    if (is_closing()) {
        return close_deadline();
    }

    uint64_t deadline = idle_deadline();
    auto consider = [&deadline](uint64_t t) {
        if (t != 0 && (deadline == 0 || t < deadline)) deadline = t;
    };

    uint64_t loss_time = 0;
    for (PacketSpace s : kAllSpaces) {
        const SpaceState& sp = space(s);
        if (sp.discarded) continue;
        consider(sp.received.ack_deadline());
        uint64_t t = sp.sent.loss_time();
        if (t != 0 && (loss_time == 0 || t < loss_time)) loss_time = t;
    }

    if (loss_time != 0) {
        consider(loss_time);
    } else {
        PacketSpace s = PacketSpace::INITIAL;
        consider(pto_deadline(s));
    }
    return deadline;
}

void QUICConnection::on_timeout(uint64_t now) noexcept {
    if (state_ == ConnectionState::CLOSED) {
        return;
    }
    if (is_closing()) {
        if (now >= close_deadline()) enter_closed("close period elapsed");
        return;
    }

    uint64_t idle = idle_deadline();
    if (idle != 0 && now >= idle) {
        idle_timed_out_ = true;
        enter_closed("idle timeout");
        return;
    }

    bool loss_fired = false;
    for (PacketSpace s : kAllSpaces) {
        SpaceState& sp = space(s);
        if (sp.discarded || sp.sent.loss_time() == 0 || now < sp.sent.loss_time()) continue;
        std::vector<SentPacket> lost;
        sp.sent.detect_lost_packets(now, cc_, lost);
        for (const auto& pkt : lost) {
            on_frames_lost(s, pkt);
        }
        packets_lost_ += lost.size();
        loss_fired = true;
    }

    if (!loss_fired) {
        PacketSpace s = PacketSpace::INITIAL;
        uint64_t pto = pto_deadline(s);
        if (pto != 0 && now >= pto) {
            pto_count_++;
            SpaceState& sp = space(s);
            std::vector<SentPacket> resend;
            sp.sent.take_pto_packets(kPtoPackets, cc_, resend);
            for (const auto& pkt : resend) {
                on_frames_lost(s, pkt);
            }
            sp.ping_pending = true;
            pto_sends_pending_ = kPtoPackets;
            LOG_DEBUG("QUIC", "conn=%llu PTO #%u in %s space, %zu packets requeued",
                      ull(conn_id_), pto_count_, packet_space_name(s), resend.size());
        }
    }

    dispatch_events();
    cleanup_streams();
    dispatch_events();
}

void QUICConnection::discard_space(PacketSpace s) noexcept {
    SpaceState& sp = space(s);
    if (sp.discarded) return;
    sp.sent.discard(cc_);
    sp.discarded = true;
    sp.ping_pending = false;
    sp.crypto_lost.clear();
    sp.crypto_sent = sp.crypto_send.size();
    sp.crypto_out_of_order.clear();
    pto_count_ = 0;
    LOG_DEBUG("QUIC", "conn=%llu %s space discarded", ull(conn_id_), packet_space_name(s));
}

void QUICConnection::complete_handshake(uint64_t now) noexcept {
    handshake_complete_ = true;
    handshake_time_ = now;
    state_ = ConnectionState::ESTABLISHED;
    discard_space(PacketSpace::INITIAL);
    discard_space(PacketSpace::HANDSHAKE);
    if (is_server_) {
        handshake_done_pending_ = true;
    } else {
        // Acknowledge HANDSHAKE_DONE and prove 1-RTT reachability
        space(PacketSpace::APPLICATION).ping_pending = true;
    }
    handshake_event_pending_ = true;
    LOG_DEBUG("QUIC", "conn=%llu handshake complete in %llu us, alpn=%s",
              ull(conn_id_), ull(handshake_time_ - created_time_), tls_->alpn().c_str());
}

void QUICConnection::close(uint64_t error_code, bool is_app, const char* reason,
                           uint64_t now) noexcept {
    if (is_closing() || is_closed()) {
        return;
    }
    close_error_code_ = error_code;
    close_is_app_ = is_app;
    close_reason_ = reason != nullptr ? reason : "";
    close_pending_ = true;
    close_time_ = now;
    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("QUIC", "conn=%llu closing: %s error 0x%llx (%s)",
              ull(conn_id_), is_app ? "application" : "transport",
              ull(error_code), close_reason_.c_str());
}

void QUICConnection::enter_closed(const char* why) noexcept {
    state_ = ConnectionState::CLOSED;
    LOG_DEBUG("QUIC", "conn=%llu closed: %s", ull(conn_id_), why);
}

// ============================================================================
// Streams
// ============================================================================

int64_t QUICConnection::open_stream(bool bidirectional) noexcept {
    if (state_ != ConnectionState::ESTABLISHED) {
        return -1;
    }
    uint64_t& next = bidirectional ? next_local_bidi_ : next_local_uni_;
    uint64_t limit = bidirectional ? peer_max_streams_bidi_ : peer_max_streams_uni_;
    if (next >= limit) {
        return -1;
    }

    uint64_t id = (next << 2) | (is_server_ ? 0x01 : 0x00) | (bidirectional ? 0x00 : 0x02);
    next++;
    uint64_t recv_window = bidirectional ? local_params_.initial_max_stream_data_bidi_local : 0;
    uint64_t send_limit = bidirectional ? peer_params_.initial_max_stream_data_bidi_remote
                                        : peer_params_.initial_max_stream_data_uni;
    streams_[id] = std::make_unique<QUICStream>(id, is_server_, recv_window, send_limit);
    return static_cast<int64_t>(id);
}

QUICStream* QUICConnection::get_stream(uint64_t stream_id) noexcept {
    auto it = streams_.find(stream_id);
    return it != streams_.end() ? it->second.get() : nullptr;
}

size_t QUICConnection::write_stream(uint64_t stream_id, const uint8_t* data, size_t len) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream == nullptr || !stream->can_send()) {
        return 0;
    }
    return stream->write(data, len);
}

void QUICConnection::finish_stream(uint64_t stream_id) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream != nullptr && stream->can_send()) {
        stream->close_send();
    }
}

void QUICConnection::reset_stream(uint64_t stream_id, uint64_t error_code) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream == nullptr || !stream->can_send() || stream->reset_sent() ||
        stream->send_finished()) {
        return;
    }
    uint64_t final_size = stream->flow_control().sent_offset();
    stream->reset_send(error_code);
    resets_pending_.push_back({stream_id, error_code, final_size});
}

void QUICConnection::stop_sending(uint64_t stream_id, uint64_t error_code) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream == nullptr || !stream->can_receive() || stream->recv_finished()) {
        return;
    }
    bool peer_done = stream->fin_received() || stream->reset_received();
    const StreamFlowControl& fc = stream->flow_control();
    if (flow_control_.on_data_consumed(fc.highest_recv_offset() - fc.consumed_offset())) {
        max_data_pending_ = true;
    }
    stream->stop_receiving();
    max_stream_data_pending_.erase(stream_id);
    if (!peer_done) {
        stop_sending_pending_.emplace_back(stream_id, error_code);
    }
}

size_t QUICConnection::read_stream(uint64_t stream_id, uint8_t* buffer, size_t len) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream == nullptr) {
        return 0;
    }
    size_t n = stream->read(buffer, len);
    account_consumed(*stream, n);
    return n;
}

size_t QUICConnection::discard_stream(uint64_t stream_id, size_t len) noexcept {
    QUICStream* stream = get_stream(stream_id);
    if (stream == nullptr) {
        return 0;
    }
    size_t n = stream->discard(len);
    account_consumed(*stream, n);
    return n;
}

void QUICConnection::queue_max_stream_data(QUICStream& stream) noexcept {
    if (!stream.final_size_known() && !stream.recv_finished()) {
        max_stream_data_pending_.insert(stream.stream_id());
    }
}

void QUICConnection::account_consumed(QUICStream& stream, size_t bytes) noexcept {
    if (bytes == 0) {
        return;
    }
    if (stream.flow_control().on_data_consumed(bytes)) {
        queue_max_stream_data(stream);
    }
    if (flow_control_.on_data_consumed(bytes)) {
        max_data_pending_ = true;
    }
}

void QUICConnection::cleanup_streams() noexcept {
    for (auto it = streams_.begin(); it != streams_.end();) {
        QUICStream& stream = *it->second;
        if (!stream.finished()) {
            ++it;
            continue;
        }

        uint64_t id = it->first;
        if (!stream.is_local()) {
            // Give the peer a replacement stream
            if (stream.is_bidirectional()) {
                local_max_streams_bidi_++;
                max_streams_bidi_pending_ = true;
            } else {
                local_max_streams_uni_++;
                max_streams_uni_pending_ = true;
            }
        }
        max_stream_data_pending_.erase(id);
        it = streams_.erase(it);
        events_.push_back({StreamEvent::Kind::CLOSED, id, 0, false, false});
    }
}

void QUICConnection::dispatch_events() noexcept {
    if (handshake_event_pending_) {
        handshake_event_pending_ = false;
        if (callbacks_.on_handshake_complete) callbacks_.on_handshake_complete();
    }

    // Callbacks may queue further events
    while (!events_.empty()) {
        std::vector<StreamEvent> events;
        events.swap(events_);
        for (const auto& event : events) {
            switch (event.kind) {
                case StreamEvent::Kind::READABLE:
                    if (callbacks_.on_stream_readable) callbacks_.on_stream_readable(event.stream_id);
                    break;
                case StreamEvent::Kind::RESET:
                    if (callbacks_.on_stream_reset) {
                        callbacks_.on_stream_reset(event.stream_id, event.error_code);
                    }
                    break;
                case StreamEvent::Kind::STOP_SENDING:
                    if (callbacks_.on_stop_sending) {
                        callbacks_.on_stop_sending(event.stream_id, event.error_code);
                    }
                    break;
                case StreamEvent::Kind::CLOSED:
                    if (callbacks_.on_stream_closed) callbacks_.on_stream_closed(event.stream_id);
                    break;
                case StreamEvent::Kind::SENT:
                    if (callbacks_.on_stream_sent) {
                        callbacks_.on_stream_sent(event.stream_id, event.first_byte, event.fin);
                    }
                    break;
            }
        }
    }
}

} // namespace quic
} // namespace dualmeter
