#include "quic_tls.h"
#include "../../core/logger.h"
#include <openssl/err.h>
#include <algorithm>
#include <cstring>

namespace dualmeter {
namespace quic {

namespace {

constexpr uint8_t kRecordChangeCipherSpec = 20;
constexpr uint8_t kRecordAlert = 21;
constexpr uint8_t kRecordHandshake = 22;
constexpr uint8_t kRecordApplicationData = 23;

constexpr uint8_t kHandshakeFinished = 20;

constexpr size_t kRecordHeaderSize = 5;
constexpr size_t kMaxRecordPlaintext = 16384;

constexpr const char* kQuicCipherSuite = "TLS_AES_128_GCM_SHA256";

size_t level_index(PacketSpace level) noexcept {
    return static_cast<size_t>(level);
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void write_record_header(uint8_t* out, uint8_t type, size_t length) noexcept {
    out[0] = type;
    out[1] = 0x03;
    out[2] = 0x03;
    out[3] = static_cast<uint8_t>(length >> 8);
    out[4] = static_cast<uint8_t>(length);
}

} // namespace

// =============================================================================
// Context setup
// =============================================================================

bool QuicTls::configure_context(SSL_CTX* ctx, bool is_server) {
    if (!SSL_CTX_set_min_proto_version(ctx, TLS1_3_VERSION) ||
        !SSL_CTX_set_max_proto_version(ctx, TLS1_3_VERSION)) {
        return false;
    }
    if (!SSL_CTX_set_ciphersuites(ctx, kQuicCipherSuite)) {
        return false;
    }

    // No ChangeCipherSpec records and no tickets, neither has a QUIC mapping
    SSL_CTX_clear_options(ctx, SSL_OP_ENABLE_MIDDLEBOX_COMPAT);
    SSL_CTX_set_options(ctx, SSL_OP_NO_TICKET);
    if (is_server && !SSL_CTX_set_num_tickets(ctx, 0)) {
        return false;
    }

    SSL_CTX_set_keylog_callback(ctx, keylog_callback);

    return SSL_CTX_add_custom_ext(ctx, kTransportParamsExtension,
                                  SSL_EXT_CLIENT_HELLO | SSL_EXT_TLS1_3_ENCRYPTED_EXTENSIONS,
                                  add_params_callback, nullptr, nullptr,
                                  parse_params_callback, nullptr) == 1;
}

std::shared_ptr<net::TlsContext> QuicTls::create_server_context(net::TlsContextConfig config,
                                                                std::string* error) {
    if (config.alpn_protocols.empty()) {
        config.alpn_protocols = {"h3"};
    }
    config.allow_tlsv12 = false;
    config.cipher_suites = kQuicCipherSuite;

    auto ctx = net::TlsContext::create_server(config, error);
    if (!ctx) {
        return nullptr;
    }
    if (!configure_context(ctx->get_ssl_ctx(), true)) {
        std::string message = "Failed to prepare QUIC TLS context: " +
                              net::TlsContext::get_openssl_error();
        LOG_ERROR("TLS", "%s", message.c_str());
        if (error) {
            *error = message;
        }
        return nullptr;
    }
    return ctx;
}

std::shared_ptr<net::TlsContext> QuicTls::create_client_context(
    const std::vector<std::string>& alpn_protocols, std::string* error) {
    auto ctx = net::TlsContext::create_client(alpn_protocols, error);
    if (!ctx) {
        return nullptr;
    }
    if (!configure_context(ctx->get_ssl_ctx(), false)) {
        std::string message = "Failed to prepare QUIC TLS context: " +
                              net::TlsContext::get_openssl_error();
        LOG_ERROR("TLS", "%s", message.c_str());
        if (error) {
            *error = message;
        }
        return nullptr;
    }
    return ctx;
}

// =============================================================================
// OpenSSL callbacks
// =============================================================================

void QuicTls::keylog_callback(const SSL* ssl, const char* line) {
    auto* self = static_cast<QuicTls*>(SSL_get_app_data(ssl));
    if (!self || !line) {
        return;
    }
    // "<LABEL> <client random> <secret>"
    std::string entry(line);
    size_t first = entry.find(' ');
    size_t last = entry.rfind(' ');
    if (first == std::string::npos || last == first) {
        return;
    }
    self->on_secret(entry.substr(0, first), entry.substr(last + 1));
}

int QuicTls::add_params_callback(SSL* ssl, unsigned int, unsigned int,
                                 const unsigned char** out, size_t* outlen, X509*,
                                 size_t, int*, void*) {
    auto* self = static_cast<QuicTls*>(SSL_get_app_data(ssl));
    if (!self) {
        return 0;
    }
    *out = self->local_params_.data();
    *outlen = self->local_params_.size();
    return 1;
}

int QuicTls::parse_params_callback(SSL* ssl, unsigned int, unsigned int,
                                   const unsigned char* in, size_t inlen, X509*,
                                   size_t, int* al, void*) {
    auto* self = static_cast<QuicTls*>(SSL_get_app_data(ssl));
    if (!self) {
        *al = SSL_AD_INTERNAL_ERROR;
        return 0;
    }
    self->peer_params_.assign(in, in + inlen);
    self->has_peer_params_ = true;
    return 1;
}

void QuicTls::on_secret(const std::string& label, const std::string& hex) {
    PacketSpace level;
    bool server_secret;
    if (label == "CLIENT_HANDSHAKE_TRAFFIC_SECRET") {
        level = PacketSpace::HANDSHAKE;
        server_secret = false;
    } else if (label == "SERVER_HANDSHAKE_TRAFFIC_SECRET") {
        level = PacketSpace::HANDSHAKE;
        server_secret = true;
    } else if (label == "CLIENT_TRAFFIC_SECRET_0") {
        level = PacketSpace::APPLICATION;
        server_secret = false;
    } else if (label == "SERVER_TRAFFIC_SECRET_0") {
        level = PacketSpace::APPLICATION;
        server_secret = true;
    } else {
        return;
    }

    if (hex.size() != 2 * kSecretLength) {
        LOG_WARN("QUIC", "Unexpected %s length %zu", label.c_str(), hex.size() / 2);
        return;
    }

    bool local = server_secret == is_server_;
    size_t idx = level_index(level);
    Secret& secret = local ? write_secret_[idx] : read_secret_[idx];
    for (size_t i = 0; i < kSecretLength; i++) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return;
        }
        secret.data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    secret.set = true;

    PacketKeys& keys = local ? record_write_[idx] : record_read_[idx];
    if (!keys.derive(secret.data, kSecretLength, PacketKeys::Usage::TLS_RECORD)) {
        fail(kAlertInternalError, "cannot derive record keys");
    }
}

// =============================================================================
// Handshake
// =============================================================================

QuicTls::QuicTls() = default;

QuicTls::~QuicTls() = default;

bool QuicTls::init(SSL_CTX* ctx, bool is_server, std::vector<uint8_t> local_params,
                   const std::string& server_name) {
    is_server_ = is_server;
    local_params_ = std::move(local_params);

    ssl_.reset(SSL_new(ctx));
    if (!ssl_) {
        error_ = "SSL_new failed: " + net::TlsContext::get_openssl_error();
        return false;
    }
    SSL_set_app_data(ssl_.get(), this);

    rbio_ = BIO_new(BIO_s_mem());
    wbio_ = BIO_new(BIO_s_mem());
    if (!rbio_ || !wbio_) {
        BIO_free(rbio_);
        BIO_free(wbio_);
        rbio_ = wbio_ = nullptr;
        error_ = "cannot allocate memory BIOs";
        return false;
    }
    SSL_set_bio(ssl_.get(), rbio_, wbio_);

    if (is_server) {
        SSL_set_accept_state(ssl_.get());
    } else {
        SSL_set_connect_state(ssl_.get());
        if (!server_name.empty()) {
            SSL_set_tlsext_host_name(ssl_.get(), server_name.c_str());
        }
    }
    return true;
}

bool QuicTls::provide_data(PacketSpace level, const uint8_t* data, size_t len) {
    size_t idx = level_index(level);
    if (!ssl_ || (level != PacketSpace::INITIAL && !record_read_[idx].valid())) {
        return false;
    }

    while (len > 0) {
        size_t chunk = std::min(len, kMaxRecordPlaintext);
        std::vector<uint8_t> record;
        if (level == PacketSpace::INITIAL) {
            record.resize(kRecordHeaderSize + chunk);
            write_record_header(record.data(), kRecordHandshake, chunk);
            std::memcpy(record.data() + kRecordHeaderSize, data, chunk);
        } else {
            // TLSInnerPlaintext: content || type, then the tag
            size_t inner = chunk + 1;
            record.resize(kRecordHeaderSize + inner + PacketKeys::kTagLength);
            write_record_header(record.data(), kRecordApplicationData,
                                inner + PacketKeys::kTagLength);
            std::memcpy(record.data() + kRecordHeaderSize, data, chunk);
            record[kRecordHeaderSize + chunk] = kRecordHandshake;
            if (!record_read_[idx].seal(read_seq_[idx]++, record.data(), kRecordHeaderSize,
                                        record.data() + kRecordHeaderSize, inner)) {
                fail(kAlertInternalError, "record encryption failed");
                return false;
            }
        }
        if (BIO_write(rbio_, record.data(), static_cast<int>(record.size())) !=
            static_cast<int>(record.size())) {
            fail(kAlertInternalError, "cannot queue handshake record");
            return false;
        }
        data += chunk;
        len -= chunk;
    }
    return true;
}

bool QuicTls::advance() {
    if (!ssl_ || failed_) {
        return false;
    }

    ERR_clear_error();
    if (!complete_) {
        int rc = SSL_do_handshake(ssl_.get());
        if (rc == 1) {
            const unsigned char* proto = nullptr;
            unsigned int proto_len = 0;
            SSL_get0_alpn_selected(ssl_.get(), &proto, &proto_len);
            if (proto_len == 0) {
                fail(kAlertNoApplicationProtocol, "no application protocol negotiated");
            } else if (!has_peer_params_) {
                fail(kAlertMissingExtension, "peer sent no transport parameters");
            } else {
                complete_ = true;
            }
        } else {
            int err = SSL_get_error(ssl_.get(), rc);
            if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                std::string reason = net::TlsContext::get_openssl_error();
                drain_records();
                fail(kAlertInternalError, "handshake failed: " + reason);
            } else if (is_server_ && !has_peer_params_ &&
                       write_secret_[level_index(PacketSpace::HANDSHAKE)].set) {
                // ClientHello processed without the extension
                fail(kAlertMissingExtension, "peer sent no transport parameters");
            }
        }
    } else {
        // Post-handshake messages only, application data has no place here
        uint8_t byte;
        int rc = SSL_read(ssl_.get(), &byte, 1);
        if (rc > 0) {
            fail(kAlertInternalError, "application data on the handshake stream");
        } else {
            int err = SSL_get_error(ssl_.get(), rc);
            if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                fail(kAlertInternalError, "post-handshake message failed: " +
                                          net::TlsContext::get_openssl_error());
            }
        }
    }

    drain_records();
    if (alert_ >= 0 && !failed_) {
        fail(static_cast<uint8_t>(alert_), "alert raised");
    }
    return !failed_;
}

std::vector<uint8_t> QuicTls::take_output(PacketSpace level) {
    std::vector<uint8_t> out;
    out.swap(output_[level_index(level)]);
    return out;
}

std::string QuicTls::alpn() const {
    if (!ssl_) {
        return std::string();
    }
    const unsigned char* proto = nullptr;
    unsigned int proto_len = 0;
    SSL_get0_alpn_selected(ssl_.get(), &proto, &proto_len);
    return std::string(reinterpret_cast<const char*>(proto), proto_len);
}

void QuicTls::fail(uint8_t alert, const std::string& message) {
    if (alert_ < 0) {
        alert_ = alert;
    }
    if (!failed_) {
        failed_ = true;
        error_ = message;
        LOG_DEBUG("QUIC", "TLS %s: %s (alert %d)", is_server_ ? "server" : "client",
                  message.c_str(), alert_);
    }
}

void QuicTls::drain_records() {
    uint8_t buf[4096];
    int n;
    while ((n = BIO_read(wbio_, buf, sizeof(buf))) > 0) {
        written_.insert(written_.end(), buf, buf + n);
    }

    size_t pos = 0;
    while (written_.size() - pos >= kRecordHeaderSize) {
        uint8_t* header = written_.data() + pos;
        size_t length = (static_cast<size_t>(header[3]) << 8) | header[4];
        if (written_.size() - pos - kRecordHeaderSize < length) {
            break;
        }
        uint8_t* body = header + kRecordHeaderSize;
        pos += kRecordHeaderSize + length;

        switch (header[0]) {
            case kRecordHandshake:
                output_[level_index(PacketSpace::INITIAL)].insert(
                    output_[level_index(PacketSpace::INITIAL)].end(), body, body + length);
                break;
            case kRecordAlert:
                if (length >= 2 && alert_ < 0) {
                    alert_ = body[1];
                }
                break;
            case kRecordChangeCipherSpec:
                break;
            case kRecordApplicationData: {
                size_t idx = level_index(write_level_);
                if (!record_write_[idx].valid() ||
                    !record_write_[idx].open(write_seq_[idx]++, header, kRecordHeaderSize,
                                             body, length)) {
                    fail(kAlertInternalError, "cannot unwrap outgoing record");
                    break;
                }
                size_t inner = length - PacketKeys::kTagLength;
                while (inner > 0 && body[inner - 1] == 0) {
                    inner--;
                }
                if (inner == 0) {
                    break;
                }
                uint8_t type = body[--inner];
                if (type == kRecordHandshake) {
                    on_written_handshake(body, inner);
                } else if (type == kRecordAlert && inner >= 2 && alert_ < 0) {
                    alert_ = body[1];
                }
                break;
            }
            default:
                break;
        }
    }
    written_.erase(written_.begin(), written_.begin() + static_cast<std::ptrdiff_t>(pos));
}

void QuicTls::on_written_handshake(const uint8_t* data, size_t len) {
    auto& out = output_[level_index(write_level_)];
    out.insert(out.end(), data, data + len);
    if (write_level_ == PacketSpace::APPLICATION) {
        return;
    }

    // The local Finished closes the Handshake level; OpenSSL switches its
    // write keys right after it
    message_buffer_.insert(message_buffer_.end(), data, data + len);
    size_t pos = 0;
    while (message_buffer_.size() - pos >= 4) {
        size_t body = (static_cast<size_t>(message_buffer_[pos + 1]) << 16) |
                      (static_cast<size_t>(message_buffer_[pos + 2]) << 8) |
                      message_buffer_[pos + 3];
        if (message_buffer_.size() - pos - 4 < body) {
            break;
        }
        uint8_t type = message_buffer_[pos];
        pos += 4 + body;
        if (type == kHandshakeFinished) {
            write_level_ = PacketSpace::APPLICATION;
        }
    }
    message_buffer_.erase(message_buffer_.begin(),
                          message_buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
}

} // namespace quic
} // namespace dualmeter
