#pragma once

#include "quic_crypto.h"
#include "../../net/tls_context.h"
#include <openssl/ssl.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dualmeter {
namespace quic {

/**
 * TLS 1.3 handshake for QUIC (RFC 9001) on a plain OpenSSL 3 SSL object.
 *
 * OpenSSL 3.0 has no QUIC hooks, so the handshake runs over a pair of
 * memory BIOs and this class translates at the record layer:
 *
 * - Handshake bytes received in CRYPTO frames are wrapped into TLS records
 *   (plaintext at the Initial level, AES-128-GCM protected with the
 *   peer's traffic secret above it) and fed to the SSL object.
 * - Records the SSL object writes are unwrapped, with the local traffic
 *   secrets, into per-level handshake byte streams for CRYPTO frames.
 *
 * Traffic secrets come from the keylog callback, transport parameters
 * travel in extension 0x39, and the only ciphersuite offered is
 * TLS_AES_128_GCM_SHA256, which is the suite packet protection uses.
 * Session tickets, early data and key updates are not supported.
 */
class QuicTls {
public:
    static constexpr unsigned int kTransportParamsExtension = 0x39;

    // TLS alert codes reported as CRYPTO_ERROR (0x100 + alert)
    static constexpr uint8_t kAlertInternalError = 80;
    static constexpr uint8_t kAlertMissingExtension = 109;
    static constexpr uint8_t kAlertNoApplicationProtocol = 120;

    /**
     * Restrict an SSL_CTX to what QUIC can carry and install the secret
     * and transport parameter hooks. Call once per context.
     */
    static bool configure_context(SSL_CTX* ctx, bool is_server);

    /**
     * Server context for HTTP/3: the given credentials, ALPN "h3" unless
     * the config names protocols, TLS 1.3 only.
     */
    static std::shared_ptr<net::TlsContext> create_server_context(net::TlsContextConfig config,
                                                                  std::string* error = nullptr);

    /**
     * Client context with peer verification disabled.
     */
    static std::shared_ptr<net::TlsContext> create_client_context(
        const std::vector<std::string>& alpn_protocols = {"h3"},
        std::string* error = nullptr);

    QuicTls();
    ~QuicTls();

    QuicTls(const QuicTls&) = delete;
    QuicTls& operator=(const QuicTls&) = delete;

    /**
     * @param ctx Context prepared by configure_context()
     * @param local_params Encoded transport parameters to send
     * @param server_name SNI for clients, may be empty
     */
    bool init(SSL_CTX* ctx, bool is_server, std::vector<uint8_t> local_params,
              const std::string& server_name = std::string());

    /**
     * Hand over handshake bytes received at a level, in order.
     *
     * @return false if the level's read secret is not known yet
     */
    bool provide_data(PacketSpace level, const uint8_t* data, size_t len);

    /**
     * Run the handshake as far as the input allows and collect output.
     *
     * @return false on a fatal handshake error, see alert()
     */
    bool advance();

    /**
     * Handshake bytes to send at a level, cleared by the call.
     */
    std::vector<uint8_t> take_output(PacketSpace level);

    bool has_output(PacketSpace level) const noexcept {
        return !output_[static_cast<size_t>(level)].empty();
    }

    bool has_read_secret(PacketSpace level) const noexcept {
        return read_secret_[static_cast<size_t>(level)].set;
    }
    bool has_write_secret(PacketSpace level) const noexcept {
        return write_secret_[static_cast<size_t>(level)].set;
    }
    const uint8_t* read_secret(PacketSpace level) const noexcept {
        return read_secret_[static_cast<size_t>(level)].data;
    }
    const uint8_t* write_secret(PacketSpace level) const noexcept {
        return write_secret_[static_cast<size_t>(level)].data;
    }

    bool handshake_complete() const noexcept { return complete_; }
    bool failed() const noexcept { return failed_; }
    bool has_peer_params() const noexcept { return has_peer_params_; }
    const std::vector<uint8_t>& peer_params() const noexcept { return peer_params_; }

    /**
     * Alert describing the failure, internal_error if none was raised.
     */
    uint8_t alert() const noexcept { return alert_ >= 0 ? static_cast<uint8_t>(alert_) : kAlertInternalError; }

    const std::string& error() const noexcept { return error_; }
    std::string alpn() const;

private:
    struct Secret {
        uint8_t data[kSecretLength];
        bool set{false};
    };

    struct SslDeleter {
        void operator()(SSL* ssl) const noexcept { SSL_free(ssl); }
    };

    static void keylog_callback(const SSL* ssl, const char* line);
    static int add_params_callback(SSL* ssl, unsigned int ext_type, unsigned int context,
                                   const unsigned char** out, size_t* outlen, X509* x,
                                   size_t chainidx, int* al, void* add_arg);
    static int parse_params_callback(SSL* ssl, unsigned int ext_type, unsigned int context,
                                     const unsigned char* in, size_t inlen, X509* x,
                                     size_t chainidx, int* al, void* parse_arg);

    void on_secret(const std::string& label, const std::string& hex);
    void fail(uint8_t alert, const std::string& message);

    /**
     * Move everything the SSL object wrote into the per-level outputs.
     */
    void drain_records();
    void on_written_handshake(const uint8_t* data, size_t len);

    std::unique_ptr<SSL, SslDeleter> ssl_;
    BIO* rbio_{nullptr};   // Owned by ssl_
    BIO* wbio_{nullptr};   // Owned by ssl_
    bool is_server_{false};

    std::vector<uint8_t> local_params_;
    std::vector<uint8_t> peer_params_;
    bool has_peer_params_{false};

    Secret read_secret_[kNumPacketSpaces];
    Secret write_secret_[kNumPacketSpaces];
    PacketKeys record_read_[kNumPacketSpaces];
    PacketKeys record_write_[kNumPacketSpaces];
    uint64_t read_seq_[kNumPacketSpaces]{};
    uint64_t write_seq_[kNumPacketSpaces]{};

    std::vector<uint8_t> output_[kNumPacketSpaces];
    std::vector<uint8_t> written_;          // Unparsed record bytes from the SSL object
    PacketSpace write_level_{PacketSpace::HANDSHAKE};
    std::vector<uint8_t> message_buffer_;   // Partial handshake message at write_level_

    bool complete_{false};
    bool failed_{false};
    int alert_{-1};
    std::string error_;
};

} // namespace quic
} // namespace dualmeter
