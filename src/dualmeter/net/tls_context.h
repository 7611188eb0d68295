/**
 * TLS Context with ALPN Support
 *
 * OpenSSL SSL_CTX wrapper used by the HTTP/2 terminator (server side)
 * and by the integration tests (client side).
 *
 * - File-based and memory-based certificates
 * - Strict server-side ALPN: a client that offers none of the configured
 *   protocols fails the handshake with no_application_protocol
 */

#pragma once

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

namespace dualmeter {
namespace net {

/**
 * TLS Context Configuration
 */
struct TlsContextConfig {
    std::string cert_file;           // Path to certificate file (PEM)
    std::string key_file;            // Path to private key file (PEM)
    std::string cert_data;           // In-memory certificate (PEM)
    std::string key_data;            // In-memory private key (PEM)

    std::vector<std::string> alpn_protocols;  // e.g. ["h2"]

    bool allow_tlsv12 = true;

    std::string cipher_list;         // TLS 1.2 ciphers (empty = OpenSSL defaults)
    std::string cipher_suites;       // TLS 1.3 ciphersuites
};

/**
 * TLS Context (wraps SSL_CTX*)
 *
 * Immutable once created; shared by every worker thread.
 */
class TlsContext {
public:
    /**
     * Create server TLS context from configuration
     *
     * @param config TLS configuration
     * @param error Receives a description of the failure when non-null
     * @return Shared pointer to TLS context, or nullptr on error
     */
    static std::shared_ptr<TlsContext> create_server(const TlsContextConfig& config,
                                                     std::string* error = nullptr);

    /**
     * Create client TLS context. Peer verification is disabled; the
     * clients built on this talk to self-signed test servers.
     *
     * @param alpn_protocols Protocols to advertise
     * @param error Receives a description of the failure when non-null
     */
    static std::shared_ptr<TlsContext> create_client(
        const std::vector<std::string>& alpn_protocols = {},
        std::string* error = nullptr
    );

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get_ssl_ctx() const noexcept {
        return ctx_;
    }

    const std::vector<std::string>& get_alpn_protocols() const noexcept {
        return alpn_protocols_;
    }

    /**
     * Get OpenSSL error string for the oldest queued error, clearing the queue.
     */
    static std::string get_openssl_error();

private:
    TlsContext() = default;

    bool load_credentials(const TlsContextConfig& config);
    bool set_alpn_wire_format(const std::vector<std::string>& protocols);

    static int alpn_select_callback(
        SSL* ssl,
        const unsigned char** out,
        unsigned char* outlen,
        const unsigned char* in,
        unsigned int inlen,
        void* arg
    );

    SSL_CTX* ctx_ = nullptr;
    std::vector<std::string> alpn_protocols_;
    std::string error_message_;

    // Length-prefixed protocol list, e.g. "\x02h2"
    std::vector<unsigned char> alpn_wire_format_;
};

} // namespace net
} // namespace dualmeter
