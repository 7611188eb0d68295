/**
 * TLS Socket over memory BIOs
 *
 * Wraps a TcpSocket with an OpenSSL session whose network side is a pair
 * of memory BIOs, so the event loop stays in charge of every read and
 * write on the descriptor.
 *
 * Data flow:
 *   socket -> fill_from_socket() -> rbio -> SSL_read -> read()
 *   write() -> SSL_write -> wbio -> pending ciphertext -> flush() -> socket
 *
 * Ciphertext that the kernel does not accept is kept and retried on the
 * next flush(); nothing is ever dropped.
 */

#pragma once

#include "tcp_socket.h"
#include "tls_context.h"

#include <openssl/ssl.h>
#include <openssl/bio.h>

#include <memory>
#include <string>

namespace dualmeter {
namespace net {

/**
 * TLS Socket State
 */
enum class TlsState {
    HANDSHAKE_IN_PROGRESS,
    CONNECTED,
    ERROR,
    CLOSED
};

class TlsSocket {
public:
    /**
     * Create TLS socket in server mode.
     *
     * @param tcp_socket Accepted TCP connection (moved)
     * @param context Server context
     * @return TLS socket ready for handshake, or nullptr
     */
    static std::unique_ptr<TlsSocket> accept(
        TcpSocket&& tcp_socket,
        std::shared_ptr<TlsContext> context
    );

    /**
     * Create TLS socket in client mode.
     *
     * @param server_name SNI host name (may be empty)
     */
    static std::unique_ptr<TlsSocket> connect(
        TcpSocket&& tcp_socket,
        std::shared_ptr<TlsContext> context,
        const std::string& server_name = ""
    );

    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * Advance the handshake with whatever input is buffered.
     *
     * @return 0 complete, 1 needs more input, -1 failed (see get_error())
     */
    int handshake();

    /**
     * Pull ciphertext from the socket into the read BIO until the socket
     * would block.
     *
     * @param peer_closed Set when the peer closed the TCP stream
     * @return Bytes pulled (>= 0), or -1 on socket error
     */
    ssize_t fill_from_socket(bool& peer_closed);

    /**
     * Read decrypted application data.
     *
     * @return Bytes read, 0 on close_notify, -1 with errno = EAGAIN when
     *         no complete record is buffered, -1 otherwise on error
     */
    ssize_t read(void* buffer, size_t len);

    /**
     * Encrypt application data into the pending output.
     *
     * @return len on success, -1 on error
     */
    ssize_t write(const void* buffer, size_t len);

    /**
     * Send pending ciphertext.
     *
     * @return 0 everything sent, 1 socket would block, -1 error
     */
    int flush();

    /**
     * Queue close_notify and try to send it.
     */
    void shutdown();

    /**
     * ALPN protocol selected during the handshake ("" if none).
     */
    std::string get_alpn_protocol() const;

    TlsState get_state() const { return state_; }

    bool is_handshake_complete() const {
        return state_ == TlsState::CONNECTED;
    }

    int fd() const { return tcp_socket_.fd(); }

    const std::string& get_error() const { return error_message_; }

    /**
     * Ciphertext bytes not yet accepted by the kernel.
     */
    size_t pending_output() const;

    bool has_pending_output() const { return pending_output() > 0; }

private:
    TlsSocket(TcpSocket&& tcp_socket, std::shared_ptr<TlsContext> context);

    bool init_ssl(bool is_server, const std::string& server_name);
    void collect_ciphertext();
    static std::string describe_ssl_error(SSL* ssl, int ret);

    TcpSocket tcp_socket_;
    std::shared_ptr<TlsContext> context_;
    SSL* ssl_ = nullptr;
    BIO* rbio_ = nullptr;  // Ciphertext from network (owned by ssl_)
    BIO* wbio_ = nullptr;  // Ciphertext to network (owned by ssl_)
    TlsState state_ = TlsState::HANDSHAKE_IN_PROGRESS;
    std::string error_message_;

    std::string out_cipher_;
    size_t out_offset_ = 0;
};

} // namespace net
} // namespace dualmeter
