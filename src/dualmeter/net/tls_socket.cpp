/**
 * TLS Socket Implementation
 */

#include "tls_socket.h"

#include <openssl/err.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace dualmeter {
namespace net {

std::unique_ptr<TlsSocket> TlsSocket::accept(
    TcpSocket&& tcp_socket,
    std::shared_ptr<TlsContext> context
) {
    auto socket = std::unique_ptr<TlsSocket>(
        new TlsSocket(std::move(tcp_socket), std::move(context)));
    if (!socket->init_ssl(true, "")) {
        return nullptr;
    }
    return socket;
}

std::unique_ptr<TlsSocket> TlsSocket::connect(
    TcpSocket&& tcp_socket,
    std::shared_ptr<TlsContext> context,
    const std::string& server_name
) {
    auto socket = std::unique_ptr<TlsSocket>(
        new TlsSocket(std::move(tcp_socket), std::move(context)));
    if (!socket->init_ssl(false, server_name)) {
        return nullptr;
    }
    return socket;
}

TlsSocket::TlsSocket(TcpSocket&& tcp_socket, std::shared_ptr<TlsContext> context)
    : tcp_socket_(std::move(tcp_socket))
    , context_(std::move(context))
{
}

TlsSocket::~TlsSocket() {
    if (ssl_) {
        SSL_free(ssl_);  // frees both BIOs
    }
}

bool TlsSocket::init_ssl(bool is_server, const std::string& server_name) {
    ssl_ = SSL_new(context_->get_ssl_ctx());
    if (!ssl_) {
        error_message_ = "Failed to create SSL object";
        state_ = TlsState::ERROR;
        return false;
    }

    rbio_ = BIO_new(BIO_s_mem());
    wbio_ = BIO_new(BIO_s_mem());
    if (!rbio_ || !wbio_) {
        if (rbio_) BIO_free(rbio_);
        if (wbio_) BIO_free(wbio_);
        rbio_ = wbio_ = nullptr;
        error_message_ = "Failed to create BIOs";
        state_ = TlsState::ERROR;
        return false;
    }

    SSL_set_bio(ssl_, rbio_, wbio_);
    SSL_set_mode(ssl_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (is_server) {
        SSL_set_accept_state(ssl_);
    } else {
        SSL_set_connect_state(ssl_);
        if (!server_name.empty()) {
            SSL_set_tlsext_host_name(ssl_, server_name.c_str());
        }
    }
    return true;
}

int TlsSocket::handshake() {
    if (state_ == TlsState::CONNECTED) {
        return 0;
    }
    if (state_ != TlsState::HANDSHAKE_IN_PROGRESS) {
        return -1;
    }

    int ret = SSL_do_handshake(ssl_);
    collect_ciphertext();

    if (ret == 1) {
        state_ = TlsState::CONNECTED;
        return 0;
    }

    int ssl_error = SSL_get_error(ssl_, ret);
    if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
        return 1;
    }

    error_message_ = describe_ssl_error(ssl_, ret);
    state_ = TlsState::ERROR;
    return -1;
}

ssize_t TlsSocket::fill_from_socket(bool& peer_closed) {
    char buffer[16384];
    ssize_t total = 0;
    peer_closed = false;

    while (true) {
        ssize_t received = ::recv(tcp_socket_.fd(), buffer, sizeof(buffer), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return total;
            }
            if (errno == EINTR) {
                continue;
            }
            error_message_ = std::string("recv failed: ") + strerror(errno);
            return -1;
        }

        if (received == 0) {
            peer_closed = true;
            return total;
        }

        if (BIO_write(rbio_, buffer, static_cast<int>(received)) != received) {
            error_message_ = "BIO_write failed";
            return -1;
        }
        total += received;

        // A short read means the socket is drained for now
        if (static_cast<size_t>(received) < sizeof(buffer)) {
            return total;
        }
    }
}

ssize_t TlsSocket::read(void* buffer, size_t len) {
    if (state_ != TlsState::CONNECTED) {
        errno = EINVAL;
        return -1;
    }

    int ret = SSL_read(ssl_, buffer, static_cast<int>(len));
    // Reads may produce output (key updates, session tickets)
    collect_ciphertext();

    if (ret > 0) {
        return ret;
    }

    int ssl_error = SSL_get_error(ssl_, ret);
    if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
        errno = EAGAIN;
        return -1;
    }

    if (ssl_error == SSL_ERROR_ZERO_RETURN) {
        state_ = TlsState::CLOSED;
        return 0;
    }

    error_message_ = describe_ssl_error(ssl_, ret);
    state_ = TlsState::ERROR;
    errno = EPROTO;
    return -1;
}

ssize_t TlsSocket::write(const void* buffer, size_t len) {
    if (state_ != TlsState::CONNECTED) {
        errno = EINVAL;
        return -1;
    }

    const uint8_t* data = static_cast<const uint8_t*>(buffer);
    size_t written = 0;

    // Memory BIO never blocks, so SSL_write only stops on error
    while (written < len) {
        int ret = SSL_write(ssl_, data + written, static_cast<int>(len - written));
        if (ret <= 0) {
            error_message_ = describe_ssl_error(ssl_, ret);
            state_ = TlsState::ERROR;
            errno = EPROTO;
            return -1;
        }
        written += static_cast<size_t>(ret);
    }

    collect_ciphertext();
    return static_cast<ssize_t>(len);
}

int TlsSocket::flush() {
    collect_ciphertext();

    while (out_offset_ < out_cipher_.size()) {
        ssize_t sent = ::send(tcp_socket_.fd(), out_cipher_.data() + out_offset_,
                              out_cipher_.size() - out_offset_, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 1;
            }
            if (errno == EINTR) {
                continue;
            }
            error_message_ = std::string("send failed: ") + strerror(errno);
            state_ = TlsState::ERROR;
            return -1;
        }
        out_offset_ += static_cast<size_t>(sent);
    }

    out_cipher_.clear();
    out_offset_ = 0;
    return 0;
}

void TlsSocket::shutdown() {
    if (state_ != TlsState::CONNECTED) {
        return;
    }
    SSL_shutdown(ssl_);
    state_ = TlsState::CLOSED;
    collect_ciphertext();
    flush();
}

std::string TlsSocket::get_alpn_protocol() const {
    if (!ssl_) {
        return "";
    }

    const unsigned char* alpn_data = nullptr;
    unsigned int alpn_len = 0;
    SSL_get0_alpn_selected(ssl_, &alpn_data, &alpn_len);

    if (alpn_data && alpn_len > 0) {
        return std::string(reinterpret_cast<const char*>(alpn_data), alpn_len);
    }
    return "";
}

size_t TlsSocket::pending_output() const {
    size_t queued = out_cipher_.size() - out_offset_;
    if (wbio_) {
        queued += BIO_ctrl_pending(wbio_);
    }
    return queued;
}

void TlsSocket::collect_ciphertext() {
    char buffer[16384];
    while (true) {
        int n = BIO_read(wbio_, buffer, sizeof(buffer));
        if (n <= 0) {
            break;
        }
        // Compact before growing
        if (out_offset_ > 0 && out_offset_ == out_cipher_.size()) {
            out_cipher_.clear();
            out_offset_ = 0;
        }
        out_cipher_.append(buffer, static_cast<size_t>(n));
    }
}

std::string TlsSocket::describe_ssl_error(SSL* ssl, int ret) {
    int ssl_error = SSL_get_error(ssl, ret);

    switch (ssl_error) {
        case SSL_ERROR_ZERO_RETURN:
            return "TLS connection closed";
        case SSL_ERROR_SYSCALL: {
            unsigned long err = ERR_get_error();
            if (err == 0) {
                return ret == 0 ? "EOF in violation of protocol"
                                : "I/O error: " + std::string(strerror(errno));
            }
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            ERR_clear_error();
            return std::string(buf);
        }
        case SSL_ERROR_SSL: {
            unsigned long err = ERR_get_error();
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            ERR_clear_error();
            return std::string(buf);
        }
        default:
            return "SSL error " + std::to_string(ssl_error);
    }
}

} // namespace net
} // namespace dualmeter
