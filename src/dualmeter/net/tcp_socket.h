/**
 * dualmeter TCP Socket
 *
 * RAII owner of a stream socket descriptor. The HTTP/2 terminator takes
 * ownership of accepted sockets through this type; tests use it as a
 * blocking client.
 */

#pragma once

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>

namespace dualmeter {
namespace net {

/**
 * TCP Socket abstraction
 */
class TcpSocket {
public:
    /**
     * Wrap an existing file descriptor. Takes ownership.
     */
    explicit TcpSocket(int fd);

    /**
     * Create a new IPv4 stream socket
     */
    TcpSocket();

    ~TcpSocket();

    // Non-copyable, movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    int fd() const { return fd_; }
    bool is_valid() const { return fd_ >= 0; }

    void close();

    int set_nonblocking();
    int set_nodelay();
    int set_reuseaddr();
    int set_reuseport();

    /**
     * Set a receive timeout (blocking sockets only).
     */
    int set_recv_timeout(int timeout_ms);

    /**
     * Connect to a remote IPv4 address.
     *
     * @return 0 on success (or EINPROGRESS on a non-blocking socket), -1 on error
     */
    int connect(const std::string& host, uint16_t port);

    /**
     * Bind to local address
     *
     * @param host Local IP address ("0.0.0.0" or empty for any)
     * @param port Local port (0 for ephemeral)
     * @return 0 on success, -1 on error
     */
    int bind(const std::string& host, uint16_t port);

    int listen(int backlog = 1024);

    /**
     * Accept a new connection
     *
     * @param client_addr Filled with the peer address when non-null
     * @return New socket, invalid on error (check errno)
     */
    TcpSocket accept(struct sockaddr_in* client_addr = nullptr);

    ssize_t send(const void* data, size_t len, int flags = MSG_NOSIGNAL);
    ssize_t recv(void* buffer, size_t len, int flags = 0);

    bool get_local_address(std::string& ip, uint16_t& port) const;
    bool get_remote_address(std::string& ip, uint16_t& port) const;

    /**
     * Release ownership of the file descriptor
     */
    int release();

private:
    int fd_;
};

/**
 * Format an IPv4 address as "a.b.c.d:port".
 */
std::string format_address(const struct sockaddr_in& addr);

/**
 * Fill `addr` from a dotted IPv4 host ("0.0.0.0"/empty = any).
 *
 * @return 0 on success, -1 (errno = EINVAL) on a malformed host
 */
int make_address(const std::string& host, uint16_t port, struct sockaddr_in& addr);

} // namespace net
} // namespace dualmeter
