/**
 * dualmeter UDP Socket
 *
 * RAII owner of an IPv4 datagram socket. The HTTP/3 terminator sends
 * every QUIC datagram through one of these; tests use it as a client.
 */

#pragma once

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>

namespace dualmeter {
namespace net {

class UdpSocket {
public:
    /**
     * Create a new IPv4 datagram socket.
     */
    UdpSocket() noexcept;

    /**
     * Wrap an existing file descriptor. Takes ownership.
     */
    explicit UdpSocket(int fd) noexcept;

    ~UdpSocket() noexcept;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    int fd() const noexcept { return fd_; }
    bool is_valid() const noexcept { return fd_ >= 0; }

    void close() noexcept;

    int set_nonblocking() noexcept;
    int set_reuseaddr() noexcept;
    int set_reuseport() noexcept;
    int set_recv_buffer_size(int size) noexcept;
    int set_recv_timeout(int timeout_ms) noexcept;
    int set_dont_fragment() noexcept;

    /**
     * Bind to local address ("0.0.0.0" for any, port 0 for ephemeral).
     *
     * @return 0 on success, -1 on error
     */
    int bind(const std::string& host, uint16_t port) noexcept;

    /**
     * Send one datagram.
     *
     * @return Bytes sent, or -1 on error (check errno)
     */
    ssize_t sendto(const void* data, size_t len, const struct sockaddr* addr,
                   socklen_t addrlen) noexcept;

    /**
     * Receive one datagram.
     *
     * @param addr Filled with the source address
     * @param addrlen In: size of addr; out: actual size
     * @return Bytes received, or -1 on error (EAGAIN when none pending)
     */
    ssize_t recvfrom(void* buffer, size_t len, struct sockaddr* addr,
                     socklen_t* addrlen) noexcept;

    bool get_local_address(std::string& ip, uint16_t& port) const noexcept;

private:
    int fd_;
};

} // namespace net
} // namespace dualmeter
