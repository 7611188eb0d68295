/**
 * dualmeter UDP Socket - Implementation
 */

#include "udp_socket.h"
#include "event_loop.h"
#include "tcp_socket.h"

#include <errno.h>
#include <unistd.h>
#include <utility>

namespace dualmeter {
namespace net {

UdpSocket::UdpSocket() noexcept
    : fd_(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0)) {
}

UdpSocket::UdpSocket(int fd) noexcept : fd_(fd) {
}

UdpSocket::~UdpSocket() noexcept {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void UdpSocket::close() noexcept {
    int fd = std::exchange(fd_, -1);
    if (fd >= 0) {
        ::close(fd);
    }
}

int UdpSocket::set_nonblocking() noexcept { return EventLoop::set_nonblocking(fd_); }
int UdpSocket::set_reuseaddr() noexcept { return EventLoop::set_reuseaddr(fd_); }
int UdpSocket::set_reuseport() noexcept { return EventLoop::set_reuseport(fd_); }
int UdpSocket::set_dont_fragment() noexcept { return EventLoop::set_dont_fragment(fd_); }

int UdpSocket::set_recv_buffer_size(int size) noexcept {
    return EventLoop::set_recv_buffer_size(fd_, size);
}

int UdpSocket::set_recv_timeout(int timeout_ms) noexcept {
    return EventLoop::set_recv_timeout(fd_, timeout_ms);
}

int UdpSocket::bind(const std::string& host, uint16_t port) noexcept {
    struct sockaddr_in addr;
    if (fd_ < 0 || make_address(host, port, addr) < 0) {
        if (fd_ < 0) errno = EBADF;
        return -1;
    }
    return ::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ? -1 : 0;
}

ssize_t UdpSocket::sendto(const void* data, size_t len, const struct sockaddr* addr,
                          socklen_t addrlen) noexcept {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::sendto(fd_, data, len, MSG_NOSIGNAL, addr, addrlen);
}

ssize_t UdpSocket::recvfrom(void* buffer, size_t len, struct sockaddr* addr,
                            socklen_t* addrlen) noexcept {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::recvfrom(fd_, buffer, len, 0, addr, addrlen);
}

bool UdpSocket::get_local_address(std::string& ip, uint16_t& port) const noexcept {
    return EventLoop::socket_address(fd_, false, ip, port);
}

} // namespace net
} // namespace dualmeter
