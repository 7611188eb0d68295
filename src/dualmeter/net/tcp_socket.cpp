/**
 * dualmeter TCP Socket - Implementation
 */

#include "tcp_socket.h"
#include "event_loop.h"

#include <unistd.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cstring>
#include <errno.h>
#include <utility>

namespace dualmeter {
namespace net {

std::string format_address(const struct sockaddr_in& addr) {
    char ip_str[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr.sin_port));
}

int make_address(const std::string& host, uint16_t port, struct sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
        return 0;
    }
    if (host == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return 0;
    }
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        errno = EINVAL;
        return -1;
    }
    return 0;
}

TcpSocket::TcpSocket(int fd) : fd_(fd) {
}

TcpSocket::TcpSocket() : fd_(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void TcpSocket::close() {
    int fd = std::exchange(fd_, -1);
    if (fd >= 0) {
        ::close(fd);
    }
}

int TcpSocket::set_nonblocking() { return EventLoop::set_nonblocking(fd_); }
int TcpSocket::set_nodelay() { return EventLoop::set_tcp_nodelay(fd_); }
int TcpSocket::set_reuseaddr() { return EventLoop::set_reuseaddr(fd_); }
int TcpSocket::set_reuseport() { return EventLoop::set_reuseport(fd_); }

int TcpSocket::set_recv_timeout(int timeout_ms) {
    return EventLoop::set_recv_timeout(fd_, timeout_ms);
}

int TcpSocket::connect(const std::string& host, uint16_t port) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    struct sockaddr_in addr;
    if (make_address(host, port, addr) < 0) {
        // Fall back to the resolver for names
        struct addrinfo hints, *result;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0) {
            errno = EINVAL;
            return -1;
        }
        std::memcpy(&addr, result->ai_addr, sizeof(addr));
        addr.sin_port = htons(port);
        freeaddrinfo(result);
    }

    if (::connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 && errno != EINPROGRESS) {
        return -1;
    }
    return 0;
}

int TcpSocket::bind(const std::string& host, uint16_t port) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    struct sockaddr_in addr;
    if (make_address(host, port, addr) < 0) {
        return -1;
    }
    return ::bind(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 ? -1 : 0;
}

int TcpSocket::listen(int backlog) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::listen(fd_, backlog) < 0 ? -1 : 0;
}

TcpSocket TcpSocket::accept(struct sockaddr_in* client_addr) {
    if (fd_ < 0) {
        errno = EBADF;
        return TcpSocket(-1);
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    int client_fd = ::accept4(fd_, (struct sockaddr*)&addr, &addr_len, SOCK_CLOEXEC);

    if (client_fd >= 0 && client_addr) {
        *client_addr = addr;
    }
    return TcpSocket(client_fd);
}

ssize_t TcpSocket::send(const void* data, size_t len, int flags) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags);
}

ssize_t TcpSocket::recv(void* buffer, size_t len, int flags) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, flags);
}

bool TcpSocket::get_local_address(std::string& ip, uint16_t& port) const {
    return EventLoop::socket_address(fd_, false, ip, port);
}

bool TcpSocket::get_remote_address(std::string& ip, uint16_t& port) const {
    return EventLoop::socket_address(fd_, true, ip, port);
}

int TcpSocket::release() {
    return std::exchange(fd_, -1);
}

} // namespace net
} // namespace dualmeter
