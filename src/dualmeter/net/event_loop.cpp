/**
 * dualmeter Event Loop - Common Implementation
 *
 * Backend factory and the socket helpers shared by the socket wrappers.
 */

#include "event_loop.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>

namespace dualmeter {
namespace net {

namespace {

int set_int_option(int fd, int level, int name, int value) {
    return setsockopt(fd, level, name, &value, sizeof(value)) < 0 ? -1 : 0;
}

} // namespace

std::unique_ptr<EventLoop> create_epoll_event_loop();

std::unique_ptr<EventLoop> create_event_loop() {
    return create_epoll_event_loop();
}

uint32_t recommended_worker_count() {
    // Leave two cores free, keep at least one worker
    unsigned int hw_threads = std::thread::hardware_concurrency();
    return hw_threads > 2 ? hw_threads - 2 : 1;
}

int EventLoop::set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return -1;
    }
    return 0;
}

int EventLoop::set_tcp_nodelay(int fd) {
    return set_int_option(fd, IPPROTO_TCP, TCP_NODELAY, 1);
}

int EventLoop::set_reuseaddr(int fd) {
    return set_int_option(fd, SOL_SOCKET, SO_REUSEADDR, 1);
}

int EventLoop::set_reuseport(int fd) {
    return set_int_option(fd, SOL_SOCKET, SO_REUSEPORT, 1);
}

int EventLoop::set_recv_buffer_size(int fd, int bytes) {
    return set_int_option(fd, SOL_SOCKET, SO_RCVBUF, bytes);
}

int EventLoop::set_recv_timeout(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ? -1 : 0;
}

int EventLoop::set_dont_fragment(int fd) {
    return set_int_option(fd, IPPROTO_IP, IP_MTU_DISCOVER, IP_PMTUDISC_DO);
}

bool EventLoop::socket_address(int fd, bool peer, std::string& ip, uint16_t& port) {
    if (fd < 0) {
        return false;
    }
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    auto* sa = reinterpret_cast<struct sockaddr*>(&addr);
    if ((peer ? getpeername(fd, sa, &len) : getsockname(fd, sa, &len)) < 0) {
        return false;
    }

    char text[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) == nullptr) {
        return false;
    }
    ip = text;
    port = ntohs(addr.sin_port);
    return true;
}

} // namespace net
} // namespace dualmeter
