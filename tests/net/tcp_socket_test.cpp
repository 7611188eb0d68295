/**
 * TcpSocket: descriptor ownership, the options the listeners rely on, and
 * blocking loopback exchanges as used by the integration test clients.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/net/tcp_socket.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>

using namespace dualmeter::net;

namespace {

/**
 * Listening socket on an ephemeral loopback port.
 */
struct LoopbackListener {
    TcpSocket socket;
    uint16_t port{0};

    LoopbackListener() {
        std::string ip;
        if (socket.bind("127.0.0.1", 0) == 0 && socket.listen(16) == 0) {
            socket.get_local_address(ip, port);
        }
    }
};

} // namespace

class TcpSocketTest : public DualmeterTest {};

// =============================================================================
// Ownership
// =============================================================================

TEST_F(TcpSocketTest, MoveTransfersDescriptor) {
    TcpSocket a;
    ASSERT_TRUE(a.is_valid());
    int fd = a.fd();

    TcpSocket b(std::move(a));
    EXPECT_FALSE(a.is_valid());
    EXPECT_EQ(b.fd(), fd);

    TcpSocket c;
    c = std::move(b);
    EXPECT_FALSE(b.is_valid());
    EXPECT_EQ(c.fd(), fd);
}

TEST_F(TcpSocketTest, ReleaseKeepsDescriptorOpen) {
    int fd = -1;
    {
        TcpSocket sock;
        fd = sock.release();
        EXPECT_FALSE(sock.is_valid());
    }
    EXPECT_NE(fcntl(fd, F_GETFD), -1);
    ::close(fd);
}

TEST_F(TcpSocketTest, CloseIsIdempotent) {
    TcpSocket sock;
    sock.close();
    sock.close();
    EXPECT_FALSE(sock.is_valid());
    EXPECT_LT(sock.send("x", 1), 0);
}

// =============================================================================
// Options and binding
// =============================================================================

TEST_F(TcpSocketTest, NonblockingFlag) {
    TcpSocket sock;
    ASSERT_EQ(sock.set_nonblocking(), 0);
    EXPECT_NE(fcntl(sock.fd(), F_GETFL) & O_NONBLOCK, 0);
    EXPECT_EQ(sock.set_nodelay(), 0);
}

TEST_F(TcpSocketTest, ReuseportSharesPort) {
    TcpSocket first;
    ASSERT_EQ(first.set_reuseport(), 0);
    ASSERT_EQ(first.bind("127.0.0.1", 0), 0);
    ASSERT_EQ(first.listen(), 0);
    std::string ip;
    uint16_t port = 0;
    ASSERT_TRUE(first.get_local_address(ip, port));
    EXPECT_EQ(ip, "127.0.0.1");
    EXPECT_NE(port, 0);

    TcpSocket second;
    ASSERT_EQ(second.set_reuseport(), 0);
    EXPECT_EQ(second.bind("127.0.0.1", port), 0);
}

TEST_F(TcpSocketTest, BindConflictWithoutReuseport) {
    LoopbackListener holder;
    ASSERT_NE(holder.port, 0);

    TcpSocket other;
    other.set_reuseport();
    EXPECT_EQ(other.bind("127.0.0.1", holder.port), -1);
    EXPECT_EQ(errno, EADDRINUSE);
}

TEST_F(TcpSocketTest, MalformedHostRejected) {
    TcpSocket sock;
    EXPECT_EQ(sock.bind("not-an-address", 0), -1);
    EXPECT_EQ(errno, EINVAL);
}

// =============================================================================
// Loopback traffic
// =============================================================================

TEST_F(TcpSocketTest, ExchangeAndPeerAddress) {
    LoopbackListener listener;
    ASSERT_NE(listener.port, 0);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", listener.port), 0);

    struct sockaddr_in peer;
    TcpSocket server = listener.socket.accept(&peer);
    ASSERT_TRUE(server.is_valid());
    EXPECT_EQ(format_address(peer).compare(0, 10, "127.0.0.1:"), 0);

    std::string ip;
    uint16_t client_port = 0;
    ASSERT_TRUE(client.get_local_address(ip, client_port));
    uint16_t remote_port = 0;
    ASSERT_TRUE(server.get_remote_address(ip, remote_port));
    EXPECT_EQ(remote_port, client_port);

    std::string request = rng_.random_string(4096);
    ASSERT_EQ(client.send(request.data(), request.size()),
              static_cast<ssize_t>(request.size()));

    std::string received;
    char buf[1024];
    while (received.size() < request.size()) {
        ssize_t n = server.recv(buf, sizeof(buf));
        ASSERT_GT(n, 0);
        received.append(buf, static_cast<size_t>(n));
    }
    EXPECT_EQ(received, request);

    server.close();
    EXPECT_EQ(client.recv(buf, sizeof(buf)), 0);
}

TEST_F(TcpSocketTest, ReceiveTimeoutExpires) {
    LoopbackListener listener;
    TcpSocket client;
    ASSERT_EQ(client.set_recv_timeout(50), 0);
    ASSERT_EQ(client.connect("127.0.0.1", listener.port), 0);
    TcpSocket server = listener.socket.accept();
    ASSERT_TRUE(server.is_valid());

    Timer timer;
    timer.start();
    char byte;
    EXPECT_EQ(client.recv(&byte, 1), -1);
    timer.stop();
    EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
    EXPECT_GE(timer.elapsed_ms(), 40.0);
}

TEST_F(TcpSocketTest, ConnectRefused) {
    uint16_t port = 0;
    {
        LoopbackListener closed;
        port = closed.port;
    }
    TcpSocket client;
    EXPECT_EQ(client.connect("127.0.0.1", port), -1);
    EXPECT_EQ(errno, ECONNREFUSED);
}

// =============================================================================
// Address helpers
// =============================================================================

TEST_F(TcpSocketTest, MakeAddress) {
    struct sockaddr_in addr;
    ASSERT_EQ(make_address("", 8443, addr), 0);
    EXPECT_EQ(addr.sin_addr.s_addr, htonl(INADDR_ANY));
    EXPECT_EQ(ntohs(addr.sin_port), 8443);

    ASSERT_EQ(make_address("0.0.0.0", 1, addr), 0);
    EXPECT_EQ(addr.sin_addr.s_addr, htonl(INADDR_ANY));

    ASSERT_EQ(make_address("10.1.2.3", 8444, addr), 0);
    EXPECT_EQ(format_address(addr), "10.1.2.3:8444");

    ASSERT_EQ(make_address("localhost", 1, addr), 0);
    EXPECT_EQ(addr.sin_addr.s_addr, htonl(INADDR_LOOPBACK));

    EXPECT_EQ(make_address("10.1.2", 1, addr), -1);
    EXPECT_EQ(errno, EINVAL);
}
