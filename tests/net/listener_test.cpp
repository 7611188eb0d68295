/**
 * TcpListener and UdpListener tests on loopback with ephemeral ports.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/net/tcp_listener.h"
#include "src/dualmeter/net/udp_listener.h"
#include "src/dualmeter/net/udp_socket.h"
#include "src/dualmeter/net/tcp_socket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <set>
#include <vector>

using namespace dualmeter::net;

// =============================================================================
// TcpListener
// =============================================================================

class TcpListenerTest : public DualmeterTest {
protected:
    std::mutex mutex_;
    std::vector<TcpSocket> accepted_;
    std::set<uint16_t> accepting_workers_;

    ConnectionCallback keep_connections() {
        return [this](TcpSocket socket, const struct sockaddr_in& peer,
                      uint16_t worker_id, EventLoop* loop) {
            EXPECT_NE(loop, nullptr);
            EXPECT_EQ(peer.sin_addr.s_addr, htonl(INADDR_LOOPBACK));
            std::lock_guard<std::mutex> lock(mutex_);
            accepted_.push_back(std::move(socket));
            accepting_workers_.insert(worker_id);
        };
    }

    size_t accepted_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_.size();
    }

    static TcpListenerConfig loopback_config(uint16_t workers) {
        TcpListenerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.num_workers = workers;
        return config;
    }
};

TEST_F(TcpListenerTest, EphemeralPortIsShared) {
    TcpListener listener(loopback_config(3), keep_connections());
    ASSERT_EQ(listener.bind(), 0);
    EXPECT_GT(listener.port(), 0);
    EXPECT_EQ(listener.num_workers(), 3);
}

TEST_F(TcpListenerTest, StartRequiresBind) {
    TcpListener listener(loopback_config(1), keep_connections());
    EXPECT_EQ(listener.start(), -1);
    EXPECT_FALSE(listener.is_running());
}

TEST_F(TcpListenerTest, BindTwiceFails) {
    TcpListener listener(loopback_config(1), keep_connections());
    ASSERT_EQ(listener.bind(), 0);
    EXPECT_EQ(listener.bind(), -1);
}

TEST_F(TcpListenerTest, MalformedHostFails) {
    auto config = loopback_config(1);
    config.host = "not-an-ip";
    TcpListener listener(config, keep_connections());
    EXPECT_EQ(listener.bind(), -1);
}

TEST_F(TcpListenerTest, PortInUseFails) {
    auto first_config = loopback_config(1);
    first_config.use_reuseport = false;
    TcpListener first(first_config, keep_connections());
    ASSERT_EQ(first.bind(), 0);

    auto second_config = loopback_config(1);
    second_config.port = first.port();
    second_config.use_reuseport = false;
    TcpListener second(second_config, keep_connections());
    errno = 0;
    EXPECT_EQ(second.bind(), -1);
    EXPECT_EQ(errno, EADDRINUSE);
}

TEST_F(TcpListenerTest, AcceptsConnections) {
    TcpListener listener(loopback_config(2), keep_connections());
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);
    EXPECT_TRUE(listener.is_running());

    constexpr int NUM_CLIENTS = 8;
    std::vector<TcpSocket> clients;
    for (int i = 0; i < NUM_CLIENTS; ++i) {
        TcpSocket client;
        ASSERT_EQ(client.connect("127.0.0.1", listener.port()), 0);
        clients.push_back(std::move(client));
    }

    EXPECT_TRUE(wait_until([&] { return accepted_count() == NUM_CLIENTS; }));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint16_t worker : accepting_workers_) {
            EXPECT_LT(worker, 2);
        }
    }

    listener.stop();
    listener.join();
    EXPECT_FALSE(listener.is_running());
}

TEST_F(TcpListenerTest, AcceptedSocketCarriesData) {
    std::atomic<bool> echoed{false};
    TcpListener listener(loopback_config(1),
        [&](TcpSocket socket, const struct sockaddr_in&, uint16_t, EventLoop*) {
            socket.send("hello", 5);
            echoed = true;
        });
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);

    TcpSocket client;
    ASSERT_EQ(client.set_recv_timeout(2000), 0);
    ASSERT_EQ(client.connect("127.0.0.1", listener.port()), 0);

    char buf[16];
    ssize_t n = client.recv(buf, sizeof(buf));
    ASSERT_EQ(n, 5);
    EXPECT_EQ(std::string(buf, 5), "hello");
    EXPECT_TRUE(echoed.load());

    listener.stop();
    listener.join();
}

TEST_F(TcpListenerTest, WorkerHooksRunOnEveryWorker) {
    std::atomic<int> started{0};
    std::atomic<int> stopped{0};
    TcpListener listener(loopback_config(3), keep_connections());
    listener.set_worker_hooks(
        [&](uint16_t, EventLoop* loop) { EXPECT_NE(loop, nullptr); started++; },
        [&](uint16_t, EventLoop*) { stopped++; });

    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);
    EXPECT_TRUE(wait_until([&] { return started.load() == 3; }));

    listener.stop();
    listener.join();
    EXPECT_EQ(stopped.load(), 3);
}

TEST_F(TcpListenerTest, PostToWorkersReachesEachWorker) {
    TcpListener listener(loopback_config(3), keep_connections());
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);

    std::mutex seen_mutex;
    std::set<uint16_t> seen;
    listener.post_to_workers([&](uint16_t worker_id, EventLoop* loop) {
        EXPECT_NE(loop, nullptr);
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.insert(worker_id);
    });

    EXPECT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(seen_mutex);
        return seen.size() == 3;
    }));

    listener.stop();
    listener.join();
}

TEST_F(TcpListenerTest, StopAcceptingRefusesNewConnections) {
    TcpListener listener(loopback_config(2), keep_connections());
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);
    uint16_t port = listener.port();

    listener.stop_accepting();

    EXPECT_TRUE(wait_until([&] {
        TcpSocket check;
        return check.connect("127.0.0.1", port) == -1 && errno == ECONNREFUSED;
    }));
    EXPECT_TRUE(listener.is_running());

    listener.stop();
    listener.join();
}

// =============================================================================
// UdpListener
// =============================================================================

class UdpListenerTest : public DualmeterTest {
protected:
    static UdpListenerConfig loopback_config(uint16_t workers) {
        UdpListenerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.num_workers = workers;
        return config;
    }

    static struct sockaddr_in loopback(uint16_t port) {
        struct sockaddr_in addr;
        make_address("127.0.0.1", port, addr);
        return addr;
    }
};

TEST_F(UdpListenerTest, EphemeralPortAndLoops) {
    UdpListener listener(loopback_config(2),
        [](const uint8_t*, size_t, const struct sockaddr*, socklen_t, uint16_t, UdpSocket&) {});
    ASSERT_EQ(listener.bind(), 0);
    EXPECT_GT(listener.port(), 0);
    EXPECT_NE(listener.loop(0), nullptr);
    EXPECT_NE(listener.loop(1), nullptr);
    EXPECT_EQ(listener.loop(2), nullptr);
}

TEST_F(UdpListenerTest, StartRequiresBind) {
    UdpListener listener(loopback_config(1),
        [](const uint8_t*, size_t, const struct sockaddr*, socklen_t, uint16_t, UdpSocket&) {});
    EXPECT_EQ(listener.start(), -1);
}

TEST_F(UdpListenerTest, EchoesDatagrams) {
    std::atomic<int> received{0};
    UdpListener listener(loopback_config(2),
        [&](const uint8_t* data, size_t length, const struct sockaddr* addr,
            socklen_t addrlen, uint16_t, UdpSocket& socket) {
            received++;
            socket.sendto(data, length, addr, addrlen);
        });
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);

    UdpSocket client;
    ASSERT_TRUE(client.is_valid());
    ASSERT_EQ(client.bind("127.0.0.1", 0), 0);
    ASSERT_EQ(client.set_recv_timeout(2000), 0);

    auto target = loopback(listener.port());
    for (int i = 0; i < 5; ++i) {
        auto payload = rng_.random_bytes(rng_.random_size(1, 1200));
        ASSERT_EQ(client.sendto(payload.data(), payload.size(),
                                reinterpret_cast<const struct sockaddr*>(&target),
                                sizeof(target)),
                  static_cast<ssize_t>(payload.size()));

        std::vector<uint8_t> buf(2048);
        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        ssize_t n = client.recvfrom(buf.data(), buf.size(),
                                    reinterpret_cast<struct sockaddr*>(&from), &from_len);
        ASSERT_EQ(n, static_cast<ssize_t>(payload.size()));
        buf.resize(static_cast<size_t>(n));
        EXPECT_EQ(buf, payload);
        EXPECT_EQ(ntohs(from.sin_port), listener.port());
    }
    EXPECT_EQ(received.load(), 5);

    listener.stop();
    listener.join();
}

TEST_F(UdpListenerTest, PostToWorkersAndHooks) {
    std::atomic<int> started{0};
    std::atomic<int> posted{0};
    UdpListener listener(loopback_config(2),
        [](const uint8_t*, size_t, const struct sockaddr*, socklen_t, uint16_t, UdpSocket&) {});
    listener.set_worker_hooks([&](uint16_t, EventLoop*) { started++; }, nullptr);
    ASSERT_EQ(listener.bind(), 0);
    ASSERT_EQ(listener.start(), 0);

    listener.post_to_workers([&](uint16_t, EventLoop*) { posted++; });
    EXPECT_TRUE(wait_until([&] { return started.load() == 2 && posted.load() == 2; }));

    listener.stop();
    listener.join();
    EXPECT_FALSE(listener.is_running());
}

TEST_F(UdpListenerTest, NonblockingRecvWithoutData) {
    UdpSocket socket;
    ASSERT_EQ(socket.bind("127.0.0.1", 0), 0);
    ASSERT_EQ(socket.set_nonblocking(), 0);

    std::string ip;
    uint16_t port = 0;
    ASSERT_TRUE(socket.get_local_address(ip, port));
    EXPECT_EQ(ip, "127.0.0.1");
    EXPECT_GT(port, 0);

    uint8_t buf[16];
    struct sockaddr_in from;
    socklen_t from_len = sizeof(from);
    errno = 0;
    EXPECT_EQ(socket.recvfrom(buf, sizeof(buf), reinterpret_cast<struct sockaddr*>(&from),
                              &from_len), -1);
    EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
}
