/**
 * HTTP/3 terminator over real UDP sockets on the loopback interface,
 * driven by an Http3Connection in client mode.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "h3_test_client.h"
#include "src/dualmeter/server/h3_terminator.h"
#include "src/dualmeter/net/udp_socket.h"

#include <arpa/inet.h>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace dualmeter::server;
using dualmeter::http3::Response;
using dualmeter::net::UdpSocket;
using dualmeter::testing::H3TestClient;

namespace {

std::string header(const Response& response, const std::string& name) {
    return dualmeter::testing::response_header(response, name);
}

} // namespace

class Http3TerminatorTest : public DualmeterTest {
protected:
    MetricsAggregator metrics_;
    ContentStoreHandle content_{std::make_shared<const ContentStore>()};
    std::unique_ptr<Router> router_;
    std::unique_ptr<Http3Terminator> terminator_;

    void SetUp() override {
        DualmeterTest::SetUp();
        router_ = std::make_unique<Router>(RouterConfig(), content_, metrics_);

        Http3TerminatorConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.num_workers = 1;
        auto tls = dualmeter::testing::quic_server_context();
        ASSERT_NE(tls, nullptr);
        terminator_ = std::make_unique<Http3Terminator>(config, tls, *router_, metrics_);
        ASSERT_EQ(terminator_->bind(), 0);
        ASSERT_EQ(terminator_->start(), 0);
    }

    void TearDown() override {
        if (terminator_) terminator_->stop();
        DualmeterTest::TearDown();
    }
};

TEST_F(Http3TerminatorTest, ServesHealth) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());

    const Response* response = client.get("/health");
    ASSERT_NE(response, nullptr);
    EXPECT_TRUE(response->complete);
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->body, "OK");
    EXPECT_EQ(header(*response, "content-length"), "2");
    EXPECT_EQ(header(*response, "alt-svc"), "");

    // The completion is recorded once the server sees its FIN leave
    EXPECT_TRUE(wait_until([&] { return metrics_.snapshot(Protocol::HTTP3).count == 1; }));
    auto snap = metrics_.snapshot(Protocol::HTTP3);
    EXPECT_EQ(snap.connections, 1u);
    EXPECT_EQ(snap.active_connections, 1u);
    EXPECT_EQ(metrics_.snapshot(Protocol::HTTP2).count, 0u);
    EXPECT_EQ(terminator_->active_connections(), 1u);
}

TEST_F(Http3TerminatorTest, RoutesLikeHttp2) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());

    const Response* info = client.get("/quic-info");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(header(*info, "content-type"), "application/json");
    EXPECT_NE(info->body.find("\"alpn\":\"h3\""), std::string::npos);
    EXPECT_NE(info->body.find("\"transport\":\"QUIC/UDP\""), std::string::npos);

    const Response* missing = client.get("/nope");
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(missing->status, 404);

    const Response* traversal = client.get("/%2e%2e/etc/passwd");
    ASSERT_NE(traversal, nullptr);
    EXPECT_EQ(traversal->status, 400);
}

TEST_F(Http3TerminatorTest, LargePayload) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());

    const Response* response = client.get("/payload/600000");
    ASSERT_NE(response, nullptr);
    EXPECT_TRUE(response->complete);
    EXPECT_EQ(response->body.size(), 600000u);
    EXPECT_EQ(header(*response, "content-length"), "600000");
}

TEST_F(Http3TerminatorTest, StatusCountsCompletedRequests) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());

    constexpr uint64_t kRequests = 4;
    for (uint64_t i = 0; i < kRequests; ++i) {
        const Response* response = client.get("/health");
        ASSERT_NE(response, nullptr);
        ASSERT_TRUE(response->complete);
    }
    ASSERT_TRUE(wait_until([&] {
        return metrics_.snapshot(Protocol::HTTP3).count == kRequests;
    }));

    const Response* status = client.get("/status");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->status, 200);
    EXPECT_EQ(header(*status, "content-type"), "application/json");
    EXPECT_NE(status->body.find("\"protocol\":\"HTTP/3\""), std::string::npos);
    EXPECT_NE(status->body.find("\"count\":" + std::to_string(kRequests) + ","),
              std::string::npos);
    EXPECT_NE(status->body.find("\"incomplete\":0"), std::string::npos);
}

TEST_F(Http3TerminatorTest, AlpnMismatchCountsAsHandshakeFailure) {
    H3TestClient client(terminator_->port(), {"h2"});
    ASSERT_TRUE(client.valid());
    ASSERT_TRUE(client.run_until([&] { return client.conn().quic().closed_by_peer(); }));
    EXPECT_TRUE(client.conn().quic().handshake_failed());
    EXPECT_FALSE(client.conn().handshake_complete());

    EXPECT_TRUE(wait_until([&] {
        return metrics_.snapshot(Protocol::HTTP3).handshake_failures == 1;
    }));
    EXPECT_TRUE(wait_until([&] { return terminator_->active_connections() == 0; }));
    EXPECT_EQ(metrics_.snapshot(Protocol::HTTP3).connections, 0u);
}

TEST_F(Http3TerminatorTest, UnsupportedVersionGetsNegotiation) {
    std::vector<uint8_t> packet(1200, 0);
    packet[0] = 0xc0;
    packet[1] = 0x1a;
    packet[2] = 0x2a;
    packet[3] = 0x3a;
    packet[4] = 0x4a;
    packet[5] = 8;
    for (int i = 0; i < 8; ++i) packet[6 + i] = static_cast<uint8_t>(0x10 + i);   // dcid
    packet[14] = 8;
    for (int i = 0; i < 8; ++i) packet[15 + i] = static_cast<uint8_t>(0x20 + i);  // scid

    UdpSocket socket;
    ASSERT_EQ(socket.set_recv_timeout(2000), 0);
    struct sockaddr_in server;
    std::memset(&server, 0, sizeof(server));
    server.sin_family = AF_INET;
    server.sin_port = htons(terminator_->port());
    inet_pton(AF_INET, "127.0.0.1", &server.sin_addr);
    ASSERT_EQ(socket.sendto(packet.data(), packet.size(),
                            reinterpret_cast<const struct sockaddr*>(&server), sizeof(server)),
              static_cast<ssize_t>(packet.size()));

    uint8_t buf[2048];
    struct sockaddr_in from;
    socklen_t from_len = sizeof(from);
    ssize_t n = socket.recvfrom(buf, sizeof(buf), reinterpret_cast<struct sockaddr*>(&from),
                                &from_len);
    ASSERT_GT(n, 23);
    EXPECT_NE(buf[0] & 0x80, 0);
    EXPECT_EQ(buf[1] | buf[2] | buf[3] | buf[4], 0);
    // Connection IDs are echoed swapped
    ASSERT_EQ(buf[5], 8);
    EXPECT_EQ(std::memcmp(buf + 6, packet.data() + 15, 8), 0);
    ASSERT_EQ(buf[14], 8);
    EXPECT_EQ(std::memcmp(buf + 15, packet.data() + 6, 8), 0);

    EXPECT_EQ(terminator_->active_connections(), 0u);
}

TEST_F(Http3TerminatorTest, ShortInitialCountsAsFailure) {
    UdpSocket socket;
    struct sockaddr_in server;
    std::memset(&server, 0, sizeof(server));
    server.sin_family = AF_INET;
    server.sin_port = htons(terminator_->port());
    inet_pton(AF_INET, "127.0.0.1", &server.sin_addr);

    // Version 1 Initial with a destination ID shorter than 8 bytes
    std::vector<uint8_t> packet(1200, 0);
    packet[0] = 0xc0;
    packet[4] = 0x01;
    packet[5] = 4;
    packet[10] = 0;
    socket.sendto(packet.data(), packet.size(),
                  reinterpret_cast<const struct sockaddr*>(&server), sizeof(server));

    EXPECT_TRUE(wait_until([&] {
        return metrics_.snapshot(Protocol::HTTP3).handshake_failures == 1;
    }));
    EXPECT_EQ(terminator_->active_connections(), 0u);
}

TEST_F(Http3TerminatorTest, DrainClosesIdleConnections) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());
    ASSERT_NE(client.get("/health"), nullptr);

    terminator_->drain();
    ASSERT_TRUE(client.run_until([&] { return client.conn().quic().closed_by_peer(); }));
    EXPECT_EQ(client.conn().quic().close_error_code(),
              static_cast<uint64_t>(dualmeter::http3::ErrorCode::NO_ERROR));

    EXPECT_TRUE(wait_until([&] { return terminator_->active_connections() == 0; }));
    EXPECT_TRUE(wait_until([&] {
        return metrics_.snapshot(Protocol::HTTP3).active_connections == 0;
    }));

    // New connections are ignored while draining
    H3TestClient late(terminator_->port());
    EXPECT_FALSE(late.run_until([&] { return late.conn().handshake_complete(); }, 300));
}

TEST_F(Http3TerminatorTest, ForceCloseEndsConnections) {
    H3TestClient client(terminator_->port());
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(wait_until([&] { return terminator_->active_connections() == 1; }));

    terminator_->force_close();
    EXPECT_TRUE(client.run_until([&] { return client.conn().quic().closed_by_peer(); }));
    EXPECT_TRUE(wait_until([&] { return terminator_->active_connections() == 0; }));
}
