/**
 * QuicTls client and server sessions exchanging handshake bytes directly,
 * level by level, without any packet layer in between.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "support/quic_client.h"
#include "src/dualmeter/http/quic/quic_tls.h"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace dualmeter::quic;

namespace {

constexpr PacketSpace kLevels[] = {
    PacketSpace::INITIAL, PacketSpace::HANDSHAKE, PacketSpace::APPLICATION
};

bool same_secret(const uint8_t* a, const uint8_t* b) {
    return std::memcmp(a, b, kSecretLength) == 0;
}

} // namespace

class QuicTlsTest : public DualmeterTest {
protected:
    void SetUp() override {
        DualmeterTest::SetUp();
        server_ctx_ = dualmeter::testing::quic_server_context();
        ASSERT_NE(server_ctx_, nullptr);
        client_ctx_ = dualmeter::testing::quic_client_context();
        ASSERT_NE(client_ctx_, nullptr);
    }

    void init(const std::vector<uint8_t>& client_params = {1, 2, 3},
              const std::vector<uint8_t>& server_params = {4, 5, 6, 7}) {
        ASSERT_TRUE(client_.init(client_ctx_->get_ssl_ctx(), false, client_params, "localhost"));
        ASSERT_TRUE(server_.init(server_ctx_->get_ssl_ctx(), true, server_params));
    }

    /**
     * Hand every pending output of from to to, lowest level first.
     *
     * @return to.advance() of the last delivery, true if nothing moved
     */
    bool deliver(QuicTls& from, QuicTls& to) {
        bool ok = true;
        for (PacketSpace level : kLevels) {
            if (!from.has_output(level)) continue;
            std::vector<uint8_t> bytes = from.take_output(level);
            EXPECT_TRUE(to.provide_data(level, bytes.data(), bytes.size()))
                << packet_space_name(level);
            ok = to.advance();
            if (!ok) break;
        }
        return ok;
    }

    std::shared_ptr<dualmeter::net::TlsContext> server_ctx_;
    std::shared_ptr<dualmeter::net::TlsContext> client_ctx_;
    QuicTls client_;
    QuicTls server_;
};

TEST_F(QuicTlsTest, FullHandshake) {
    init();
    ASSERT_TRUE(client_.advance());
    EXPECT_TRUE(client_.has_output(PacketSpace::INITIAL));
    EXPECT_FALSE(client_.has_output(PacketSpace::HANDSHAKE));

    // ClientHello -> ServerHello .. server Finished
    ASSERT_TRUE(deliver(client_, server_));
    EXPECT_TRUE(server_.has_output(PacketSpace::INITIAL));
    EXPECT_TRUE(server_.has_output(PacketSpace::HANDSHAKE));
    EXPECT_TRUE(server_.has_write_secret(PacketSpace::APPLICATION));
    EXPECT_FALSE(server_.has_read_secret(PacketSpace::APPLICATION));
    EXPECT_FALSE(server_.handshake_complete());
    ASSERT_TRUE(server_.has_peer_params());
    EXPECT_EQ(server_.peer_params(), std::vector<uint8_t>({1, 2, 3}));

    // -> client Finished
    ASSERT_TRUE(deliver(server_, client_));
    EXPECT_TRUE(client_.handshake_complete());
    EXPECT_TRUE(client_.has_output(PacketSpace::HANDSHAKE));
    EXPECT_FALSE(client_.has_output(PacketSpace::INITIAL));
    ASSERT_TRUE(client_.has_peer_params());
    EXPECT_EQ(client_.peer_params(), std::vector<uint8_t>({4, 5, 6, 7}));

    ASSERT_TRUE(deliver(client_, server_));
    EXPECT_TRUE(server_.handshake_complete());
    EXPECT_FALSE(client_.failed());
    EXPECT_FALSE(server_.failed());

    EXPECT_EQ(client_.alpn(), "h3");
    EXPECT_EQ(server_.alpn(), "h3");

    // Each direction uses one secret per level
    for (PacketSpace level : {PacketSpace::HANDSHAKE, PacketSpace::APPLICATION}) {
        ASSERT_TRUE(client_.has_write_secret(level));
        ASSERT_TRUE(server_.has_read_secret(level));
        EXPECT_TRUE(same_secret(client_.write_secret(level), server_.read_secret(level)));
        ASSERT_TRUE(server_.has_write_secret(level));
        ASSERT_TRUE(client_.has_read_secret(level));
        EXPECT_TRUE(same_secret(server_.write_secret(level), client_.read_secret(level)));
        EXPECT_FALSE(same_secret(client_.write_secret(level), client_.read_secret(level)));
    }

    // No tickets or other post-handshake messages
    for (PacketSpace level : kLevels) {
        EXPECT_FALSE(server_.has_output(level)) << packet_space_name(level);
    }
}

TEST_F(QuicTlsTest, HandshakeDataSplitAcrossCalls) {
    init();
    ASSERT_TRUE(client_.advance());
    std::vector<uint8_t> hello = client_.take_output(PacketSpace::INITIAL);
    ASSERT_GT(hello.size(), 10u);

    // Partial ClientHello: nothing to answer yet
    ASSERT_TRUE(server_.provide_data(PacketSpace::INITIAL, hello.data(), 7));
    ASSERT_TRUE(server_.advance());
    EXPECT_FALSE(server_.has_output(PacketSpace::INITIAL));

    ASSERT_TRUE(server_.provide_data(PacketSpace::INITIAL, hello.data() + 7, hello.size() - 7));
    ASSERT_TRUE(server_.advance());
    EXPECT_TRUE(server_.has_output(PacketSpace::INITIAL));

    ASSERT_TRUE(deliver(server_, client_));
    ASSERT_TRUE(deliver(client_, server_));
    EXPECT_TRUE(client_.handshake_complete());
    EXPECT_TRUE(server_.handshake_complete());
}

TEST_F(QuicTlsTest, HandshakeLevelNeedsItsSecret) {
    init();
    const uint8_t bytes[] = {0x14, 0x00, 0x00, 0x00};
    EXPECT_FALSE(server_.provide_data(PacketSpace::HANDSHAKE, bytes, sizeof(bytes)));
    EXPECT_FALSE(server_.provide_data(PacketSpace::APPLICATION, bytes, sizeof(bytes)));
}

TEST_F(QuicTlsTest, AlpnMismatchRaisesNoApplicationProtocol) {
    client_ctx_ = dualmeter::testing::quic_client_context({"h2"});
    ASSERT_NE(client_ctx_, nullptr);
    init();
    ASSERT_TRUE(client_.advance());

    EXPECT_FALSE(deliver(client_, server_));
    EXPECT_TRUE(server_.failed());
    EXPECT_FALSE(server_.handshake_complete());
    EXPECT_EQ(server_.alert(), QuicTls::kAlertNoApplicationProtocol);
    EXPECT_FALSE(server_.error().empty());
}

TEST_F(QuicTlsTest, MissingTransportParametersFailsHandshake) {
    // A plain TLS 1.3 client never sends the QUIC extension
    auto plain = dualmeter::net::TlsContext::create_client({"h3"});
    ASSERT_NE(plain, nullptr);
    SSL_CTX_set_min_proto_version(plain->get_ssl_ctx(), TLS1_3_VERSION);

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(plain->get_ssl_ctx()), SSL_free);
    ASSERT_NE(ssl, nullptr);
    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    SSL_set_bio(ssl.get(), rbio, wbio);
    SSL_set_connect_state(ssl.get());
    EXPECT_EQ(SSL_do_handshake(ssl.get()), -1);

    // Strip the 5-byte record header: QUIC carries bare handshake messages
    char* data = nullptr;
    long len = BIO_get_mem_data(wbio, &data);
    ASSERT_GT(len, 5);

    ASSERT_TRUE(server_.init(server_ctx_->get_ssl_ctx(), true, {4, 5, 6, 7}));
    ASSERT_TRUE(server_.provide_data(PacketSpace::INITIAL,
                                     reinterpret_cast<const uint8_t*>(data) + 5,
                                     static_cast<size_t>(len) - 5));
    EXPECT_FALSE(server_.advance());
    EXPECT_TRUE(server_.failed());
    EXPECT_EQ(server_.alert(), QuicTls::kAlertMissingExtension);
}

TEST_F(QuicTlsTest, ServerContextRejectsMissingCredentials) {
    dualmeter::net::TlsContextConfig config;
    config.cert_file = "/nonexistent/cert.pem";
    config.key_file = "/nonexistent/key.pem";
    std::string error;
    EXPECT_EQ(QuicTls::create_server_context(config, &error), nullptr);
    EXPECT_FALSE(error.empty());
}
