#include "quic_client.h"
#include "test_certs.h"
#include "src/dualmeter/http/quic/quic_tls.h"

namespace dualmeter {
namespace testing {

std::unique_ptr<quic::QUICConnection> connect_quic(
    uint64_t conn_id,
    const quic::TransportParameters& params,
    SSL_CTX* tls_ctx,
    uint64_t now,
    const std::string& server_name
) {
    quic::ConnectionID scid, dcid;
    if (!quic::generate_connection_id(quic::LOCAL_CID_LENGTH, scid) ||
        !quic::generate_connection_id(quic::LOCAL_CID_LENGTH, dcid)) {
        return nullptr;
    }
    // The client's first Destination CID doubles as the original one
    auto conn = std::make_unique<quic::QUICConnection>(false, conn_id, scid, dcid, dcid,
                                                       params, now);
    if (!conn->start_tls(tls_ctx, server_name, now)) {
        return nullptr;
    }
    return conn;
}

std::shared_ptr<net::TlsContext> quic_server_context(
    const std::vector<std::string>& alpn_protocols) {
    net::TlsContextConfig config;
    config.cert_data = test_certificate().cert_pem;
    config.key_data = test_certificate().key_pem;
    config.alpn_protocols = alpn_protocols;
    return quic::QuicTls::create_server_context(config);
}

std::shared_ptr<net::TlsContext> quic_client_context(
    const std::vector<std::string>& alpn_protocols) {
    return quic::QuicTls::create_client_context(alpn_protocols);
}

} // namespace testing
} // namespace dualmeter
