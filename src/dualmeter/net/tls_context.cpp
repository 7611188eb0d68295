/**
 * TLS Context Implementation
 */

#include "tls_context.h"
#include "../core/logger.h"

namespace dualmeter {
namespace net {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

} // namespace

std::string TlsContext::get_openssl_error() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

std::shared_ptr<TlsContext> TlsContext::create_server(const TlsContextConfig& config,
                                                      std::string* error) {
    auto ctx = std::shared_ptr<TlsContext>(new TlsContext());

    auto fail = [&](const std::string& message) -> std::shared_ptr<TlsContext> {
        LOG_ERROR("TLS", "%s", message.c_str());
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    ctx->ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ctx->ctx_) {
        return fail("Failed to create SSL_CTX: " + get_openssl_error());
    }

    SSL_CTX_set_options(ctx->ctx_, SSL_OP_NO_RENEGOTIATION | SSL_OP_CIPHER_SERVER_PREFERENCE);

    int min_version = config.allow_tlsv12 ? TLS1_2_VERSION : TLS1_3_VERSION;
    if (!SSL_CTX_set_min_proto_version(ctx->ctx_, min_version)) {
        return fail("Failed to set minimum TLS version: " + get_openssl_error());
    }

    if (!ctx->load_credentials(config)) {
        return fail(ctx->error_message_);
    }

    if (!config.cipher_list.empty() &&
        !SSL_CTX_set_cipher_list(ctx->ctx_, config.cipher_list.c_str())) {
        return fail("Failed to set cipher list: " + get_openssl_error());
    }

    if (!config.cipher_suites.empty() &&
        !SSL_CTX_set_ciphersuites(ctx->ctx_, config.cipher_suites.c_str())) {
        return fail("Failed to set TLS 1.3 ciphersuites: " + get_openssl_error());
    }

    if (!config.alpn_protocols.empty()) {
        if (!ctx->set_alpn_wire_format(config.alpn_protocols)) {
            return fail(ctx->error_message_);
        }
        SSL_CTX_set_alpn_select_cb(ctx->ctx_, alpn_select_callback, ctx.get());
        ctx->alpn_protocols_ = config.alpn_protocols;
    }

    return ctx;
}

std::shared_ptr<TlsContext> TlsContext::create_client(
    const std::vector<std::string>& alpn_protocols,
    std::string* error
) {
    auto ctx = std::shared_ptr<TlsContext>(new TlsContext());

    ctx->ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx->ctx_) {
        if (error) *error = "Failed to create SSL_CTX: " + get_openssl_error();
        return nullptr;
    }

    SSL_CTX_set_verify(ctx->ctx_, SSL_VERIFY_NONE, nullptr);

    if (!alpn_protocols.empty()) {
        if (!ctx->set_alpn_wire_format(alpn_protocols)) {
            if (error) *error = ctx->error_message_;
            return nullptr;
        }
        // Note: returns 0 on success, unlike most of the API
        if (SSL_CTX_set_alpn_protos(ctx->ctx_, ctx->alpn_wire_format_.data(),
                                    static_cast<unsigned int>(ctx->alpn_wire_format_.size())) != 0) {
            if (error) *error = "Failed to set ALPN protocols: " + get_openssl_error();
            return nullptr;
        }
        ctx->alpn_protocols_ = alpn_protocols;
    }

    return ctx;
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

bool TlsContext::load_credentials(const TlsContextConfig& config) {
    if (!config.cert_file.empty()) {
        if (SSL_CTX_use_certificate_chain_file(ctx_, config.cert_file.c_str()) != 1) {
            error_message_ = "Failed to load certificate file '" + config.cert_file + "': " +
                             get_openssl_error();
            return false;
        }
    } else if (!config.cert_data.empty()) {
        BioPtr bio(BIO_new_mem_buf(config.cert_data.data(),
                                   static_cast<int>(config.cert_data.size())));
        std::unique_ptr<X509, X509Deleter> cert(
            bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr);
        if (!cert || SSL_CTX_use_certificate(ctx_, cert.get()) != 1) {
            error_message_ = "Failed to use in-memory certificate: " + get_openssl_error();
            return false;
        }
    } else {
        error_message_ = "No certificate provided";
        return false;
    }

    if (!config.key_file.empty()) {
        if (SSL_CTX_use_PrivateKey_file(ctx_, config.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            error_message_ = "Failed to load private key file '" + config.key_file + "': " +
                             get_openssl_error();
            return false;
        }
    } else if (!config.key_data.empty()) {
        BioPtr bio(BIO_new_mem_buf(config.key_data.data(),
                                   static_cast<int>(config.key_data.size())));
        std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
            bio ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr) : nullptr);
        if (!key || SSL_CTX_use_PrivateKey(ctx_, key.get()) != 1) {
            error_message_ = "Failed to use in-memory private key: " + get_openssl_error();
            return false;
        }
    } else {
        error_message_ = "No private key provided";
        return false;
    }

    if (!SSL_CTX_check_private_key(ctx_)) {
        error_message_ = "Private key does not match certificate: " + get_openssl_error();
        return false;
    }

    return true;
}

bool TlsContext::set_alpn_wire_format(const std::vector<std::string>& protocols) {
    alpn_wire_format_.clear();

    for (const auto& protocol : protocols) {
        if (protocol.empty() || protocol.size() > 255) {
            error_message_ = "Invalid ALPN protocol: '" + protocol + "'";
            return false;
        }
        alpn_wire_format_.push_back(static_cast<unsigned char>(protocol.size()));
        alpn_wire_format_.insert(alpn_wire_format_.end(), protocol.begin(), protocol.end());
    }
    return true;
}

int TlsContext::alpn_select_callback(
    SSL* /*ssl*/,
    const unsigned char** out,
    unsigned char* outlen,
    const unsigned char* in,
    unsigned int inlen,
    void* arg
) {
    TlsContext* ctx = static_cast<TlsContext*>(arg);

    // Server preference order
    int result = SSL_select_next_proto(
        const_cast<unsigned char**>(out),
        outlen,
        ctx->alpn_wire_format_.data(),
        static_cast<unsigned int>(ctx->alpn_wire_format_.size()),
        in,
        inlen
    );

    if (result == OPENSSL_NPN_NEGOTIATED) {
        return SSL_TLSEXT_ERR_OK;
    }

    return SSL_TLSEXT_ERR_ALERT_FATAL;
}

} // namespace net
} // namespace dualmeter
