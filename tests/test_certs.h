/**
 * @file test_certs.h
 * @brief Self-signed certificate generated in-process for TLS tests
 */

#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

namespace dualmeter {
namespace testing {

struct TestCertificate {
    std::string cert_pem;
    std::string key_pem;
};

namespace detail {

inline std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return len > 0 ? std::string(data, static_cast<size_t>(len)) : std::string();
}

} // namespace detail

/**
 * P-256 key and a one-day self-signed certificate for "localhost".
 * Returns empty strings if OpenSSL fails.
 */
inline TestCertificate make_self_signed_certificate() {
    TestCertificate result;

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), EVP_PKEY_free);
    if (!key) return result;

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    if (!cert) return result;

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 60 * 60);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) return result;

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!cert_bio || !key_bio) return result;

    if (PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) return result;
    if (PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0,
                                 nullptr, nullptr) != 1) {
        return result;
    }

    result.cert_pem = detail::bio_to_string(cert_bio.get());
    result.key_pem = detail::bio_to_string(key_bio.get());
    return result;
}

/**
 * Shared certificate for the whole test binary.
 */
inline const TestCertificate& test_certificate() {
    static const TestCertificate cert = make_self_signed_certificate();
    return cert;
}

inline bool write_text_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return static_cast<bool>(out);
}

} // namespace testing
} // namespace dualmeter
