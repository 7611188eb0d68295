#include "quic_crypto.h"
#include "../../core/logger.h"
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <cstring>
#include <string>

namespace dualmeter {
namespace quic {

namespace {

// RFC 9001 Section 5.2
constexpr uint8_t kInitialSalt[] = {
    0x38, 0x76, 0x2c, 0xf7, 0xf5, 0x59, 0x34, 0xb3, 0x4d, 0x17,
    0x9a, 0xe6, 0xa4, 0xc8, 0x0c, 0xad, 0xcc, 0xbb, 0x7f, 0x0a
};

EVP_KDF* hkdf() noexcept {
    // Fetched once, lives for the process
    static EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_HKDF, nullptr);
    return kdf;
}

bool run_hkdf(int mode,
              const uint8_t* key, size_t key_len,
              const uint8_t* salt, size_t salt_len,
              const uint8_t* info, size_t info_len,
              uint8_t* out, size_t out_len) noexcept {
    EVP_KDF* kdf = hkdf();
    if (!kdf) {
        LOG_ERROR("QUIC", "HKDF unavailable in this OpenSSL build");
        return false;
    }
    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    if (!ctx) {
        return false;
    }

    char digest[] = "SHA256";
    OSSL_PARAM params[6];
    OSSL_PARAM* p = params;
    *p++ = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &mode);
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0);
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY,
                                             const_cast<uint8_t*>(key), key_len);
    if (salt) {
        *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                                 const_cast<uint8_t*>(salt), salt_len);
    }
    if (info) {
        *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO,
                                                 const_cast<uint8_t*>(info), info_len);
    }
    *p = OSSL_PARAM_construct_end();

    bool ok = EVP_KDF_derive(ctx, out, out_len, params) == 1;
    EVP_KDF_CTX_free(ctx);
    return ok;
}

} // namespace

const char* packet_space_name(PacketSpace space) noexcept {
    switch (space) {
        case PacketSpace::INITIAL: return "initial";
        case PacketSpace::HANDSHAKE: return "handshake";
        case PacketSpace::APPLICATION: return "application";
    }
    return "unknown";
}

bool hkdf_extract(const uint8_t* salt, size_t salt_len,
                  const uint8_t* ikm, size_t ikm_len,
                  uint8_t* out, size_t out_len) noexcept {
    return run_hkdf(EVP_KDF_HKDF_MODE_EXTRACT_ONLY, ikm, ikm_len, salt, salt_len,
                    nullptr, 0, out, out_len);
}

bool hkdf_expand(const uint8_t* prk, size_t prk_len,
                 const uint8_t* info, size_t info_len,
                 uint8_t* out, size_t out_len) noexcept {
    return run_hkdf(EVP_KDF_HKDF_MODE_EXPAND_ONLY, prk, prk_len, nullptr, 0,
                    info, info_len, out, out_len);
}

bool hkdf_expand_label(const uint8_t* secret, size_t secret_len,
                       const char* label,
                       uint8_t* out, size_t out_len) noexcept {
    // struct { uint16 length; opaque label<7..255>; opaque context<0..255>; }
    std::string full = std::string("tls13 ") + label;
    if (full.size() > 255 || out_len > 0xffff) {
        return false;
    }
    uint8_t info[2 + 1 + 255 + 1];
    size_t pos = 0;
    info[pos++] = static_cast<uint8_t>(out_len >> 8);
    info[pos++] = static_cast<uint8_t>(out_len);
    info[pos++] = static_cast<uint8_t>(full.size());
    std::memcpy(info + pos, full.data(), full.size());
    pos += full.size();
    info[pos++] = 0;
    return hkdf_expand(secret, secret_len, info, pos, out, out_len);
}

bool derive_initial_secrets(const uint8_t* dcid, size_t dcid_len,
                            uint8_t client_secret[kSecretLength],
                            uint8_t server_secret[kSecretLength]) noexcept {
    uint8_t initial[kSecretLength];
    if (!hkdf_extract(kInitialSalt, sizeof(kInitialSalt), dcid, dcid_len,
                      initial, sizeof(initial))) {
        return false;
    }
    return hkdf_expand_label(initial, sizeof(initial), "client in", client_secret, kSecretLength) &&
           hkdf_expand_label(initial, sizeof(initial), "server in", server_secret, kSecretLength);
}

// =============================================================================
// PacketKeys
// =============================================================================

void PacketKeys::CtxDeleter::operator()(EVP_CIPHER_CTX* ctx) const noexcept {
    EVP_CIPHER_CTX_free(ctx);
}

PacketKeys::PacketKeys()
    : aead_(EVP_CIPHER_CTX_new()),
      ecb_(EVP_CIPHER_CTX_new()) {
    std::memset(key_, 0, sizeof(key_));
    std::memset(iv_, 0, sizeof(iv_));
    std::memset(hp_, 0, sizeof(hp_));
}

PacketKeys::~PacketKeys() = default;

bool PacketKeys::derive(const uint8_t* secret, size_t secret_len, Usage usage) noexcept {
    valid_ = false;
    if (!aead_ || !ecb_) {
        return false;
    }

    bool quic = usage == Usage::QUIC_PACKET;
    if (!hkdf_expand_label(secret, secret_len, quic ? "quic key" : "key", key_, kKeyLength) ||
        !hkdf_expand_label(secret, secret_len, quic ? "quic iv" : "iv", iv_, kIvLength)) {
        return false;
    }
    if (quic) {
        if (!hkdf_expand_label(secret, secret_len, "quic hp", hp_, kKeyLength)) {
            return false;
        }
        if (EVP_EncryptInit_ex(ecb_.get(), EVP_aes_128_ecb(), nullptr, hp_, nullptr) != 1) {
            return false;
        }
        EVP_CIPHER_CTX_set_padding(ecb_.get(), 0);
    }

    valid_ = true;
    return true;
}

void PacketKeys::make_nonce(uint64_t counter, uint8_t nonce[kIvLength]) const noexcept {
    std::memcpy(nonce, iv_, kIvLength);
    for (size_t i = 0; i < 8; i++) {
        nonce[kIvLength - 1 - i] ^= static_cast<uint8_t>(counter >> (8 * i));
    }
}

bool PacketKeys::seal(uint64_t counter, const uint8_t* aad, size_t aad_len,
                      uint8_t* data, size_t len) noexcept {
    if (!valid_) {
        return false;
    }
    uint8_t nonce[kIvLength];
    make_nonce(counter, nonce);

    EVP_CIPHER_CTX* ctx = aead_.get();
    int outl = 0;
    int finl = 0;
    if (EVP_EncryptInit_ex(ctx, EVP_aes_128_gcm(), nullptr, key_, nonce) != 1 ||
        EVP_EncryptUpdate(ctx, nullptr, &outl, aad, static_cast<int>(aad_len)) != 1 ||
        EVP_EncryptUpdate(ctx, data, &outl, data, static_cast<int>(len)) != 1 ||
        EVP_EncryptFinal_ex(ctx, data + outl, &finl) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLength),
                            data + len) != 1) {
        return false;
    }
    return true;
}

bool PacketKeys::open(uint64_t counter, const uint8_t* aad, size_t aad_len,
                      uint8_t* data, size_t len) noexcept {
    if (!valid_ || len < kTagLength) {
        return false;
    }
    uint8_t nonce[kIvLength];
    make_nonce(counter, nonce);

    size_t ct_len = len - kTagLength;
    EVP_CIPHER_CTX* ctx = aead_.get();
    int outl = 0;
    int finl = 0;
    if (EVP_DecryptInit_ex(ctx, EVP_aes_128_gcm(), nullptr, key_, nonce) != 1 ||
        EVP_DecryptUpdate(ctx, nullptr, &outl, aad, static_cast<int>(aad_len)) != 1 ||
        EVP_DecryptUpdate(ctx, data, &outl, data, static_cast<int>(ct_len)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLength),
                            data + ct_len) != 1) {
        return false;
    }
    return EVP_DecryptFinal_ex(ctx, data + outl, &finl) == 1;
}

bool PacketKeys::header_mask(const uint8_t* sample, uint8_t mask[5]) noexcept {
    if (!valid_) {
        return false;
    }
    uint8_t block[kSampleLength];
    int outl = 0;
    if (EVP_EncryptUpdate(ecb_.get(), block, &outl, sample, static_cast<int>(kSampleLength)) != 1 ||
        outl != static_cast<int>(kSampleLength)) {
        return false;
    }
    std::memcpy(mask, block, 5);
    return true;
}

// =============================================================================
// Header protection
// =============================================================================

namespace {

// Long headers protect 4 bits of the first byte, short headers 5
uint8_t first_byte_mask(uint8_t first) noexcept {
    return (first & 0x80) != 0 ? 0x0f : 0x1f;
}

} // namespace

bool protect_header(PacketKeys& keys, uint8_t* packet, size_t packet_len,
                    size_t pn_offset) noexcept {
    if (packet_len < pn_offset + 4 + PacketKeys::kSampleLength) {
        return false;
    }
    uint8_t mask[5];
    if (!keys.header_mask(packet + pn_offset + 4, mask)) {
        return false;
    }
    uint8_t pn_length = static_cast<uint8_t>((packet[0] & 0x03) + 1);
    packet[0] ^= mask[0] & first_byte_mask(packet[0]);
    for (uint8_t i = 0; i < pn_length; i++) {
        packet[pn_offset + i] ^= mask[1 + i];
    }
    return true;
}

uint8_t unprotect_header(PacketKeys& keys, uint8_t* packet, size_t packet_len,
                         size_t pn_offset) noexcept {
    if (packet_len < pn_offset + 4 + PacketKeys::kSampleLength) {
        return 0;
    }
    uint8_t mask[5];
    if (!keys.header_mask(packet + pn_offset + 4, mask)) {
        return 0;
    }
    packet[0] ^= mask[0] & first_byte_mask(packet[0]);
    uint8_t pn_length = static_cast<uint8_t>((packet[0] & 0x03) + 1);
    for (uint8_t i = 0; i < pn_length; i++) {
        packet[pn_offset + i] ^= mask[1 + i];
    }
    return pn_length;
}

} // namespace quic
} // namespace dualmeter
