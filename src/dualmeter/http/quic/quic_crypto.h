#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace dualmeter {
namespace quic {

/**
 * Packet number spaces (RFC 9000 Section 12.3), which double as the
 * encryption levels of the handshake (0-RTT is not supported).
 */
enum class PacketSpace : uint8_t {
    INITIAL = 0,
    HANDSHAKE = 1,
    APPLICATION = 2
};

constexpr size_t kNumPacketSpaces = 3;

const char* packet_space_name(PacketSpace space) noexcept;

/**
 * HKDF-SHA256 (RFC 5869) through the OpenSSL 3 KDF API.
 */
bool hkdf_extract(const uint8_t* salt, size_t salt_len,
                  const uint8_t* ikm, size_t ikm_len,
                  uint8_t* out, size_t out_len) noexcept;

bool hkdf_expand(const uint8_t* prk, size_t prk_len,
                 const uint8_t* info, size_t info_len,
                 uint8_t* out, size_t out_len) noexcept;

/**
 * HKDF-Expand-Label (RFC 8446 Section 7.1) with an empty context.
 */
bool hkdf_expand_label(const uint8_t* secret, size_t secret_len,
                       const char* label,
                       uint8_t* out, size_t out_len) noexcept;

constexpr size_t kSecretLength = 32;   // SHA-256

/**
 * Initial secrets from the client's first Destination Connection ID
 * (RFC 9001 Section 5.2).
 */
bool derive_initial_secrets(const uint8_t* dcid, size_t dcid_len,
                            uint8_t client_secret[kSecretLength],
                            uint8_t server_secret[kSecretLength]) noexcept;

/**
 * AEAD_AES_128_GCM keys for one direction at one encryption level, plus
 * the AES-128-ECB header protection key.
 *
 * Also used for TLS 1.3 records, which share the cipher but derive with
 * the plain "key"/"iv" labels and have no header protection.
 */
class PacketKeys {
public:
    static constexpr size_t kKeyLength = 16;
    static constexpr size_t kIvLength = 12;
    static constexpr size_t kTagLength = 16;
    static constexpr size_t kSampleLength = 16;

    enum class Usage : uint8_t { QUIC_PACKET, TLS_RECORD };

    PacketKeys();
    ~PacketKeys();

    PacketKeys(const PacketKeys&) = delete;
    PacketKeys& operator=(const PacketKeys&) = delete;

    /**
     * Derive key, iv and (for QUIC) hp from a traffic secret.
     */
    bool derive(const uint8_t* secret, size_t secret_len, Usage usage = Usage::QUIC_PACKET) noexcept;

    /**
     * Encrypt in place and append the tag. data must have kTagLength bytes
     * of room after len.
     *
     * @param counter Packet number or record sequence number
     * @return false on a cipher failure
     */
    bool seal(uint64_t counter, const uint8_t* aad, size_t aad_len,
              uint8_t* data, size_t len) noexcept;

    /**
     * Decrypt in place. len includes the tag; the plaintext is
     * len - kTagLength bytes.
     *
     * @return false if authentication fails
     */
    bool open(uint64_t counter, const uint8_t* aad, size_t aad_len,
              uint8_t* data, size_t len) noexcept;

    /**
     * Header protection mask (RFC 9001 Section 5.4.3).
     */
    bool header_mask(const uint8_t* sample, uint8_t mask[5]) noexcept;

    bool valid() const noexcept { return valid_; }
    const uint8_t* key() const noexcept { return key_; }
    const uint8_t* iv() const noexcept { return iv_; }
    const uint8_t* hp() const noexcept { return hp_; }

private:
    struct CtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const noexcept;
    };

    void make_nonce(uint64_t counter, uint8_t nonce[kIvLength]) const noexcept;

    uint8_t key_[kKeyLength];
    uint8_t iv_[kIvLength];
    uint8_t hp_[kKeyLength];
    bool valid_{false};
    std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> aead_;
    std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> ecb_;
};

/**
 * Apply header protection to a sealed packet (RFC 9001 Section 5.4.1).
 * The first byte and the packet number must still be in clear.
 *
 * @param pn_offset Offset of the packet number field in packet
 * @return false if the packet is too short to sample
 */
bool protect_header(PacketKeys& keys, uint8_t* packet, size_t packet_len,
                    size_t pn_offset) noexcept;

/**
 * Remove header protection in place.
 *
 * @return Packet number length, 0 if the packet is too short to sample
 */
uint8_t unprotect_header(PacketKeys& keys, uint8_t* packet, size_t packet_len,
                         size_t pn_offset) noexcept;

} // namespace quic
} // namespace dualmeter
