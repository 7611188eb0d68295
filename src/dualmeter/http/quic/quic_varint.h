#pragma once

#include <cstdint>
#include <cstddef>

namespace dualmeter {
namespace quic {

/**
 * QUIC variable-length integers (RFC 9000 Section 16).
 *
 * The two high bits of the first byte give the length (1, 2, 4 or 8
 * bytes); the remaining bits hold the value in network byte order.
 * Also used by the HTTP/3 and QPACK layers for frame types and lengths.
 */
class VarInt {
public:
    static constexpr uint64_t MAX = (1ULL << 62) - 1;
    static constexpr size_t MAX_SIZE = 8;

    /**
     * Encoded length of a value; values above MAX are not representable.
     */
    static size_t encoded_size(uint64_t value) noexcept {
        if (value < (1ULL << 6)) return 1;
        if (value < (1ULL << 14)) return 2;
        if (value < (1ULL << 30)) return 4;
        return 8;
    }

    /**
     * Write the shortest encoding of `value`.
     *
     * @param out At least encoded_size(value) bytes
     * @return Bytes written
     */
    static size_t encode(uint64_t value, uint8_t* out) noexcept {
        size_t size = encoded_size(value);
        for (size_t i = size; i-- > 0;) {
            out[i] = static_cast<uint8_t>(value);
            value >>= 8;
        }
        out[0] |= static_cast<uint8_t>(length_bits(size) << 6);
        return size;
    }

    /**
     * Write `value` in exactly `size` bytes (1, 2, 4 or 8). The value
     * must fit; used where a field's width is fixed before its value is
     * known.
     */
    static size_t encode_fixed(uint64_t value, size_t size, uint8_t* out) noexcept {
        for (size_t i = size; i-- > 0;) {
            out[i] = static_cast<uint8_t>(value);
            value >>= 8;
        }
        out[0] = static_cast<uint8_t>((out[0] & 0x3F) | (length_bits(size) << 6));
        return size;
    }

    /**
     * @return Bytes consumed, or -1 if `len` is short of the encoded length
     */
    static int decode(const uint8_t* data, size_t len, uint64_t& out) noexcept {
        if (len == 0) return -1;
        size_t size = size_t{1} << (data[0] >> 6);
        if (len < size) return -1;

        uint64_t value = data[0] & 0x3F;
        for (size_t i = 1; i < size; i++) {
            value = (value << 8) | data[i];
        }
        out = value;
        return static_cast<int>(size);
    }

private:
    static constexpr uint8_t length_bits(size_t size) noexcept {
        return size == 1 ? 0 : size == 2 ? 1 : size == 4 ? 2 : 3;
    }
};

} // namespace quic
} // namespace dualmeter
