#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dualmeter {
namespace http {

/**
 * Huffman coder for header field strings.
 *
 * Code table from RFC 7541 Appendix B; shared by HPACK (HTTP/2) and
 * QPACK (HTTP/3), which use the same code.
 */
class HuffmanEncoder {
public:
    /**
     * Encoded size in bytes, including final padding.
     */
    static size_t encoded_size(const uint8_t* input, size_t input_len) noexcept;

    /**
     * Append the Huffman encoding of input to output.
     */
    static void encode(const uint8_t* input, size_t input_len, std::vector<uint8_t>& output);
};

class HuffmanDecoder {
public:
    /**
     * Append the decoding of input to output.
     *
     * Rejects padding longer than 7 bits, padding that is not all ones
     * and an encoded EOS symbol (RFC 7541 Section 5.2).
     *
     * @return 0 on success, -1 on malformed input
     */
    static int decode(const uint8_t* input, size_t input_len, std::string& output);
};

} // namespace http
} // namespace dualmeter
