#pragma once

#include "qpack_static_table.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace dualmeter {
namespace qpack {

/**
 * QPACK Encoder (RFC 9204).
 *
 * Static table only: both endpoints advertise a dynamic table capacity of
 * zero, so every field section has a Required Insert Count of 0 and no
 * encoder stream instructions are ever sent. Strings are Huffman-coded
 * when that is shorter.
 */
class QPACKEncoder {
public:
    /**
     * Append an encoded field section to output.
     */
    void encode_field_section(const std::vector<HeaderField>& headers,
                              std::vector<uint8_t>& output) const;

    /**
     * Encode header field section with :status first.
     */
    void encode_response(uint16_t status, const std::vector<HeaderField>& headers,
                         std::vector<uint8_t>& output) const;

private:
    static void encode_field(std::string_view name, std::string_view value,
                             std::vector<uint8_t>& output);

    /**
     * String literal with an N-bit length prefix; the Huffman flag sits
     * just above the prefix.
     */
    static void encode_string(std::string_view str, int prefix_bits, uint8_t flags,
                              std::vector<uint8_t>& output);
};

} // namespace qpack
} // namespace dualmeter
