#pragma once

#include "qpack_static_table.h"
#include "../../core/result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dualmeter {
namespace qpack {

/**
 * QPACK Decoder (RFC 9204).
 *
 * Decodes field sections that reference only the static table. Any
 * dynamic table reference is a decompression failure because we
 * advertise SETTINGS_QPACK_MAX_TABLE_CAPACITY = 0.
 */
class QPACKDecoder {
public:
    /**
     * Maximum headers to decode.
     */
    static constexpr size_t kMaxHeaders = 256;

    /**
     * @param max_field_section_size Limit on sum(name + value + 32)
     */
    explicit QPACKDecoder(size_t max_field_section_size = 16384)
        : max_field_section_size_(max_field_section_size) {}

    /**
     * Decode a complete field section.
     *
     * @param output Decoded fields are appended in wire order
     * @return ok, or parse_error (QPACK_DECOMPRESSION_FAILED)
     */
    core::result<void> decode_field_section(const uint8_t* input, size_t input_len,
                                            std::vector<HeaderField>& output) const;

private:
    /**
     * String literal with an N-bit length prefix and the Huffman flag
     * directly above it.
     *
     * @return 0 on success, -1 on malformed input
     */
    static int decode_string(const uint8_t* input, size_t len, int prefix_bits,
                             std::string& out, size_t& out_consumed);

    size_t max_field_section_size_;
};

} // namespace qpack
} // namespace dualmeter
