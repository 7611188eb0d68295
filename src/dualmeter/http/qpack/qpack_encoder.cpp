#include "qpack_encoder.h"
#include "../hpack.h"
#include "../huffman.h"
#include <string>

namespace dualmeter {
namespace qpack {

using http::HPACKEncoder;
using http::HuffmanEncoder;

void QPACKEncoder::encode_field_section(const std::vector<HeaderField>& headers,
                                        std::vector<uint8_t>& output) const {
    // Encoded Field Section Prefix (RFC 9204 Section 4.5.1):
    // Required Insert Count = 0, Sign = 0, Delta Base = 0
    output.push_back(0x00);
    output.push_back(0x00);

    for (const auto& field : headers) {
        encode_field(field.name, field.value, output);
    }
}

void QPACKEncoder::encode_response(uint16_t status, const std::vector<HeaderField>& headers,
                                   std::vector<uint8_t>& output) const {
    output.push_back(0x00);
    output.push_back(0x00);

    std::string status_str = std::to_string(status);
    encode_field(":status", status_str, output);
    for (const auto& field : headers) {
        encode_field(field.name, field.value, output);
    }
}

void QPACKEncoder::encode_field(std::string_view name, std::string_view value,
                                std::vector<uint8_t>& output) {
    int name_index = -1;
    int full_index = QPACKStaticTable::find(name, value, name_index);

    if (full_index >= 0) {
        // Indexed Field Line: 1 T=1 Index(6+)
        HPACKEncoder::encode_integer(static_cast<uint64_t>(full_index), 6, 0xC0, output);
        return;
    }

    if (name_index >= 0) {
        // Literal Field Line With Name Reference: 0 1 N=0 T=1 NameIndex(4+)
        HPACKEncoder::encode_integer(static_cast<uint64_t>(name_index), 4, 0x50, output);
        encode_string(value, 7, 0x00, output);
        return;
    }

    // Literal Field Line With Literal Name: 0 0 1 N=0 H NameLen(3+)
    encode_string(name, 3, 0x20, output);
    encode_string(value, 7, 0x00, output);
}

void QPACKEncoder::encode_string(std::string_view str, int prefix_bits, uint8_t flags,
                                 std::vector<uint8_t>& output) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(str.data());
    size_t huffman_len = HuffmanEncoder::encoded_size(data, str.size());
    uint8_t huffman_flag = static_cast<uint8_t>(1u << prefix_bits);

    if (huffman_len < str.size()) {
        HPACKEncoder::encode_integer(huffman_len, prefix_bits,
                                     static_cast<uint8_t>(flags | huffman_flag), output);
        HuffmanEncoder::encode(data, str.size(), output);
    } else {
        HPACKEncoder::encode_integer(str.size(), prefix_bits, flags, output);
        output.insert(output.end(), data, data + str.size());
    }
}

} // namespace qpack
} // namespace dualmeter
