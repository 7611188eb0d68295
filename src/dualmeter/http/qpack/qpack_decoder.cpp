#include "qpack_decoder.h"
#include "../hpack.h"
#include "../huffman.h"

namespace dualmeter {
namespace qpack {

using http::HPACKDecoder;
using http::HuffmanDecoder;

int QPACKDecoder::decode_string(const uint8_t* input, size_t len, int prefix_bits,
                                std::string& out, size_t& out_consumed) {
    if (len == 0) return -1;

    bool huffman = (input[0] & (1u << prefix_bits)) != 0;
    uint64_t str_len = 0;
    size_t consumed = 0;
    if (HPACKDecoder::decode_integer(input, len, prefix_bits, str_len, consumed) != 0) {
        return -1;
    }
    if (str_len > len - consumed) return -1;

    const uint8_t* data = input + consumed;
    if (huffman) {
        if (HuffmanDecoder::decode(data, static_cast<size_t>(str_len), out) != 0) return -1;
    } else {
        out.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(str_len));
    }
    out_consumed = consumed + static_cast<size_t>(str_len);
    return 0;
}

core::result<void> QPACKDecoder::decode_field_section(const uint8_t* input, size_t input_len,
                                                      std::vector<HeaderField>& output) const {
    size_t pos = 0;
    size_t consumed = 0;

    // Encoded Field Section Prefix
    uint64_t required_insert_count = 0;
    if (HPACKDecoder::decode_integer(input, input_len, 8, required_insert_count, consumed) != 0) {
        return core::err(core::error_code::parse_error);
    }
    pos += consumed;
    if (required_insert_count != 0) {
        return core::err(core::error_code::parse_error);  // Dynamic table not in use
    }

    uint64_t delta_base = 0;
    if (HPACKDecoder::decode_integer(input + pos, input_len - pos, 7, delta_base, consumed) != 0) {
        return core::err(core::error_code::parse_error);
    }
    pos += consumed;

    size_t list_size = 0;
    size_t count = 0;
    while (pos < input_len) {
        if (++count > kMaxHeaders) {
            return core::err(core::error_code::parse_error);
        }

        uint8_t first = input[pos];
        HeaderField field;

        if ((first & 0x80) != 0) {
            // Indexed Field Line: 1 T Index(6+)
            if ((first & 0x40) == 0) return core::err(core::error_code::parse_error);
            uint64_t index = 0;
            if (HPACKDecoder::decode_integer(input + pos, input_len - pos, 6, index, consumed) != 0) {
                return core::err(core::error_code::parse_error);
            }
            const StaticEntry* entry = QPACKStaticTable::get(static_cast<size_t>(index));
            if (entry == nullptr) return core::err(core::error_code::parse_error);
            field.name.assign(entry->name);
            field.value.assign(entry->value);
            pos += consumed;
        } else if ((first & 0x40) != 0) {
            // Literal Field Line With Name Reference: 0 1 N T NameIndex(4+)
            if ((first & 0x10) == 0) return core::err(core::error_code::parse_error);
            uint64_t index = 0;
            if (HPACKDecoder::decode_integer(input + pos, input_len - pos, 4, index, consumed) != 0) {
                return core::err(core::error_code::parse_error);
            }
            const StaticEntry* entry = QPACKStaticTable::get(static_cast<size_t>(index));
            if (entry == nullptr) return core::err(core::error_code::parse_error);
            pos += consumed;
            field.name.assign(entry->name);
            if (decode_string(input + pos, input_len - pos, 7, field.value, consumed) != 0) {
                return core::err(core::error_code::parse_error);
            }
            pos += consumed;
        } else if ((first & 0x20) != 0) {
            // Literal Field Line With Literal Name: 0 0 1 N H NameLen(3+)
            if (decode_string(input + pos, input_len - pos, 3, field.name, consumed) != 0) {
                return core::err(core::error_code::parse_error);
            }
            pos += consumed;
            if (decode_string(input + pos, input_len - pos, 7, field.value, consumed) != 0) {
                return core::err(core::error_code::parse_error);
            }
            pos += consumed;
        } else {
            // Post-Base forms always reference the dynamic table
            return core::err(core::error_code::parse_error);
        }

        list_size += field.name.size() + field.value.size() + 32;
        if (list_size > max_field_section_size_) {
            return core::err(core::error_code::parse_error);
        }
        output.push_back(std::move(field));
    }

    return core::ok();
}

} // namespace qpack
} // namespace dualmeter
