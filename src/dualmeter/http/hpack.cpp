#include "hpack.h"
#include "huffman.h"

#include <algorithm>
#include <cstring>

namespace dualmeter {
namespace http {

// HPACK Static Table (RFC 7541 Appendix A)
static const struct {
    const char* name;
    const char* value;
} STATIC_TABLE[] = {
    {":authority", ""},
    {":method", "GET"},
    {":method", "POST"},
    {":path", "/"},
    {":path", "/index.html"},
    {":scheme", "http"},
    {":scheme", "https"},
    {":status", "200"},
    {":status", "204"},
    {":status", "206"},
    {":status", "304"},
    {":status", "400"},
    {":status", "404"},
    {":status", "500"},
    {"accept-charset", ""},
    {"accept-encoding", "gzip, deflate"},
    {"accept-language", ""},
    {"accept-ranges", ""},
    {"accept", ""},
    {"access-control-allow-origin", ""},
    {"age", ""},
    {"allow", ""},
    {"authorization", ""},
    {"cache-control", ""},
    {"content-disposition", ""},
    {"content-encoding", ""},
    {"content-language", ""},
    {"content-length", ""},
    {"content-location", ""},
    {"content-range", ""},
    {"content-type", ""},
    {"cookie", ""},
    {"date", ""},
    {"etag", ""},
    {"expect", ""},
    {"expires", ""},
    {"from", ""},
    {"host", ""},
    {"if-match", ""},
    {"if-modified-since", ""},
    {"if-none-match", ""},
    {"if-range", ""},
    {"if-unmodified-since", ""},
    {"last-modified", ""},
    {"link", ""},
    {"location", ""},
    {"max-forwards", ""},
    {"proxy-authenticate", ""},
    {"proxy-authorization", ""},
    {"range", ""},
    {"referer", ""},
    {"refresh", ""},
    {"retry-after", ""},
    {"server", ""},
    {"set-cookie", ""},
    {"strict-transport-security", ""},
    {"transfer-encoding", ""},
    {"user-agent", ""},
    {"vary", ""},
    {"via", ""},
    {"www-authenticate", ""},
};

static_assert(sizeof(STATIC_TABLE) / sizeof(STATIC_TABLE[0]) == HPACKStaticTable::SIZE,
              "HPACK static table must have 61 entries");

// ============================================================================
// Static table
// ============================================================================

bool HPACKStaticTable::get(size_t index, std::string_view& name, std::string_view& value) noexcept {
    if (index == 0 || index > SIZE) {
        return false;
    }
    name = STATIC_TABLE[index - 1].name;
    value = STATIC_TABLE[index - 1].value;
    return true;
}

size_t HPACKStaticTable::find(std::string_view name, std::string_view value,
                              size_t& name_index) noexcept {
    name_index = 0;
    for (size_t i = 0; i < SIZE; ++i) {
        if (name != STATIC_TABLE[i].name) {
            continue;
        }
        if (name_index == 0) {
            name_index = i + 1;
        }
        if (value == STATIC_TABLE[i].value) {
            return i + 1;
        }
    }
    return 0;
}

// ============================================================================
// Dynamic table
// ============================================================================

HPACKDynamicTable::HPACKDynamicTable(size_t max_size)
    : max_size_(max_size) {
}

void HPACKDynamicTable::add(std::string_view name, std::string_view value) {
    size_t entry_size = name.size() + value.size() + 32;
    if (entry_size > max_size_) {
        entries_.clear();
        current_size_ = 0;
        return;
    }

    evict_to_fit(entry_size);
    entries_.push_front(Entry{std::string(name), std::string(value)});
    current_size_ += entry_size;
}

bool HPACKDynamicTable::get(size_t index, std::string_view& name,
                            std::string_view& value) const noexcept {
    if (index >= entries_.size()) {
        return false;
    }
    name = entries_[index].name;
    value = entries_[index].value;
    return true;
}

int HPACKDynamicTable::find(std::string_view name, std::string_view value,
                            int& name_index) const noexcept {
    name_index = -1;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name != name) {
            continue;
        }
        if (name_index < 0) {
            name_index = static_cast<int>(i);
        }
        if (entries_[i].value == value) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void HPACKDynamicTable::set_max_size(size_t new_max) noexcept {
    max_size_ = new_max;
    evict_to_fit(0);
}

void HPACKDynamicTable::evict_to_fit(size_t incoming) noexcept {
    while (!entries_.empty() && current_size_ + incoming > max_size_) {
        current_size_ -= entries_.back().size();
        entries_.pop_back();
    }
}

// ============================================================================
// Decoder
// ============================================================================

HPACKDecoder::HPACKDecoder(size_t max_table_size)
    : table_(max_table_size)
    , settings_max_size_(max_table_size) {
}

int HPACKDecoder::decode_integer(
    const uint8_t* input,
    size_t len,
    int prefix_bits,
    uint64_t& out_value,
    size_t& out_consumed
) noexcept {
    if (len == 0) {
        return -1;
    }

    const uint64_t prefix_max = (1u << prefix_bits) - 1;
    uint64_t value = input[0] & prefix_max;
    size_t pos = 1;

    if (value == prefix_max) {
        int shift = 0;
        while (true) {
            if (pos >= len || shift > 56) {
                return -1;
            }
            uint8_t byte = input[pos++];
            value += static_cast<uint64_t>(byte & 0x7F) << shift;
            shift += 7;
            if ((byte & 0x80) == 0) {
                break;
            }
        }
    }

    out_value = value;
    out_consumed = pos;
    return 0;
}

int HPACKDecoder::decode_string(
    const uint8_t* input,
    size_t len,
    std::string& out_string,
    size_t& out_consumed
) {
    if (len == 0) {
        return -1;
    }

    bool huffman = (input[0] & 0x80) != 0;
    uint64_t str_len = 0;
    size_t consumed = 0;
    if (decode_integer(input, len, 7, str_len, consumed) != 0) {
        return -1;
    }
    if (str_len > len - consumed) {
        return -1;
    }

    out_string.clear();
    const uint8_t* data = input + consumed;
    if (huffman) {
        if (HuffmanDecoder::decode(data, static_cast<size_t>(str_len), out_string) != 0) {
            return -1;
        }
    } else {
        out_string.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(str_len));
    }

    out_consumed = consumed + static_cast<size_t>(str_len);
    return 0;
}

int HPACKDecoder::lookup(uint64_t index, std::string_view& name,
                         std::string_view& value) const noexcept {
    if (index == 0) {
        return -1;
    }
    if (index <= HPACKStaticTable::SIZE) {
        return HPACKStaticTable::get(static_cast<size_t>(index), name, value) ? 0 : -1;
    }
    size_t dynamic_index = static_cast<size_t>(index - HPACKStaticTable::SIZE - 1);
    return table_.get(dynamic_index, name, value) ? 0 : -1;
}

int HPACKDecoder::decode(
    const uint8_t* input,
    size_t input_len,
    std::vector<HPACKHeader>& output,
    size_t max_list_size
) {
    size_t pos = 0;
    size_t list_size = 0;
    bool fields_seen = false;

    while (pos < input_len) {
        const uint8_t first = input[pos];
        uint64_t index = 0;
        size_t consumed = 0;

        if (first & 0x80) {
            // Indexed header field (Section 6.1)
            if (decode_integer(input + pos, input_len - pos, 7, index, consumed) != 0) {
                return -1;
            }
            pos += consumed;

            std::string_view name, value;
            if (lookup(index, name, value) != 0) {
                return -1;
            }
            output.push_back(HPACKHeader{std::string(name), std::string(value), false});
            list_size += name.size() + value.size() + 32;
            fields_seen = true;
        } else if ((first & 0xE0) == 0x20) {
            // Dynamic table size update (Section 6.3), only before any field
            if (fields_seen) {
                return -1;
            }
            uint64_t new_size = 0;
            if (decode_integer(input + pos, input_len - pos, 5, new_size, consumed) != 0) {
                return -1;
            }
            if (new_size > settings_max_size_) {
                return -1;
            }
            pos += consumed;
            table_.set_max_size(static_cast<size_t>(new_size));
        } else {
            // Literal (Section 6.2): 01 incremental, 0000 without, 0001 never
            bool incremental = (first & 0xC0) == 0x40;
            bool never_indexed = (first & 0xF0) == 0x10;
            int prefix = incremental ? 6 : 4;

            if (decode_integer(input + pos, input_len - pos, prefix, index, consumed) != 0) {
                return -1;
            }
            pos += consumed;

            HPACKHeader header;
            header.sensitive = never_indexed;

            if (index == 0) {
                if (decode_string(input + pos, input_len - pos, header.name, consumed) != 0) {
                    return -1;
                }
                pos += consumed;
            } else {
                std::string_view name, unused;
                if (lookup(index, name, unused) != 0) {
                    return -1;
                }
                header.name.assign(name.data(), name.size());
            }

            if (decode_string(input + pos, input_len - pos, header.value, consumed) != 0) {
                return -1;
            }
            pos += consumed;

            if (incremental) {
                table_.add(header.name, header.value);
            }

            list_size += header.name.size() + header.value.size() + 32;
            output.push_back(std::move(header));
            fields_seen = true;
        }

        if (list_size > max_list_size) {
            return -1;
        }
    }

    return 0;
}

// ============================================================================
// Encoder
// ============================================================================

HPACKEncoder::HPACKEncoder(size_t max_table_size)
    : table_(max_table_size) {
}

void HPACKEncoder::set_max_table_size(size_t size) {
    size = std::min(size, HPACKDynamicTable::DEFAULT_MAX_SIZE);
    if (size != table_.max_size()) {
        table_.set_max_size(size);
        pending_size_update_ = true;
    }
}

void HPACKEncoder::encode_integer(
    uint64_t value,
    int prefix_bits,
    uint8_t first_byte_flags,
    std::vector<uint8_t>& output
) {
    const uint64_t prefix_max = (1u << prefix_bits) - 1;

    if (value < prefix_max) {
        output.push_back(static_cast<uint8_t>(first_byte_flags | value));
        return;
    }

    output.push_back(static_cast<uint8_t>(first_byte_flags | prefix_max));
    value -= prefix_max;
    while (value >= 128) {
        output.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    output.push_back(static_cast<uint8_t>(value));
}

void HPACKEncoder::encode_string(std::string_view str, std::vector<uint8_t>& output) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(str.data());
    size_t huffman_len = HuffmanEncoder::encoded_size(data, str.size());

    if (huffman_len < str.size()) {
        encode_integer(huffman_len, 7, 0x80, output);
        HuffmanEncoder::encode(data, str.size(), output);
    } else {
        encode_integer(str.size(), 7, 0x00, output);
        output.insert(output.end(), data, data + str.size());
    }
}

void HPACKEncoder::encode(const std::vector<HPACKHeader>& headers, std::vector<uint8_t>& output) {
    if (pending_size_update_) {
        encode_integer(table_.max_size(), 5, 0x20, output);
        pending_size_update_ = false;
    }

    for (const auto& header : headers) {
        size_t static_name = 0;
        size_t static_full = HPACKStaticTable::find(header.name, header.value, static_name);

        if (static_full != 0 && !header.sensitive) {
            encode_integer(static_full, 7, 0x80, output);
            continue;
        }

        int dynamic_name = -1;
        int dynamic_full = table_.find(header.name, header.value, dynamic_name);
        if (dynamic_full >= 0 && !header.sensitive) {
            encode_integer(HPACKStaticTable::SIZE + 1 + dynamic_full, 7, 0x80, output);
            continue;
        }

        uint64_t name_index = static_name;
        if (name_index == 0 && dynamic_name >= 0) {
            name_index = HPACKStaticTable::SIZE + 1 + dynamic_name;
        }

        // Per-response values would only churn the table
        bool index_it = !header.sensitive && header.name != "content-length";

        if (header.sensitive) {
            encode_integer(name_index, 4, 0x10, output);
        } else if (index_it) {
            encode_integer(name_index, 6, 0x40, output);
        } else {
            encode_integer(name_index, 4, 0x00, output);
        }

        if (name_index == 0) {
            encode_string(header.name, output);
        }
        encode_string(header.value, output);

        if (index_it) {
            table_.add(header.name, header.value);
        }
    }
}

} // namespace http
} // namespace dualmeter
