#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace dualmeter {
namespace http {

/**
 * HPACK header compression for HTTP/2 (RFC 7541).
 *
 * Decoder: full dynamic table, Huffman strings, table size updates.
 * Encoder: static/dynamic table matches, incremental indexing, Huffman
 * when it is shorter than the raw string.
 */

/**
 * Decoded or to-be-encoded header field.
 */
struct HPACKHeader {
    std::string name;
    std::string value;
    bool sensitive{false};  // Never-indexed on the wire
};

/**
 * HPACK static table (RFC 7541 Appendix A). Indices are 1-based.
 */
class HPACKStaticTable {
public:
    static constexpr size_t SIZE = 61;

    /**
     * @return true if index is within 1..61
     */
    static bool get(size_t index, std::string_view& name, std::string_view& value) noexcept;

    /**
     * Find a full (name, value) match.
     *
     * @param name_index Set to the first name-only match, 0 if none
     * @return Index of the full match, 0 if none
     */
    static size_t find(std::string_view name, std::string_view value, size_t& name_index) noexcept;
};

/**
 * HPACK dynamic table.
 *
 * Newest entry is index 0. Entry size is name + value + 32 octets.
 */
class HPACKDynamicTable {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 4096;

    explicit HPACKDynamicTable(size_t max_size = DEFAULT_MAX_SIZE);

    /**
     * Insert at the front, evicting from the back. An entry larger than
     * the table empties it and is not stored.
     */
    void add(std::string_view name, std::string_view value);

    /**
     * @param index 0-based, newest first
     */
    bool get(size_t index, std::string_view& name, std::string_view& value) const noexcept;

    /**
     * @param name_index Set to the first name-only match, -1 if none
     * @return Index of the full match, -1 if none
     */
    int find(std::string_view name, std::string_view value, int& name_index) const noexcept;

    size_t size() const noexcept { return current_size_; }
    size_t max_size() const noexcept { return max_size_; }
    size_t count() const noexcept { return entries_.size(); }

    void set_max_size(size_t new_max) noexcept;

private:
    struct Entry {
        std::string name;
        std::string value;
        size_t size() const noexcept { return name.size() + value.size() + 32; }
    };

    void evict_to_fit(size_t incoming) noexcept;

    std::deque<Entry> entries_;
    size_t current_size_{0};
    size_t max_size_;
};

/**
 * HPACK decoder (one per connection direction).
 */
class HPACKDecoder {
public:
    explicit HPACKDecoder(size_t max_table_size = HPACKDynamicTable::DEFAULT_MAX_SIZE);

    /**
     * Decode a complete header block.
     *
     * @param output Decoded fields are appended
     * @param max_list_size Limit on sum(name + value + 32)
     * @return 0 on success, -1 on a compression error (connection error)
     */
    int decode(
        const uint8_t* input,
        size_t input_len,
        std::vector<HPACKHeader>& output,
        size_t max_list_size = 65536
    );

    size_t table_size() const noexcept { return table_.size(); }

    /**
     * Decode an N-bit prefix integer (RFC 7541 Section 5.1).
     *
     * @return 0 on success, -1 on truncation or overflow
     */
    static int decode_integer(
        const uint8_t* input,
        size_t len,
        int prefix_bits,
        uint64_t& out_value,
        size_t& out_consumed
    ) noexcept;

    /**
     * Decode a string literal (RFC 7541 Section 5.2).
     *
     * @return 0 on success, -1 on malformed input
     */
    static int decode_string(
        const uint8_t* input,
        size_t len,
        std::string& out_string,
        size_t& out_consumed
    );

private:
    int lookup(uint64_t index, std::string_view& name, std::string_view& value) const noexcept;

    HPACKDynamicTable table_;
    size_t settings_max_size_;
};

/**
 * HPACK encoder (one per connection direction).
 */
class HPACKEncoder {
public:
    explicit HPACKEncoder(size_t max_table_size = HPACKDynamicTable::DEFAULT_MAX_SIZE);

    /**
     * Append the encoding of headers to output.
     */
    void encode(const std::vector<HPACKHeader>& headers, std::vector<uint8_t>& output);

    /**
     * Peer changed SETTINGS_HEADER_TABLE_SIZE; the next block starts with
     * a dynamic table size update.
     */
    void set_max_table_size(size_t size);

    static void encode_integer(
        uint64_t value,
        int prefix_bits,
        uint8_t first_byte_flags,
        std::vector<uint8_t>& output
    );

    static void encode_string(std::string_view str, std::vector<uint8_t>& output);

private:
    HPACKDynamicTable table_;
    bool pending_size_update_{false};
};

} // namespace http
} // namespace dualmeter
