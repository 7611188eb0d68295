#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dualmeter {
namespace qpack {

/**
 * Header field as carried in a QPACK field section.
 */
struct HeaderField {
    std::string name;
    std::string value;
};

/**
 * QPACK static table entry.
 */
struct StaticEntry {
    std::string_view name;
    std::string_view value;
};

/**
 * QPACK Static Table (RFC 9204 Appendix A).
 *
 * 99 predefined entries, indexed from 0.
 */
class QPACKStaticTable {
public:
    static constexpr size_t size() noexcept { return 99; }

    /**
     * @return Entry or nullptr if out of range
     */
    static const StaticEntry* get(size_t index) noexcept;

    /**
     * Find entry by name and value.
     *
     * @param out_name_index First name-only match, -1 if none
     * @return Index of the full match, -1 otherwise
     */
    static int find(std::string_view name, std::string_view value, int& out_name_index) noexcept;
};

} // namespace qpack
} // namespace dualmeter
