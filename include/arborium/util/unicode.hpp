#ifndef ARBORIUM_UNICODE_HPP
#define ARBORIUM_UNICODE_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "ulight/impl/unicode.hpp"
#include "ulight/impl/unicode_algorithm.hpp"

#include "arborium/fwd.hpp"

namespace arborium {
namespace utf8 {

using ulight::utf8::Code_Point_And_Length;
using ulight::utf8::Code_Point_View;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::is_valid;

} // namespace utf8

namespace utf16 {

/// @brief Returns the amount of UTF-16 code units that `code_point` occupies when encoded.
[[nodiscard]]
constexpr std::size_t code_unit_count(char32_t code_point) noexcept
{
    return code_point >= 0x10000 ? 2 : 1;
}

/// @brief Returns the length of `str`, in UTF-16 code units, when transcoded.
/// Any illegal UTF-8 code units are treated as a U+FFFD REPLACEMENT CHARACTER,
/// which occupies one UTF-16 code unit.
[[nodiscard]]
constexpr std::size_t count_code_units_or_replacement(std::u8string_view str) noexcept
{
    std::size_t result = 0;
    while (!str.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(str);
        str.remove_prefix(std::size_t(length));
        result += code_unit_count(code_point);
    }
    return result;
}

} // namespace utf16

/// @brief A lookup table which translates UTF-16 code unit offsets into a UTF-8 string
/// into byte offsets in that same string.
///
/// Plugins address source text in UTF-16 code units,
/// whereas the host stores source text as UTF-8.
/// Offsets which fall between the two halves of a surrogate pair have no UTF-8 equivalent;
/// for these, `to_utf8` returns `npos`.
struct Utf16_Index {
    static constexpr std::size_t npos = std::size_t(-1);

private:
    std::pmr::vector<std::size_t> m_offsets;

public:
    [[nodiscard]]
    explicit Utf16_Index(std::u8string_view source, std::pmr::memory_resource* memory);

    /// @brief Returns the length of the indexed string in UTF-16 code units.
    [[nodiscard]]
    std::size_t utf16_length() const noexcept
    {
        return m_offsets.size() - 1;
    }

    /// @brief Returns the UTF-8 byte offset that corresponds to `utf16_offset`,
    /// or `npos` if there is no such offset.
    /// The offset `utf16_length()` maps to the length of the source in bytes.
    [[nodiscard]]
    std::size_t to_utf8(std::size_t utf16_offset) const noexcept
    {
        return utf16_offset < m_offsets.size() ? m_offsets[utf16_offset] : npos;
    }
};

} // namespace arborium

#endif
