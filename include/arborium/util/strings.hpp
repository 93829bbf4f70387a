#ifndef ARBORIUM_STRINGS_HPP
#define ARBORIUM_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string_view>

#include "ulight/impl/ascii_chars.hpp"

namespace arborium {

using ulight::is_ascii_alpha;
using ulight::is_ascii_digit;
using ulight::to_ascii_lower;

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::string_view as_string_view(std::span<const char> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Returns `true` if `x` and `y` are equal when ASCII letters are compared
/// case-insensitively.
/// Non-ASCII code units are compared exactly.
[[nodiscard]]
constexpr bool equals_ascii_ignore_case(std::u8string_view x, std::u8string_view y) noexcept
{
    if (x.length() != y.length()) {
        return false;
    }
    for (std::size_t i = 0; i < x.length(); ++i) {
        if (to_ascii_lower(x[i]) != to_ascii_lower(y[i])) {
            return false;
        }
    }
    return true;
}

/// @brief Returns `true` if `str` is a valid HTML tag identifier
/// consisting only of ASCII characters.
/// This covers builtin tag names as well as custom element names such as `a-k`.
[[nodiscard]]
constexpr bool is_ascii_html_tag_name(std::u8string_view str) noexcept
{
    if (str.empty() || !is_ascii_alpha(str[0])) {
        return false;
    }
    for (const char8_t c : str) {
        if (!is_ascii_alpha(c) && !is_ascii_digit(c) && c != u8'-') {
            return false;
        }
    }
    return true;
}

} // namespace arborium

#endif
