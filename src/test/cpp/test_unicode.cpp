#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "arborium/util/unicode.hpp"

namespace arborium {
namespace {

TEST(Unicode, utf16_code_unit_count)
{
    EXPECT_EQ(0, utf16::count_code_units_or_replacement(u8""));
    EXPECT_EQ(3, utf16::count_code_units_or_replacement(u8"abc"));
    EXPECT_EQ(2, utf16::count_code_units_or_replacement(u8"é日"));
    EXPECT_EQ(2, utf16::count_code_units_or_replacement(u8"\U0001F600"));
}

TEST(Utf16_Index, ascii)
{
    std::pmr::monotonic_buffer_resource memory;
    const Utf16_Index index { u8"abc", &memory };

    EXPECT_EQ(3, index.utf16_length());
    for (std::size_t i = 0; i <= 3; ++i) {
        EXPECT_EQ(i, index.to_utf8(i));
    }
    EXPECT_EQ(Utf16_Index::npos, index.to_utf8(4));
}

TEST(Utf16_Index, empty)
{
    std::pmr::monotonic_buffer_resource memory;
    const Utf16_Index index { u8"", &memory };

    EXPECT_EQ(0, index.utf16_length());
    EXPECT_EQ(0, index.to_utf8(0));
    EXPECT_EQ(Utf16_Index::npos, index.to_utf8(1));
}

TEST(Utf16_Index, multibyte)
{
    std::pmr::monotonic_buffer_resource memory;
    // U+00E9 takes two bytes, U+65E5 three, and U+1F600 four and a surrogate pair.
    const Utf16_Index index { u8"é日\U0001F600x", &memory };

    EXPECT_EQ(5, index.utf16_length());
    EXPECT_EQ(0, index.to_utf8(0));
    EXPECT_EQ(2, index.to_utf8(1));
    EXPECT_EQ(5, index.to_utf8(2));
    EXPECT_EQ(Utf16_Index::npos, index.to_utf8(3));
    EXPECT_EQ(9, index.to_utf8(4));
    EXPECT_EQ(10, index.to_utf8(5));
}

TEST(Utf16_Index, invalid_utf8_is_replacement)
{
    std::pmr::monotonic_buffer_resource memory;
    constexpr char8_t source[] { u8'a', char8_t(0xff), u8'b' };
    const Utf16_Index index { std::u8string_view { source, std::size(source) }, &memory };

    EXPECT_EQ(3, index.utf16_length());
    EXPECT_EQ(1, index.to_utf8(1));
    EXPECT_EQ(2, index.to_utf8(2));
}

} // namespace
} // namespace arborium
