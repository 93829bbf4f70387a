#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "arborium/util/html_writer.hpp"
#include "arborium/util/strings.hpp"

using namespace std::string_view_literals;

namespace arborium {
namespace {

struct HTML_Writer_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };
    HTML_Writer writer { Vector_Consumer { &out } };
};

TEST_F(HTML_Writer_Test, empty)
{
    constexpr std::u8string_view expected;
    EXPECT_EQ(expected, as_u8string_view(out));
    EXPECT_TRUE(writer.is_done());
}

TEST_F(HTML_Writer_Test, inner_html)
{
    constexpr std::u8string_view expected = u8"<a-k>fn</a-k>"sv;

    writer.write_inner_html(u8"<a-k>fn</a-k>"sv);

    EXPECT_EQ(expected, as_u8string_view(out));
}

TEST_F(HTML_Writer_Test, inner_text)
{
    constexpr std::u8string_view expected = u8"&lt;T&gt; &amp;&amp; &quot;s&quot; 'c'"sv;

    writer.write_inner_text(u8"<T> && \"s\" 'c'"sv);

    EXPECT_EQ(expected, as_u8string_view(out));
}

TEST_F(HTML_Writer_Test, tag)
{
    constexpr std::u8string_view expected = u8"<a-tg>div</a-tg>"sv;

    writer.open_tag(u8"a-tg"sv);
    EXPECT_FALSE(writer.is_done());
    writer.write_inner_text(u8"div"sv);
    writer.close_tag(u8"a-tg"sv);

    EXPECT_EQ(expected, as_u8string_view(out));
    EXPECT_TRUE(writer.is_done());
}

} // namespace
} // namespace arborium
