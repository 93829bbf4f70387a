#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "arborium/util/strings.hpp"

#include "arborium/catalog.hpp"
#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/highlighter.hpp"
#include "arborium/invoker.hpp"
#include "arborium/registry.hpp"
#include "arborium/render.hpp"

#include "collecting_logger.hpp"
#include "fake_plugins.hpp"

namespace arborium {
namespace {

struct Highlighter_Test : testing::Test {
    Static_Catalog catalog;
    Counting_Fetcher fetcher;
    Fake_Plugin_Factory factory;
    Collecting_Logger logger;
    Plugin_Registry registry { catalog, fetcher, factory, logger };
    Highlight_Invoker invoker { registry, logger };
    Highlighter highlighter { invoker, logger };

    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };

    void SetUp() override
    {
        constexpr std::u8string_view languages[] { u8"html", u8"css", u8"javascript", u8"broken" };
        for (const std::u8string_view language : languages) {
            std::u8string module_path { language };
            module_path += u8".wasm";
            ASSERT_TRUE(catalog.add(
                { .language = std::u8string { language }, .module_path = std::move(module_path) }
            ));
        }
        factory.set_behavior(u8"broken", { .failure = Host_Error::execution_trap });
    }

    [[nodiscard]]
    std::u8string_view out_string() const
    {
        return as_u8string_view(out);
    }
};

// <style>a{}</style>
constexpr std::u8string_view html_source = u8"<style>a{}</style>";

const Fake_Behavior css_behavior {
    .captures = { { 0, 1, u8"type" }, { 1, 2, u8"punctuation" }, { 2, 3, u8"punctuation" } },
};

TEST_F(Highlighter_Test, highlight)
{
    factory.set_behavior(u8"javascript", { .captures = { { 0, 5, u8"keyword" } } });

    ASSERT_TRUE(highlighter.highlight(out, u8"js", u8"const a = \"<\";"));
    EXPECT_EQ(u8"<a-k>const</a-k> a = &quot;&lt;&quot;;", out_string());
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Highlighter_Test, unknown_language)
{
    const Result<void, Host_Error> result = highlighter.highlight(out, u8"cobol", u8"x");
    ASSERT_FALSE(result);
    EXPECT_EQ(Host_Error::unknown_language, result.error());
    EXPECT_TRUE(out.empty());
}

TEST_F(Highlighter_Test, highlight_or_escape)
{
    const Result<void, Host_Error> result
        = highlighter.highlight_or_escape(out, u8"cobol", u8"a < b");
    ASSERT_FALSE(result);
    EXPECT_EQ(Host_Error::unknown_language, result.error());
    EXPECT_EQ(u8"a &lt; b", out_string());
}

TEST_F(Highlighter_Test, plugin_failure)
{
    factory.set_behavior(u8"css", { .failure = Host_Error::plugin_failure });

    const Result<void, Host_Error> result = highlighter.highlight(out, u8"css", u8"a{");
    ASSERT_FALSE(result);
    EXPECT_EQ(Host_Error::plugin_failure, result.error());
    EXPECT_TRUE(out.empty());
    // The instance survives a reported error.
    EXPECT_TRUE(registry.contains(u8"css"));
}

TEST_F(Highlighter_Test, injection)
{
    factory.set_behavior(
        u8"html",
        { .captures = { { 1, 6, u8"tag" }, { 12, 17, u8"tag" } },
          .injections = { { 7, 10, u8"css" } } }
    );
    factory.set_behavior(u8"css", css_behavior);

    ASSERT_TRUE(highlighter.highlight(out, u8"html", html_source));
    EXPECT_EQ(
        u8"&lt;<a-tg>style</a-tg>&gt;<a-t>a</a-t><a-p>{</a-p><a-p>}</a-p>"
        u8"&lt;/<a-tg>style</a-tg>&gt;",
        out_string()
    );
}

TEST_F(Highlighter_Test, outer_language_takes_precedence)
{
    factory.set_behavior(
        u8"html", { .captures = { { 7, 10, u8"string" } }, .injections = { { 7, 10, u8"css" } } }
    );
    factory.set_behavior(u8"css", css_behavior);

    ASSERT_TRUE(highlighter.highlight(out, u8"html", html_source));
    EXPECT_EQ(u8"&lt;style&gt;<a-s>a{}</a-s>&lt;/style&gt;", out_string());
}

TEST_F(Highlighter_Test, failed_injection_is_skipped)
{
    factory.set_behavior(
        u8"html",
        { .captures = { { 1, 6, u8"tag" } },
          .injections = { { 7, 10, u8"broken" }, { 7, 10, u8"cobol" } } }
    );

    ASSERT_TRUE(highlighter.highlight(out, u8"html", html_source));
    EXPECT_EQ(u8"&lt;<a-tg>style</a-tg>&gt;a{}&lt;/style&gt;", out_string());
    EXPECT_EQ(2, logger.count(diagnostic::injection_failed));
}

TEST_F(Highlighter_Test, injection_depth_is_limited)
{
    // Every level injects the language into itself again.
    factory.set_behavior(
        u8"javascript",
        { .captures = { { 0, 1, u8"keyword" } }, .injections = { { 0, 2, u8"javascript" } } }
    );

    ASSERT_TRUE(highlighter.highlight(out, u8"javascript", u8"ab"));
    EXPECT_EQ(u8"<a-k>a</a-k>b", out_string());
    // The outermost call and one per level of injection.
    EXPECT_EQ(4, factory.total_calls());
}

TEST_F(Highlighter_Test, injections_disabled)
{
    Highlighter flat { invoker, logger, 0 };
    factory.set_behavior(
        u8"html", { .captures = { { 1, 6, u8"tag" } }, .injections = { { 7, 10, u8"css" } } }
    );
    factory.set_behavior(u8"css", css_behavior);

    ASSERT_TRUE(flat.highlight(out, u8"html", html_source));
    EXPECT_EQ(u8"&lt;<a-tg>style</a-tg>&gt;a{}&lt;/style&gt;", out_string());
    EXPECT_FALSE(registry.contains(u8"css"));
}

TEST_F(Highlighter_Test, trap_is_isolated)
{
    factory.set_behavior(u8"css", css_behavior);
    ASSERT_TRUE(highlighter.preload(u8"css"));

    const Result<void, Host_Error> trapped = highlighter.highlight(out, u8"broken", u8"x");
    ASSERT_FALSE(trapped);
    EXPECT_EQ(Host_Error::execution_trap, trapped.error());
    EXPECT_FALSE(registry.contains(u8"broken"));
    EXPECT_TRUE(registry.contains(u8"css"));

    ASSERT_TRUE(highlighter.highlight(out, u8"css", u8"a{}"));
    EXPECT_EQ(u8"<a-t>a</a-t><a-p>{</a-p><a-p>}</a-p>", out_string());

    // The trapped module is instantiated again on the next use.
    const std::size_t instantiations = factory.instantiations;
    EXPECT_FALSE(highlighter.highlight(out, u8"broken", u8"x"));
    EXPECT_EQ(instantiations + 1, factory.instantiations);
}

TEST_F(Highlighter_Test, oversized_input_keeps_instance)
{
    factory.set_behavior(u8"css", { .failure = Host_Error::input_too_large });
    ASSERT_TRUE(highlighter.preload(u8"css"));
    const std::size_t instantiations = factory.instantiations;

    const Result<void, Host_Error> result = highlighter.highlight(out, u8"css", u8"a{}");
    ASSERT_FALSE(result);
    EXPECT_EQ(Host_Error::input_too_large, result.error());
    EXPECT_TRUE(registry.contains(u8"css"));

    EXPECT_FALSE(highlighter.highlight(out, u8"css", u8"a{}"));
    EXPECT_EQ(instantiations, factory.instantiations);
}

TEST_F(Highlighter_Test, malformed_captures_are_dropped)
{
    factory.set_behavior(
        u8"css",
        { .captures = { { 0, 1, u8"type" }, { 2, 1, u8"keyword" }, { 0, 99, u8"keyword" } },
          .malformed_records = 1 }
    );

    ASSERT_TRUE(highlighter.highlight(out, u8"css", u8"a{}"));
    EXPECT_EQ(u8"<a-t>a</a-t>{}", out_string());
    EXPECT_EQ(1, logger.count(diagnostic::output_malformed));
    const std::u8string message = logger.first_message(diagnostic::output_malformed);
    EXPECT_NE(std::u8string::npos, message.find(u8"Dropped 3 of 4"));
}

TEST_F(Highlighter_Test, empty_source)
{
    factory.set_behavior(u8"css", css_behavior);
    ASSERT_TRUE(highlighter.highlight(out, u8"css", u8""));
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(logger.was_logged(diagnostic::output_malformed));
}

TEST_F(Highlighter_Test, preload)
{
    EXPECT_TRUE(highlighter.preload(u8"html"));
    EXPECT_TRUE(registry.contains(u8"html"));
    EXPECT_EQ(0, factory.total_calls());

    const Result<void, Host_Error> unknown = highlighter.preload(u8"cobol");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(Host_Error::unknown_language, unknown.error());
}

TEST_F(Highlighter_Test, collect_spans)
{
    factory.set_behavior(
        u8"html", { .captures = { { 1, 6, u8"tag" } }, .injections = { { 7, 10, u8"css" } } }
    );
    factory.set_behavior(u8"css", css_behavior);

    std::pmr::vector<Span> spans { &memory };
    ASSERT_TRUE(highlighter.collect_spans(spans, u8"html", html_source, &memory));

    const Span expected[] {
        { .begin = 1, .end = 6, .tag = u8"tg" },
        { .begin = 7, .end = 8, .tag = u8"t" },
        { .begin = 8, .end = 9, .tag = u8"p" },
        { .begin = 9, .end = 10, .tag = u8"p" },
    };
    ASSERT_EQ(std::size(expected), spans.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
        EXPECT_EQ(expected[i], spans[i]);
    }
}

} // namespace
} // namespace arborium
