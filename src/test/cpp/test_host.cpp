#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "arborium/util/strings.hpp"

#include "arborium/catalog.hpp"
#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/highlighter.hpp"
#include "arborium/host.hpp"

#include "collecting_logger.hpp"
#include "wat_plugin.hpp"

namespace arborium {
namespace {

/// @brief Writes grammar modules and a manifest into a temporary directory,
/// and highlights code through a fully assembled `Host`.
struct Host_Test : testing::Test {
    std::filesystem::path directory = std::filesystem::temp_directory_path() / "arborium-host-test";
    Collecting_Logger logger;
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };

    void SetUp() override
    {
        std::filesystem::create_directories(directory);
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(directory, error);
    }

    void write_file(const std::filesystem::path& name, std::string_view contents)
    {
        std::ofstream file { directory / name, std::ios::binary };
        file.write(contents.data(), std::streamsize(contents.size()));
    }

    void write_module(const std::filesystem::path& name, const Wat_Plugin& plugin)
    {
        const std::vector<unsigned char> bytes = plugin.to_wasm();
        write_file(
            name, std::string_view { reinterpret_cast<const char*>(bytes.data()), bytes.size() }
        );
    }

    [[nodiscard]]
    Host_Options options() const
    {
        return {
            .plugins_directory = directory,
            .manifest_path = directory / "manifest.json",
            .call_timeout = std::chrono::milliseconds { 500 },
            .epoch_interval = std::chrono::milliseconds { 5 },
        };
    }

    [[nodiscard]]
    std::u8string_view out_string() const
    {
        return as_u8string_view(out);
    }
};

TEST_F(Host_Test, highlight_with_modules)
{
    write_module(
        "lang-rust.wasm",
        { .captures = { { 0, 3, "keyword" }, { 4, 5, "variable" }, { 8, 10, "number" } } }
    );
    write_module("loop.wasm", { .highlight_prelude = "(loop $forever (br $forever))" });
    write_file("manifest.json", R"({
        "interface_version": "0.2.3",
        "plugins": [
            { "language": "rust", "module": "lang-rust.wasm", "aliases": ["rs"] },
            { "language": "loop", "module": "loop.wasm" }
        ]
    })");

    Result<std::unique_ptr<Host>, Manifest_Error> host = make_host(options(), logger);
    ASSERT_TRUE(host);
    Highlighter& highlighter = (*host)->get_highlighter();

    ASSERT_TRUE(highlighter.highlight(out, u8"rs", u8"let x = 42;"));
    EXPECT_EQ(u8"<a-k>let</a-k> <a-v>x</a-v> = <a-n>42</a-n>;", out_string());

    out.clear();
    const Result<void, Host_Error> timed_out = highlighter.highlight(out, u8"loop", u8"x");
    ASSERT_FALSE(timed_out);
    EXPECT_EQ(Host_Error::execution_trap, timed_out.error());
    EXPECT_TRUE(logger.was_logged(diagnostic::execute_timeout));

    // Other plugins are unaffected by the timeout.
    ASSERT_TRUE(highlighter.highlight(out, u8"rust", u8"let x = 42;"));
    EXPECT_EQ(1, (*host)->get_registry().size());
}

TEST_F(Host_Test, missing_module)
{
    write_file(
        "manifest.json", R"({ "plugins": [ { "language": "go", "module": "missing.wasm" } ] })"
    );
    Result<std::unique_ptr<Host>, Manifest_Error> host = make_host(options(), logger);
    ASSERT_TRUE(host);

    const Result<void, Host_Error> result
        = (*host)->get_highlighter().highlight_or_escape(out, u8"go", u8"a&b");
    ASSERT_FALSE(result);
    EXPECT_EQ(Host_Error::fetch_failure, result.error());
    EXPECT_EQ(u8"a&amp;b", out_string());
    EXPECT_TRUE(logger.was_logged(diagnostic::fetch_failed));
}

TEST_F(Host_Test, invalid_manifest)
{
    write_file("manifest.json", "{ plugins }");
    const Result<std::unique_ptr<Host>, Manifest_Error> host = make_host(options(), logger);
    ASSERT_FALSE(host);
    EXPECT_EQ(Manifest_Error::syntax, host.error());
}

TEST_F(Host_Test, without_manifest)
{
    Host_Options host_options = options();
    host_options.manifest_path.clear();

    Result<std::unique_ptr<Host>, Manifest_Error> host = make_host(host_options, logger);
    ASSERT_TRUE(host);
    EXPECT_TRUE((*host)->get_catalog().empty());

    write_module("css.wasm", { .captures = { { 0, 1, "tag" } } });
    ASSERT_TRUE((*host)->get_catalog().add({ .language = u8"css", .module_path = u8"css.wasm" }));
    ASSERT_TRUE((*host)->get_highlighter().highlight(out, u8"css", u8"a{}"));
    EXPECT_EQ(u8"<a-tg>a</a-tg>{}", out_string());
}

} // namespace
} // namespace arborium
