#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/catalog.hpp"
#include "arborium/diagnostic.hpp"
#include "arborium/fetch.hpp"
#include "arborium/services.hpp"

#include "collecting_logger.hpp"

namespace arborium {
namespace {

TEST(Static_Catalog, find)
{
    Static_Catalog catalog;
    constexpr std::u8string_view rust_aliases[] { u8"rs", u8"rust-lang" };
    ASSERT_TRUE(catalog.add(
        { .language = u8"rust", .module_path = u8"rust.wasm", .interface_version = u8"0.2.3" },
        rust_aliases
    ));
    ASSERT_TRUE(catalog.add({ .language = u8"python", .module_path = u8"python.wasm" }));

    const std::optional<Catalog_Entry> rust = catalog.find(u8"rust");
    ASSERT_TRUE(rust);
    EXPECT_EQ(u8"rust.wasm", rust->module_path);
    EXPECT_EQ(u8"0.2.3", rust->interface_version);

    EXPECT_EQ(rust, catalog.find(u8"rs"));
    EXPECT_EQ(rust, catalog.find(u8"RUST-Lang"));
    EXPECT_EQ(rust, catalog.find(u8"Rust"));
    EXPECT_FALSE(catalog.find(u8"ruby"));
    EXPECT_FALSE(catalog.find(u8""));

    EXPECT_EQ(2, catalog.size());
    EXPECT_EQ(2, catalog.get_languages().size());
    EXPECT_TRUE(catalog.contains(u8"python"));
}

TEST(Static_Catalog, builtin_aliases)
{
    Static_Catalog catalog;
    ASSERT_TRUE(catalog.add({ .language = u8"javascript", .module_path = u8"js.wasm" }));

    EXPECT_TRUE(catalog.find(u8"js"));
    EXPECT_TRUE(catalog.find(u8"JSX"));
    // The aliased language is not in the catalog.
    EXPECT_FALSE(catalog.find(u8"ts"));
}

TEST(Static_Catalog, explicit_alias_overrides_builtin)
{
    Static_Catalog catalog;
    constexpr std::u8string_view aliases[] { u8"ts" };
    ASSERT_TRUE(catalog.add({ .language = u8"typescript", .module_path = u8"ts.wasm" }));
    ASSERT_TRUE(catalog.add({ .language = u8"tsx", .module_path = u8"tsx.wasm" }, aliases));

    const std::optional<Catalog_Entry> entry = catalog.find(u8"ts");
    ASSERT_TRUE(entry);
    EXPECT_EQ(u8"tsx", entry->language);
}

TEST(Static_Catalog, duplicates_are_rejected)
{
    Static_Catalog catalog;
    constexpr std::u8string_view aliases[] { u8"rs" };
    constexpr std::u8string_view repeated[] { u8"x", u8"X" };
    ASSERT_TRUE(catalog.add({ .language = u8"rust", .module_path = u8"rust.wasm" }, aliases));

    EXPECT_FALSE(catalog.add({ .language = u8"RUST", .module_path = u8"other.wasm" }));
    EXPECT_FALSE(catalog.add({ .language = u8"rs", .module_path = u8"other.wasm" }));
    EXPECT_FALSE(catalog.add({ .language = u8"other", .module_path = u8"other.wasm" }, aliases));
    EXPECT_FALSE(catalog.add({ .language = u8"other", .module_path = u8"other.wasm" }, repeated));
    EXPECT_FALSE(catalog.add({ .language = u8"", .module_path = u8"other.wasm" }));
    EXPECT_EQ(1, catalog.size());
}

struct Suggestion_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Static_Catalog catalog;

    void SetUp() override
    {
        constexpr std::u8string_view languages[] { u8"python", u8"typescript", u8"css", u8"c" };
        for (const std::u8string_view language : languages) {
            ASSERT_TRUE(catalog.add(
                { .language = std::u8string { language }, .module_path = u8"grammar.wasm" }
            ));
        }
    }
};

TEST_F(Suggestion_Test, transposition)
{
    const std::optional<Language_Suggestion> actual = catalog.suggest_language(u8"pyhton", &memory);
    ASSERT_TRUE(actual);
    EXPECT_EQ(u8"python", actual->language);
    EXPECT_EQ(2, actual->distance);
}

TEST_F(Suggestion_Test, case_is_ignored)
{
    const std::optional<Language_Suggestion> actual
        = catalog.suggest_language(u8"TypeScrip", &memory);
    ASSERT_TRUE(actual);
    EXPECT_EQ(u8"typescript", actual->language);
    EXPECT_EQ(1, actual->distance);
}

TEST_F(Suggestion_Test, earlier_language_wins_tie)
{
    // "cs" is one edit away from both "css" and "c".
    const std::optional<Language_Suggestion> actual = catalog.suggest_language(u8"cs", &memory);
    ASSERT_TRUE(actual);
    EXPECT_EQ(u8"css", actual->language);
    EXPECT_EQ(1, actual->distance);
}

TEST_F(Suggestion_Test, unrelated_language)
{
    EXPECT_FALSE(catalog.suggest_language(u8"cobol", &memory));
    EXPECT_FALSE(catalog.suggest_language(u8"haskell", &memory));
}

TEST(Language_Suggestion, empty_catalog)
{
    std::pmr::monotonic_buffer_resource memory;
    Static_Catalog catalog;
    EXPECT_FALSE(catalog.suggest_language(u8"python", &memory));
}

struct Manifest_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger;
    Static_Catalog catalog;

    [[nodiscard]]
    Result<void, Manifest_Error> load(std::u8string_view source)
    {
        return load_manifest(catalog, source, logger, &memory);
    }
};

TEST_F(Manifest_Test, valid)
{
    constexpr std::u8string_view source = u8R"({
        "interface_version": "0.2.3",
        "plugins": [
            { "language": "rust", "module": "lang-rust/grammar.wasm", "aliases": ["rs"] },
            { "language": "python", "module": "python.wasm", "interface_version": "0.2.4" }
        ]
    })";
    ASSERT_TRUE(load(source));
    EXPECT_TRUE(logger.nothing_logged());

    const Catalog_Entry expected_rust {
        .language = u8"rust",
        .module_path = u8"lang-rust/grammar.wasm",
        .interface_version = u8"0.2.3",
    };
    EXPECT_EQ(expected_rust, catalog.find(u8"rs"));

    const std::optional<Catalog_Entry> python = catalog.find(u8"python");
    ASSERT_TRUE(python);
    EXPECT_EQ(u8"0.2.4", python->interface_version);
}

TEST_F(Manifest_Test, without_version)
{
    ASSERT_TRUE(load(u8R"({ "plugins": [ { "language": "go", "module": "go.wasm" } ] })"));
    const std::optional<Catalog_Entry> go = catalog.find(u8"go");
    ASSERT_TRUE(go);
    EXPECT_EQ(u8"", go->interface_version);
}

TEST_F(Manifest_Test, unread_members_and_duplicate_keys)
{
    // Members of other types are skipped, and the last of two equal keys wins.
    constexpr std::u8string_view source = u8R"({
        // generated
        "generated_at": 1700000000,
        "plugins": [
            {
                "language": "go",
                "module": "old/go.wasm",
                "module": "go\u002Fgrammar.wasm",
                "size": 123456,
                "optional": false,
                "checksum": null,
                "queries": { "highlights": ["highlights.scm"] }
            }
        ]
    })";
    ASSERT_TRUE(load(source));
    const std::optional<Catalog_Entry> go = catalog.find(u8"go");
    ASSERT_TRUE(go);
    EXPECT_EQ(u8"go/grammar.wasm", go->module_path);
}

TEST_F(Manifest_Test, syntax_error)
{
    const Result<void, Manifest_Error> result = load(u8R"({ "plugins": [ )");
    ASSERT_FALSE(result);
    EXPECT_EQ(Manifest_Error::syntax, result.error());
    EXPECT_TRUE(logger.was_logged(diagnostic::manifest_invalid));
}

TEST_F(Manifest_Test, structure_errors)
{
    constexpr std::u8string_view sources[] {
        u8R"([])",
        u8R"({})",
        u8R"({ "plugins": {} })",
        u8R"({ "plugins": [ 1 ] })",
        u8R"({ "plugins": [ { "language": "go" } ] })",
        u8R"({ "plugins": [ { "language": "", "module": "go.wasm" } ] })",
        u8R"({ "plugins": [ { "language": "go", "module": "go.wasm", "aliases": "g" } ] })",
        u8R"({ "plugins": [ { "language": "go", "module": "go.wasm", "aliases": [1] } ] })",
        u8R"({ "interface_version": 2, "plugins": [] })",
    };
    for (const std::u8string_view source : sources) {
        const Result<void, Manifest_Error> result = load(source);
        ASSERT_FALSE(result);
        EXPECT_EQ(Manifest_Error::structure, result.error());
    }
    EXPECT_TRUE(catalog.empty());
}

TEST_F(Manifest_Test, failure_leaves_catalog_unchanged)
{
    ASSERT_TRUE(catalog.add({ .language = u8"c", .module_path = u8"c.wasm" }));

    constexpr std::u8string_view source = u8R"({ "plugins": [
        { "language": "go", "module": "go.wasm" },
        { "language": "C", "module": "other-c.wasm" }
    ] })";
    const Result<void, Manifest_Error> result = load(source);
    ASSERT_FALSE(result);
    EXPECT_EQ(Manifest_Error::duplicate, result.error());
    EXPECT_FALSE(catalog.find(u8"go"));
    EXPECT_EQ(1, catalog.size());
}

TEST_F(Manifest_Test, duplicate_within_manifest)
{
    constexpr std::u8string_view source = u8R"({ "plugins": [
        { "language": "go", "module": "go.wasm", "aliases": ["golang"] },
        { "language": "golang", "module": "golang.wasm" }
    ] })";
    const Result<void, Manifest_Error> result = load(source);
    ASSERT_FALSE(result);
    EXPECT_EQ(Manifest_Error::duplicate, result.error());
    EXPECT_TRUE(catalog.empty());
}

TEST_F(Manifest_Test, missing_file)
{
    const Result<void, Manifest_Error> result = load_manifest_file(
        catalog, u8"/nonexistent/arborium/manifest.json", logger, &memory
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(Manifest_Error::io, result.error());
    EXPECT_TRUE(logger.was_logged(diagnostic::manifest_invalid));
}

struct Fetch_Test : testing::Test {
    static constexpr unsigned char module_bytes[] { 0x00, 0x61, 0x73, 0x6d, 0x01, 0x00 };

    std::filesystem::path directory
        = std::filesystem::temp_directory_path() / "arborium-fetch-test";
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<unsigned char> out { &memory };

    void SetUp() override
    {
        std::filesystem::create_directories(directory / "lang");
        std::ofstream file { directory / "lang" / "module.wasm", std::ios::binary };
        file.write(reinterpret_cast<const char*>(module_bytes), std::size(module_bytes));
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(directory, error);
    }
};

TEST_F(Fetch_Test, relative_path)
{
    Directory_Module_Fetcher fetcher { std::filesystem::path { directory } };
    const Catalog_Entry entry { .language = u8"lang", .module_path = u8"lang/module.wasm" };

    EXPECT_EQ(directory / "lang" / "module.wasm", fetcher.resolve(entry));
    ASSERT_TRUE(fetcher.fetch(out, entry));
    EXPECT_TRUE(std::ranges::equal(module_bytes, out));
}

TEST_F(Fetch_Test, absolute_path)
{
    Directory_Module_Fetcher fetcher { std::filesystem::path { "/nonexistent" } };
    const std::filesystem::path absolute = directory / "lang" / "module.wasm";
    const Catalog_Entry entry { .language = u8"lang", .module_path = absolute.generic_u8string() };

    ASSERT_TRUE(fetcher.fetch(out, entry));
    EXPECT_TRUE(std::ranges::equal(module_bytes, out));
}

TEST_F(Fetch_Test, missing_file)
{
    Directory_Module_Fetcher fetcher { std::filesystem::path { directory } };
    const Catalog_Entry entry { .language = u8"lang", .module_path = u8"missing.wasm" };

    const Result<void, IO_Error_Code> result = fetcher.fetch(out, entry);
    ASSERT_FALSE(result);
    EXPECT_EQ(IO_Error_Code::cannot_open, result.error());
}

} // namespace
} // namespace arborium
