#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arborium/util/assert.hpp"
#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"
#include "arborium/util/strings.hpp"

#include "arborium/catalog.hpp"
#include "arborium/diagnostic.hpp"
#include "arborium/json.hpp"
#include "arborium/services.hpp"

namespace arborium {
namespace {

/// @brief Returns the Levenshtein distance between `x` and `y`, ignoring ASCII case.
/// `row` is used as scratch space.
[[nodiscard]]
std::size_t edit_distance_ignoring_case(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::vector<std::size_t>& row
)
{
    // row[j] is the distance between the prefix of x processed so far and y.substr(0, j).
    row.resize(y.size() + 1);
    for (std::size_t j = 0; j <= y.size(); ++j) {
        row[j] = j;
    }
    for (std::size_t i = 0; i < x.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i + 1;
        for (std::size_t j = 0; j < y.size(); ++j) {
            const std::size_t above = row[j + 1];
            const bool same = to_ascii_lower(x[i]) == to_ascii_lower(y[j]);
            row[j + 1] = std::min({ above + 1, row[j] + 1, diagonal + (same ? 0 : 1) });
            diagonal = above;
        }
    }
    return row[y.size()];
}

} // namespace

std::optional<Language_Suggestion>
Module_Catalog::suggest_language(std::u8string_view language, std::pmr::memory_resource* memory)
    const
{
    // Anything further away than this is more likely a different language than a typo.
    const std::size_t max_distance = std::max(std::size_t(1), language.size() / 2);

    std::pmr::vector<std::size_t> row { memory };
    std::optional<Language_Suggestion> best;
    for (const std::u8string_view candidate : get_languages()) {
        const std::size_t distance = edit_distance_ignoring_case(language, candidate, row);
        if (distance <= max_distance && (!best || distance < best->distance)) {
            best = Language_Suggestion { .language = candidate, .distance = distance };
        }
    }
    return best;
}

bool Static_Catalog::can_add(
    std::u8string_view language,
    std::span<const std::u8string_view> aliases
) const
{
    if (language.empty() || find_explicit(language)) {
        return false;
    }
    for (std::size_t i = 0; i < aliases.size(); ++i) {
        if (aliases[i].empty() || find_explicit(aliases[i])
            || equals_ascii_ignore_case(aliases[i], language)) {
            return false;
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (equals_ascii_ignore_case(aliases[i], aliases[j])) {
                return false;
            }
        }
    }
    return true;
}

bool Static_Catalog::add(Catalog_Entry entry, std::span<const std::u8string_view> aliases)
{
    if (!can_add(entry.language, aliases)) {
        return false;
    }
    const std::size_t index = m_entries.size();
    m_entries.push_back(std::move(entry));
    for (const std::u8string_view alias : aliases) {
        m_aliases.push_back({ .alias = std::u8string { alias }, .entry_index = index });
    }
    update_languages();
    return true;
}

const Catalog_Entry* Static_Catalog::find_explicit(std::u8string_view language) const
{
    for (const Catalog_Entry& entry : m_entries) {
        if (equals_ascii_ignore_case(entry.language, language)) {
            return &entry;
        }
    }
    for (const Alias_Entry& alias : m_aliases) {
        if (equals_ascii_ignore_case(alias.alias, language)) {
            return &m_entries[alias.entry_index];
        }
    }
    return nullptr;
}

std::optional<Catalog_Entry> Static_Catalog::find(std::u8string_view language) const
{
    if (const Catalog_Entry* const entry = find_explicit(language)) {
        return *entry;
    }
    for (const Language_Alias& alias : builtin_language_aliases) {
        if (equals_ascii_ignore_case(alias.alias, language)) {
            if (const Catalog_Entry* const entry = find_explicit(alias.language)) {
                return *entry;
            }
        }
    }
    return {};
}

void Static_Catalog::update_languages()
{
    // Inserting into m_entries may relocate the strings, so all views are recreated.
    m_languages.clear();
    m_languages.reserve(m_entries.size());
    for (const Catalog_Entry& entry : m_entries) {
        m_languages.push_back(entry.language);
    }
}

namespace {

struct Manifest_Plugin {
    Catalog_Entry entry;
    std::vector<std::u8string_view> aliases;
};

struct Manifest_Loader {
    Logger& logger;
    std::pmr::memory_resource* memory;

    Manifest_Error fail(Manifest_Error error, std::u8string_view message)
    {
        try_log(logger, Severity::error, diagnostic::manifest_invalid, message);
        return error;
    }

    [[nodiscard]]
    Result<Manifest_Plugin, Manifest_Error>
    load_plugin(const json::Value& value, std::u8string_view default_version)
    {
        const json::Object* const object = value.as_object();
        if (!object) {
            return fail(
                Manifest_Error::structure, u8"Every plugin in the manifest must be an object."
            );
        }
        const json::String* const language = json::find_string(*object, u8"language");
        const json::String* const module = json::find_string(*object, u8"module");
        if (!language || language->empty() || !module || module->empty()) {
            return fail(
                Manifest_Error::structure,
                u8"Every plugin in the manifest needs a non-empty \"language\" and \"module\"."
            );
        }

        std::u8string_view version = default_version;
        if (const json::Value* const version_value = json::find(*object, u8"interface_version")) {
            const json::String* const version_string = version_value->as_string();
            if (!version_string) {
                return fail(Manifest_Error::structure, u8"\"interface_version\" must be a string.");
            }
            version = *version_string;
        }

        Manifest_Plugin result {
            .entry = {
                .language = std::u8string { *language },
                .module_path = std::u8string { *module },
                .interface_version = std::u8string { version },
            },
            .aliases = {},
        };
        if (const json::Value* const aliases_value = json::find(*object, u8"aliases")) {
            const json::Array* const aliases = aliases_value->as_array();
            if (!aliases) {
                return fail(
                    Manifest_Error::structure, u8"\"aliases\" must be an array of strings."
                );
            }
            for (const json::Value& alias : *aliases) {
                const json::String* const alias_string = alias.as_string();
                if (!alias_string) {
                    return fail(
                        Manifest_Error::structure, u8"\"aliases\" must be an array of strings."
                    );
                }
                result.aliases.push_back(*alias_string);
            }
        }
        return result;
    }

    [[nodiscard]]
    Result<void, Manifest_Error> load(Static_Catalog& out, std::u8string_view source)
    {
        const std::optional<json::Value> root = json::parse(source, memory);
        if (!root) {
            return fail(Manifest_Error::syntax, u8"The manifest is not valid JSON.");
        }
        const json::Object* const root_object = root->as_object();
        if (!root_object) {
            return fail(Manifest_Error::structure, u8"The manifest must be a JSON object.");
        }

        std::u8string_view default_version;
        if (const json::Value* const version_value
            = json::find(*root_object, u8"interface_version")) {
            const json::String* const version_string = version_value->as_string();
            if (!version_string) {
                return fail(Manifest_Error::structure, u8"\"interface_version\" must be a string.");
            }
            default_version = *version_string;
        }

        const json::Array* const plugins = json::find_array(*root_object, u8"plugins");
        if (!plugins) {
            return fail(Manifest_Error::structure, u8"The manifest needs a \"plugins\" array.");
        }

        // All plugins are validated before any is added, so that failure leaves `out` unchanged.
        // The aliases are views into `root`, which outlives this vector.
        std::vector<Manifest_Plugin> loaded;
        Static_Catalog staging;
        for (const json::Value& plugin : *plugins) {
            Result<Manifest_Plugin, Manifest_Error> r = load_plugin(plugin, default_version);
            if (!r) {
                return r.error();
            }
            if (!out.can_add(r->entry.language, r->aliases)
                || !staging.add(r->entry, r->aliases)) {
                std::pmr::u8string message { memory };
                message += u8"The manifest lists the language or an alias of \"";
                message += r->entry.language;
                message += u8"\" more than once, or the catalog already contains it.";
                return fail(Manifest_Error::duplicate, message);
            }
            loaded.push_back(std::move(*r));
        }

        for (Manifest_Plugin& plugin : loaded) {
            const bool added = out.add(std::move(plugin.entry), plugin.aliases);
            ARBORIUM_ASSERT(added);
        }
        return {};
    }
};

} // namespace

Result<void, Manifest_Error> load_manifest(
    Static_Catalog& out,
    std::u8string_view source,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    Manifest_Loader loader { .logger = logger, .memory = memory };
    return loader.load(out, source);
}

Result<void, Manifest_Error> load_manifest_file(
    Static_Catalog& out,
    std::u8string_view path,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<char8_t> source { memory };
    if (const Result<void, IO_Error_Code> r = load_utf8_file(source, path); !r) {
        std::pmr::u8string message { memory };
        message += u8"Failed to load manifest \"";
        message += path;
        message += u8"\": ";
        message += io_error_code_message(r.error());
        try_log(logger, Severity::error, diagnostic::manifest_invalid, message);
        return Manifest_Error::io;
    }
    return load_manifest(out, as_u8string_view(source), logger, memory);
}

} // namespace arborium
