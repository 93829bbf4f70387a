#ifndef ARBORIUM_CATALOG_HPP
#define ARBORIUM_CATALOG_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/result.hpp"

#include "arborium/fwd.hpp"
#include "arborium/services.hpp"

namespace arborium {

struct Language_Alias {
    std::u8string_view alias;
    std::u8string_view language;
};

/// @brief Aliases that every `Static_Catalog` resolves,
/// provided that the aliased language is in the catalog
/// and the alias has not been registered explicitly.
inline constexpr Language_Alias builtin_language_aliases[] {
    { u8"js", u8"javascript" },
    { u8"jsx", u8"javascript" },
    { u8"ts", u8"typescript" },
    { u8"rs", u8"rust" },
};

/// @brief A `Module_Catalog` whose entries are added programmatically or loaded from a manifest.
struct Static_Catalog final : Module_Catalog {
private:
    struct Alias_Entry {
        std::u8string alias;
        std::size_t entry_index;
    };

    std::vector<Catalog_Entry> m_entries;
    std::vector<Alias_Entry> m_aliases;
    std::vector<std::u8string_view> m_languages;

public:
    [[nodiscard]]
    Static_Catalog() = default;

    Static_Catalog(const Static_Catalog&) = delete;
    Static_Catalog& operator=(const Static_Catalog&) = delete;

    // Moving the vectors keeps their elements in place,
    // so the views in m_languages remain valid.
    [[nodiscard]]
    Static_Catalog(Static_Catalog&&) noexcept = default;
    Static_Catalog& operator=(Static_Catalog&&) noexcept = default;

    /// @brief Returns `true` if `add` would succeed for the given language and aliases.
    [[nodiscard]]
    bool can_add(std::u8string_view language, std::span<const std::u8string_view> aliases = {})
        const;

    /// @brief Adds `entry` to the catalog, along with `aliases` for its language.
    /// Returns `false` and adds nothing if the language or any of the aliases
    /// already names a language in the catalog.
    [[nodiscard]]
    bool add(Catalog_Entry entry, std::span<const std::u8string_view> aliases = {});

    [[nodiscard]]
    std::optional<Catalog_Entry> find(std::u8string_view language) const final;

    [[nodiscard]]
    std::span<const std::u8string_view> get_languages() const final
    {
        return m_languages;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_entries.empty();
    }

private:
    [[nodiscard]]
    const Catalog_Entry* find_explicit(std::u8string_view language) const;

    void update_languages();
};

enum struct Manifest_Error : Default_Underlying {
    /// @brief The manifest file could not be read.
    io,
    /// @brief The manifest is not valid JSON.
    syntax,
    /// @brief The manifest is valid JSON, but does not describe a catalog.
    structure,
    /// @brief The manifest lists a language or alias more than once.
    duplicate,
};

/// @brief Adds the plugins listed in the JSON manifest `source` to `out`.
/// The manifest has the form:
/// ```json
/// { "interface_version": "0.2.3",
///   "plugins": [ { "language": "rust", "module": "rust.wasm",
///                  "aliases": ["rs"], "interface_version": "0.2.3" } ] }
/// ```
/// where the top-level `interface_version`, `aliases`,
/// and the per-plugin `interface_version` are optional.
/// A per-plugin `interface_version` overrides the top-level one.
/// Problems are reported to `logger`.
/// On failure, `out` is left unchanged.
[[nodiscard]]
Result<void, Manifest_Error> load_manifest(
    Static_Catalog& out,
    std::u8string_view source,
    Logger& logger,
    std::pmr::memory_resource* memory
);

/// @brief Like `load_manifest`, but reads the manifest from the file at `path`.
[[nodiscard]]
Result<void, Manifest_Error> load_manifest_file(
    Static_Catalog& out,
    std::u8string_view path,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace arborium

#endif
