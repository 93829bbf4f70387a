#ifndef ARBORIUM_INVOKER_HPP
#define ARBORIUM_INVOKER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/result.hpp"
#include "arborium/util/unicode.hpp"

#include "arborium/error.hpp"
#include "arborium/fwd.hpp"
#include "arborium/registry.hpp"
#include "arborium/render.hpp"
#include "arborium/services.hpp"
#include "arborium/wire.hpp"

namespace arborium {

/// @brief A validated injection, addressed in UTF-8 code units of the source text.
struct Injection_Span {
    std::size_t begin;
    std::size_t end;
    std::pmr::u8string language;
};

/// @brief Like `normalize_captures`, but for injections.
/// @returns The number of dropped injections.
std::size_t normalize_injections(
    std::pmr::vector<Injection_Span>& out,
    std::span<const Raw_Injection> injections,
    const Utf16_Index& index
);

struct Highlight_Output {
    std::pmr::vector<Span> spans;
    std::pmr::vector<Injection_Span> injections;

    [[nodiscard]]
    explicit Highlight_Output(std::pmr::memory_resource* memory)
        : spans { memory }
        , injections { memory }
    {
    }
};

/// @brief Runs plugins and validates their output.
struct Highlight_Invoker {
private:
    Plugin_Registry& m_registry;
    Logger& m_logger;

public:
    [[nodiscard]]
    Highlight_Invoker(Plugin_Registry& registry, Logger& logger);

    /// @brief Acquires the plugin for `language`, runs it once over `source`,
    /// and appends the valid spans and injections to `out`.
    /// Invalid captures and injections are dropped and reported as `output.malformed`,
    /// which does not fail the call.
    ///
    /// If the plugin traps, it is discarded from the registry,
    /// so that the next call for `language` re-instantiates the module.
    /// Cached plugins for other languages are unaffected.
    [[nodiscard]]
    Result<void, Host_Error> invoke(
        Highlight_Output& out,
        std::u8string_view language,
        std::u8string_view source,
        std::pmr::memory_resource* memory
    );

    [[nodiscard]]
    Plugin_Registry& get_registry() noexcept
    {
        return m_registry;
    }
};

} // namespace arborium

#endif
