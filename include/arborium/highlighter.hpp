#ifndef ARBORIUM_HIGHLIGHTER_HPP
#define ARBORIUM_HIGHLIGHTER_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "arborium/util/result.hpp"

#include "arborium/error.hpp"
#include "arborium/fwd.hpp"
#include "arborium/invoker.hpp"
#include "arborium/render.hpp"
#include "arborium/services.hpp"

namespace arborium {

/// @brief The entry point for embedders:
/// turns source text in a given language into highlighted HTML.
struct Highlighter {
private:
    Highlight_Invoker& m_invoker;
    Logger& m_logger;
    std::size_t m_max_injection_depth;

public:
    [[nodiscard]]
    Highlighter(Highlight_Invoker& invoker, Logger& logger, std::size_t max_injection_depth = 3);

    /// @brief Appends `source` as highlighted HTML to `out`.
    /// If a failed result is returned, nothing is appended to `out`.
    [[nodiscard]]
    Result<void, Host_Error> highlight(
        std::pmr::vector<char8_t>& out,
        std::u8string_view language,
        std::u8string_view source
    );

    /// @brief Like `highlight`, but if highlighting fails,
    /// appends `source` as escaped plain text instead.
    /// Hence, `out` always receives the text.
    Result<void, Host_Error> highlight_or_escape(
        std::pmr::vector<char8_t>& out,
        std::u8string_view language,
        std::u8string_view source
    );

    /// @brief Loads the plugin for `language` without highlighting anything.
    [[nodiscard]]
    Result<void, Host_Error> preload(std::u8string_view language);

    /// @brief Appends the spans for `source`, including those of injected languages,
    /// to `out`.
    /// The spans of injected languages follow the spans of the outer language,
    /// so that when rendered, the outer language takes precedence where they overlap.
    /// Injections that cannot be highlighted are reported and skipped.
    [[nodiscard]]
    Result<void, Host_Error> collect_spans(
        std::pmr::vector<Span>& out,
        std::u8string_view language,
        std::u8string_view source,
        std::pmr::memory_resource* memory
    );

private:
    [[nodiscard]]
    Result<void, Host_Error> collect_spans_at_depth(
        std::pmr::vector<Span>& out,
        std::u8string_view language,
        std::u8string_view source,
        std::size_t depth,
        std::pmr::memory_resource* memory
    );
};

} // namespace arborium

#endif
