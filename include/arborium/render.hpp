#ifndef ARBORIUM_RENDER_HPP
#define ARBORIUM_RENDER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "arborium/util/unicode.hpp"

#include "arborium/fwd.hpp"
#include "arborium/wire.hpp"

namespace arborium {

/// @brief A capture that has been validated and mapped to a presentation tag.
/// Unlike captures, spans are addressed in UTF-8 code units of the source text.
struct Span {
    std::size_t begin;
    std::size_t end;
    /// @brief The short tag name, such as `k` for keywords,
    /// or the empty string if the capture has no tag.
    std::u8string_view tag;

    [[nodiscard]]
    friend constexpr bool operator==(const Span&, const Span&)
        = default;
};

/// @brief Returns the short tag for a capture name,
/// or the empty string if the capture is not highlighted.
/// For example, `keyword.control` maps to `k`, and `function.method` maps to `f`.
[[nodiscard]]
std::u8string_view capture_tag(std::u8string_view capture) noexcept;

/// @brief Validates `captures`, converts their UTF-16 offsets into UTF-8 offsets using `index`,
/// and appends the resulting spans to `out`, in the same order.
/// Captures whose start is greater than their end,
/// whose bounds exceed the source,
/// or whose bounds fall between the two code units of a surrogate pair are dropped.
/// @returns The number of dropped captures.
std::size_t normalize_captures(
    std::pmr::vector<Span>& out,
    std::span<const Raw_Capture> captures,
    const Utf16_Index& index
);

/// @brief Appends `source` to `out` as HTML,
/// where the text of every span is wrapped in an element named after its tag,
/// such as `<a-k>let</a-k>`.
///
/// Spans are processed in order of ascending `begin`,
/// where spans with the same `begin` retain their relative order.
/// A span that begins before the end of a previously processed span is skipped entirely.
/// Spans without tag emit their text unwrapped.
/// All text is escaped, and no text of `source` is lost or duplicated.
///
/// Every span in `spans` shall satisfy `begin <= end && end <= source.size()`.
void render_spans(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    std::span<const Span> spans,
    std::pmr::memory_resource* memory
);

/// @brief Equivalent to `normalize_captures` followed by `render_spans`.
/// Embedders that obtain captures from elsewhere can render them with this function directly.
/// @returns The number of dropped captures.
std::size_t render_captures(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    std::span<const Raw_Capture> captures,
    std::pmr::memory_resource* memory
);

} // namespace arborium

#endif
