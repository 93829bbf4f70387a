#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/assert.hpp"
#include "arborium/util/html_writer.hpp"
#include "arborium/util/unicode.hpp"

#include "arborium/render.hpp"
#include "arborium/wire.hpp"

namespace arborium {

std::u8string_view capture_tag(std::u8string_view capture) noexcept
{
    if (capture.starts_with(u8"keyword") || capture == u8"include" || capture == u8"conditional") {
        return u8"k";
    }
    if (capture.starts_with(u8"function") || capture.starts_with(u8"method")) {
        return u8"f";
    }
    if (capture.starts_with(u8"string") || capture == u8"character") {
        return u8"s";
    }
    if (capture.starts_with(u8"comment")) {
        return u8"c";
    }
    if (capture.starts_with(u8"type")) {
        return u8"t";
    }
    if (capture.starts_with(u8"variable")) {
        return u8"v";
    }
    if (capture.starts_with(u8"number") || capture == u8"float") {
        return u8"n";
    }
    if (capture.starts_with(u8"operator")) {
        return u8"o";
    }
    if (capture.starts_with(u8"punctuation")) {
        return u8"p";
    }
    if (capture.starts_with(u8"tag")) {
        return u8"tg";
    }
    if (capture.starts_with(u8"attribute")) {
        return u8"at";
    }
    return {};
}

std::size_t normalize_captures(
    std::pmr::vector<Span>& out,
    std::span<const Raw_Capture> captures,
    const Utf16_Index& index
)
{
    std::size_t dropped = 0;
    for (const Raw_Capture& capture : captures) {
        if (capture.start > capture.end) {
            ++dropped;
            continue;
        }
        const std::size_t begin = index.to_utf8(capture.start);
        const std::size_t end = index.to_utf8(capture.end);
        if (begin == Utf16_Index::npos || end == Utf16_Index::npos) {
            ++dropped;
            continue;
        }
        out.push_back({ .begin = begin, .end = end, .tag = capture_tag(capture.name) });
    }
    return dropped;
}

void render_spans(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    std::span<const Span> spans,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<Span> sorted { spans.begin(), spans.end(), memory };
    std::ranges::stable_sort(sorted, {}, &Span::begin);

    HTML_Writer writer { Vector_Consumer { &out } };
    std::pmr::u8string element { memory };

    std::size_t pos = 0;
    for (const Span& span : sorted) {
        ARBORIUM_DEBUG_ASSERT(span.begin <= span.end && span.end <= source.size());
        if (span.begin < pos) {
            continue;
        }
        writer.write_inner_text(source.substr(pos, span.begin - pos));

        const std::u8string_view text = source.substr(span.begin, span.end - span.begin);
        if (span.tag.empty()) {
            writer.write_inner_text(text);
        }
        else {
            element = u8"a-";
            element += span.tag;
            writer.open_tag(element);
            writer.write_inner_text(text);
            writer.close_tag(element);
        }
        pos = span.end;
    }
    writer.write_inner_text(source.substr(pos));

    ARBORIUM_DEBUG_ASSERT(writer.is_done());
}

std::size_t render_captures(
    std::pmr::vector<char8_t>& out,
    std::u8string_view source,
    std::span<const Raw_Capture> captures,
    std::pmr::memory_resource* memory
)
{
    const Utf16_Index index { source, memory };
    std::pmr::vector<Span> spans { memory };
    const std::size_t dropped = normalize_captures(spans, captures, index);
    render_spans(out, source, spans, memory);
    return dropped;
}

} // namespace arborium
