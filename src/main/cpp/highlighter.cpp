#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/html_writer.hpp"
#include "arborium/util/result.hpp"

#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/highlighter.hpp"
#include "arborium/invoker.hpp"
#include "arborium/registry.hpp"
#include "arborium/render.hpp"
#include "arborium/services.hpp"

namespace arborium {

Highlighter::Highlighter(
    Highlight_Invoker& invoker,
    Logger& logger,
    std::size_t max_injection_depth
)
    : m_invoker { invoker }
    , m_logger { logger }
    , m_max_injection_depth { max_injection_depth }
{
}

Result<void, Host_Error> Highlighter::highlight(
    std::pmr::vector<char8_t>& out,
    std::u8string_view language,
    std::u8string_view source
)
{
    std::pmr::unsynchronized_pool_resource memory;
    std::pmr::vector<Span> spans { &memory };
    if (Result<void, Host_Error> r = collect_spans(spans, language, source, &memory); !r) {
        return r;
    }
    render_spans(out, source, spans, &memory);
    return {};
}

Result<void, Host_Error> Highlighter::highlight_or_escape(
    std::pmr::vector<char8_t>& out,
    std::u8string_view language,
    std::u8string_view source
)
{
    const Result<void, Host_Error> result = highlight(out, language, source);
    if (!result) {
        HTML_Writer writer { Vector_Consumer { &out } };
        writer.write_inner_text(source);
    }
    return result;
}

Result<void, Host_Error> Highlighter::preload(std::u8string_view language)
{
    const Acquire_Result result = m_invoker.get_registry().acquire(language);
    if (!result) {
        return result.error();
    }
    return {};
}

Result<void, Host_Error> Highlighter::collect_spans(
    std::pmr::vector<Span>& out,
    std::u8string_view language,
    std::u8string_view source,
    std::pmr::memory_resource* memory
)
{
    return collect_spans_at_depth(out, language, source, 0, memory);
}

Result<void, Host_Error> Highlighter::collect_spans_at_depth(
    std::pmr::vector<Span>& out,
    std::u8string_view language,
    std::u8string_view source,
    std::size_t depth,
    std::pmr::memory_resource* memory
)
{
    Highlight_Output output { memory };
    if (Result<void, Host_Error> r = m_invoker.invoke(output, language, source, memory); !r) {
        return r;
    }
    out.insert(out.end(), output.spans.begin(), output.spans.end());

    if (depth >= m_max_injection_depth) {
        return {};
    }

    std::pmr::vector<Span> injected { memory };
    for (const Injection_Span& injection : output.injections) {
        const std::u8string_view injected_source
            = source.substr(injection.begin, injection.end - injection.begin);
        injected.clear();
        const Result<void, Host_Error> r = collect_spans_at_depth(
            injected, injection.language, injected_source, depth + 1, memory
        );
        if (!r) {
            std::pmr::u8string message { memory };
            message += u8"Failed to highlight the \"";
            message += injection.language;
            message += u8"\" text injected into \"";
            message += language;
            message += u8"\" (";
            message += host_error_name(r.error());
            message += u8"). The text is highlighted as part of the outer language only.";
            try_log(m_logger, Severity::warning, diagnostic::injection_failed, message);
            continue;
        }
        for (Span span : injected) {
            span.begin += injection.begin;
            span.end += injection.begin;
            out.push_back(span);
        }
    }
    return {};
}

} // namespace arborium
