#include <cstddef>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/result.hpp"
#include "arborium/util/strings.hpp"
#include "arborium/util/unicode.hpp"

#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/invoker.hpp"
#include "arborium/plugin.hpp"
#include "arborium/registry.hpp"
#include "arborium/render.hpp"
#include "arborium/services.hpp"
#include "arborium/wire.hpp"

namespace arborium {

std::size_t normalize_injections(
    std::pmr::vector<Injection_Span>& out,
    std::span<const Raw_Injection> injections,
    const Utf16_Index& index
)
{
    std::size_t dropped = 0;
    for (const Raw_Injection& injection : injections) {
        if (injection.start > injection.end || injection.language.empty()) {
            ++dropped;
            continue;
        }
        const std::size_t begin = index.to_utf8(injection.start);
        const std::size_t end = index.to_utf8(injection.end);
        if (begin == Utf16_Index::npos || end == Utf16_Index::npos) {
            ++dropped;
            continue;
        }
        out.push_back({
            .begin = begin,
            .end = end,
            .language = std::pmr::u8string { injection.language, out.get_allocator().resource() },
        });
    }
    return dropped;
}

Highlight_Invoker::Highlight_Invoker(Plugin_Registry& registry, Logger& logger)
    : m_registry { registry }
    , m_logger { logger }
{
}

Result<void, Host_Error> Highlight_Invoker::invoke(
    Highlight_Output& out,
    std::u8string_view language,
    std::u8string_view source,
    std::pmr::memory_resource* memory
)
{
    const Acquire_Result plugin = m_registry.acquire(language);
    if (!plugin) {
        return plugin.error();
    }

    Raw_Parse_Result raw { memory };
    if (const Result<void, Host_Error> r = (*plugin)->highlight(raw, source); !r) {
        if (r.error() == Host_Error::execution_trap) {
            m_registry.discard(language, plugin->get());
        }
        return r.error();
    }

    const Utf16_Index index { source, memory };
    std::size_t dropped = raw.malformed_records;
    dropped += normalize_captures(out.spans, raw.captures, index);
    dropped += normalize_injections(out.injections, raw.injections, index);

    if (dropped != 0 && m_logger.can_log(Severity::soft_warning)) {
        std::pmr::u8string message { memory };
        message += u8"Dropped ";
        message += as_u8string_view(std::to_string(dropped));
        message += u8" of ";
        message += as_u8string_view(
            std::to_string(raw.captures.size() + raw.injections.size() + raw.malformed_records)
        );
        message += u8" captures and injections returned by the plugin for \"";
        message += language;
        message += u8"\" because their bounds are invalid.";
        try_log(m_logger, Severity::soft_warning, diagnostic::output_malformed, message);
    }
    return {};
}

} // namespace arborium
