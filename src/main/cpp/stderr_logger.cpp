#include <cstdio>
#include <cstdlib>
#include <memory_resource>
#include <mutex>
#include <string_view>

#ifdef __unix__
#include "stdio.h" // NOLINT for fileno
#include <unistd.h>
#endif

#include "arborium/util/ansi.hpp"
#include "arborium/util/severity.hpp"

#include "arborium/stderr_logger.hpp"

namespace arborium {
namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    using enum Severity;
    return severity <= trace       ? ansi::black
        : severity <= debug        ? ansi::h_black
        : severity <= info         ? ansi::blue
        : severity <= soft_warning ? ansi::green
        : severity <= warning      ? ansi::h_yellow
        : severity <= error        ? ansi::h_red
        : severity <= fatal        ? ansi::red
                                   : ansi::magenta;
}

} // namespace

bool stderr_wants_colors() noexcept
{
    // https://no-color.org/
    const char* const no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color) {
        return false;
    }
#ifdef __unix__
    return isatty(fileno(stderr));
#else
    return false;
#endif
}

Stderr_Logger::Stderr_Logger(Severity min_severity, std::pmr::memory_resource* memory)
    : Stderr_Logger { min_severity, stderr_wants_colors(), memory }
{
}

Stderr_Logger::Stderr_Logger(
    Severity min_severity,
    bool colors,
    std::pmr::memory_resource* memory
)
    : Logger { min_severity }
    , m_buffer { memory }
    , m_colors { colors }
{
}

void Stderr_Logger::operator()(Diagnostic diagnostic)
{
    const std::scoped_lock lock { m_mutex };

    if (m_colors) {
        m_buffer += severity_highlight(diagnostic.severity);
    }
    m_buffer += severity_tag(diagnostic.severity);
    if (m_colors) {
        m_buffer += ansi::reset;
    }
    m_buffer += u8": ";
    m_buffer += diagnostic.message;
    if (m_colors) {
        m_buffer += ansi::h_black;
    }
    m_buffer += u8" [";
    m_buffer += diagnostic.id;
    m_buffer += u8']';
    if (m_colors) {
        m_buffer += ansi::reset;
    }
    m_buffer += u8'\n';

    std::fwrite(m_buffer.data(), 1, m_buffer.size(), stderr);
    std::fflush(stderr);
    m_buffer.clear();
}

} // namespace arborium
