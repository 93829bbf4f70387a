#ifndef ARBORIUM_STDERR_LOGGER_HPP
#define ARBORIUM_STDERR_LOGGER_HPP

#include <memory_resource>
#include <mutex>
#include <string>

#include "arborium/diagnostic.hpp"
#include "arborium/services.hpp"

#include "arborium/fwd.hpp"

namespace arborium {

/// @brief Returns `true` if diagnostics printed to `stderr` should be colored,
/// which is when `stderr` is a terminal and the `NO_COLOR` environment variable
/// is unset or empty.
[[nodiscard]]
bool stderr_wants_colors() noexcept;

/// @brief Prints diagnostics to `stderr`, one line per diagnostic, in the form
/// `SEVERITY: message [id]`.
/// Unless colors are requested explicitly, the severity and id are colored
/// if `stderr_wants_colors()` is `true` at construction.
struct Stderr_Logger final : Logger {
private:
    std::mutex m_mutex;
    std::pmr::u8string m_buffer;
    bool m_colors;

public:
    [[nodiscard]]
    explicit Stderr_Logger(
        Severity min_severity,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    );

    [[nodiscard]]
    Stderr_Logger(Severity min_severity, bool colors, std::pmr::memory_resource* memory);

    void operator()(Diagnostic diagnostic) final;
};

} // namespace arborium

#endif
