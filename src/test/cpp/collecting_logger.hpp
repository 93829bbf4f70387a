#ifndef ARBORIUM_COLLECTING_LOGGER_HPP
#define ARBORIUM_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/diagnostic.hpp"
#include "arborium/fwd.hpp"
#include "arborium/services.hpp"

namespace arborium {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::u8string id;
    std::pmr::u8string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* memory)
        : severity { d.severity }
        , id { d.id, memory }
        , message { d.message, memory }
    {
    }
};

struct Collecting_Logger final : Logger {
private:
    mutable std::mutex m_mutex;
    std::pmr::vector<Collected_Diagnostic> m_diagnostics;

public:
    [[nodiscard]]
    explicit Collecting_Logger(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
        : Logger { Severity::min }
        , m_diagnostics { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        const std::scoped_lock lock { m_mutex };
        std::pmr::memory_resource* const memory = m_diagnostics.get_allocator().resource();
        m_diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        const std::scoped_lock lock { m_mutex };
        return m_diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(std::u8string_view id) const
    {
        const std::scoped_lock lock { m_mutex };
        return std::ranges::find(m_diagnostics, id, &Collected_Diagnostic::id)
            != m_diagnostics.end();
    }

    [[nodiscard]]
    std::size_t count(std::u8string_view id) const
    {
        const std::scoped_lock lock { m_mutex };
        return std::size_t(std::ranges::count(m_diagnostics, id, &Collected_Diagnostic::id));
    }

    /// @brief Returns the message of the first diagnostic with the given `id`,
    /// or the empty string if there is none.
    [[nodiscard]]
    std::u8string first_message(std::u8string_view id) const
    {
        const std::scoped_lock lock { m_mutex };
        const auto it = std::ranges::find(m_diagnostics, id, &Collected_Diagnostic::id);
        return it == m_diagnostics.end() ? std::u8string {} : std::u8string { it->message };
    }

    void clear()
    {
        const std::scoped_lock lock { m_mutex };
        m_diagnostics.clear();
    }
};

} // namespace arborium

#endif
