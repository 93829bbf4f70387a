#ifndef ARBORIUM_SERVICES_HPP
#define ARBORIUM_SERVICES_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/util/assert.hpp"
#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/diagnostic.hpp"
#include "arborium/fwd.hpp"

namespace arborium {

/// @brief A sink for diagnostics.
/// Loggers are invoked from every thread that acquires or runs plugins,
/// so implementations of `operator()` have to be thread-safe.
struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        ARBORIUM_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

/// @brief Emits a diagnostic to `logger` if the logger accepts the given `severity`.
inline void
try_log(Logger& logger, Severity severity, std::u8string_view id, std::u8string_view message)
{
    ARBORIUM_DEBUG_ASSERT(severity_is_emittable(severity));
    if (logger.can_log(severity)) {
        logger({ .severity = severity, .id = id, .message = message });
    }
}

struct Catalog_Entry {
    /// @brief The canonical language identifier, such as `rust`.
    std::u8string language;
    /// @brief The location of the module artifact, interpreted by a `Module_Fetcher`.
    std::u8string module_path;
    /// @brief The version of the capability interface the module was built against.
    std::u8string interface_version;

    [[nodiscard]]
    friend bool operator==(const Catalog_Entry&, const Catalog_Entry&)
        = default;
};

struct Language_Suggestion {
    /// @brief The canonical identifier of the suggested language.
    std::u8string_view language;
    /// @brief The number of single-character edits between the request and `language`,
    /// ignoring ASCII case.
    std::size_t distance;
};

/// @brief Maps language identifiers to the location of their grammar modules.
struct Module_Catalog {

    virtual ~Module_Catalog() = default;

    /// @brief Looks up the catalog entry for `language`,
    /// which is either a canonical language identifier or an alias.
    /// Lookup is ASCII case-insensitive.
    /// Returns `std::nullopt` if the language is unknown.
    [[nodiscard]]
    virtual std::optional<Catalog_Entry> find(std::u8string_view language) const
        = 0;

    /// @brief Returns the canonical identifiers of all known languages in no particular order.
    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_languages() const
        = 0;

    [[nodiscard]]
    bool contains(std::u8string_view language) const
    {
        return find(language).has_value();
    }

    /// @brief Finds the known language whose identifier is closest to `language`,
    /// for "did you mean" hints.
    /// Returns `std::nullopt` if no language is close enough to be a plausible typo.
    [[nodiscard]]
    std::optional<Language_Suggestion>
    suggest_language(std::u8string_view language, std::pmr::memory_resource* memory) const;
};

/// @brief Obtains the raw bytes of a module artifact.
struct Module_Fetcher {

    virtual ~Module_Fetcher() = default;

    /// @brief Appends the bytes of the module described by `entry` to `out`.
    /// If a failed result is returned, the contents of `out` are unspecified.
    [[nodiscard]]
    virtual Result<void, IO_Error_Code>
    fetch(std::pmr::vector<unsigned char>& out, const Catalog_Entry& entry)
        = 0;
};

} // namespace arborium

#endif
