#ifndef ARBORIUM_DIAGNOSTIC_HPP
#define ARBORIUM_DIAGNOSTIC_HPP

#include <string_view>

#include "arborium/util/severity.hpp"

#include "arborium/fwd.hpp"

namespace arborium {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    /// The string only has to remain valid for the duration of the logger call.
    std::u8string_view message;
};

namespace diagnostic {

// CATALOG =========================================================================================

/// @brief A language was requested that has no entry in the module catalog.
inline constexpr std::u8string_view unknown_language = u8"catalog.unknown-language";

/// @brief The catalog manifest could not be loaded or has an unexpected structure.
inline constexpr std::u8string_view manifest_invalid = u8"catalog.manifest";

// LOADING =========================================================================================

/// @brief The bytes of a module could not be obtained.
inline constexpr std::u8string_view fetch_failed = u8"fetch.failed";

/// @brief A module was fetched and instantiated, and is now cached.
inline constexpr std::u8string_view plugin_loaded = u8"load.success";

/// @brief A cached plugin instance was dropped.
inline constexpr std::u8string_view plugin_discarded = u8"load.discard";

/// @brief The module bytes are not a valid module.
inline constexpr std::u8string_view instantiate_compile = u8"instantiate.compile";

/// @brief The module requires an import that the capability environment does not provide.
inline constexpr std::u8string_view instantiate_import = u8"instantiate.import";

/// @brief The module was built against an interface or wire version the host does not support.
inline constexpr std::u8string_view instantiate_version = u8"instantiate.version";

/// @brief The module lacks an export required by the wire contract.
inline constexpr std::u8string_view instantiate_export = u8"instantiate.export";

/// @brief Instantiation or initialization trapped or failed for another reason.
inline constexpr std::u8string_view instantiate_failed = u8"instantiate.failed";

// EXECUTION =======================================================================================

/// @brief A call into a plugin trapped.
inline constexpr std::u8string_view execute_trap = u8"execute.trap";

/// @brief A call into a plugin exceeded the call timeout.
inline constexpr std::u8string_view execute_timeout = u8"execute.timeout";

/// @brief The source text is too large to be passed to a plugin.
inline constexpr std::u8string_view input_too_large = u8"execute.input-too-large";

/// @brief The plugin returned an error result instead of captures.
inline constexpr std::u8string_view execute_plugin_error = u8"execute.plugin-error";

/// @brief The plugin returned captures or a result structure that could not be used.
inline constexpr std::u8string_view output_malformed = u8"output.malformed";

/// @brief An injected language could not be highlighted.
inline constexpr std::u8string_view injection_failed = u8"injection.failed";

} // namespace diagnostic

} // namespace arborium

#endif
