#ifndef ARBORIUM_ERROR_HPP
#define ARBORIUM_ERROR_HPP

#include <string_view>

#include "arborium/fwd.hpp"

namespace arborium {

/// @brief The reasons why acquiring or running a plugin can fail.
enum struct Host_Error : Default_Underlying {
    /// @brief The module catalog has no entry for the requested language.
    /// Retrying is pointless.
    unknown_language,
    /// @brief The bytes of the module could not be obtained.
    /// The caller may retry.
    fetch_failure,
    /// @brief The module is malformed, requires imports the host does not provide,
    /// or was built against an unsupported interface version.
    /// A new module version is needed.
    instantiation_failure,
    /// @brief The sandboxed call faulted, timed out, or exited with a nonzero status.
    /// The instance has been discarded, so retrying re-instantiates the module.
    execution_trap,
    /// @brief The module reported a parse error instead of returning captures.
    /// The instance remains usable.
    plugin_failure,
    /// @brief The source text is larger than the memory of a module can hold.
    /// The module was not called and the instance remains usable.
    input_too_large,
};

[[nodiscard]]
constexpr std::u8string_view host_error_name(Host_Error e)
{
    using enum Host_Error;
    switch (e) {
        ARBORIUM_ENUM_STRING_CASE8(unknown_language);
        ARBORIUM_ENUM_STRING_CASE8(fetch_failure);
        ARBORIUM_ENUM_STRING_CASE8(instantiation_failure);
        ARBORIUM_ENUM_STRING_CASE8(execution_trap);
        ARBORIUM_ENUM_STRING_CASE8(plugin_failure);
        ARBORIUM_ENUM_STRING_CASE8(input_too_large);
    }
    return u8"";
}

} // namespace arborium

#endif
