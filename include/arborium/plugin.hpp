#ifndef ARBORIUM_PLUGIN_HPP
#define ARBORIUM_PLUGIN_HPP

#include <memory>
#include <span>
#include <string_view>

#include "arborium/util/result.hpp"

#include "arborium/error.hpp"
#include "arborium/fwd.hpp"
#include "arborium/services.hpp"
#include "arborium/wire.hpp"

namespace arborium {

/// @brief A ready-to-use grammar for one language.
struct Plugin {

    virtual ~Plugin() = default;

    /// @brief Runs the grammar over `source` and appends the raw captures and injections to `out`.
    /// Implementations serialize concurrent calls if they cannot run them in parallel.
    ///
    /// If `Host_Error::execution_trap` is returned,
    /// the plugin is in an undefined state and must not be used for further calls.
    /// If a failed result is returned, the contents of `out` are unspecified.
    [[nodiscard]]
    virtual Result<void, Host_Error> highlight(Raw_Parse_Result& out, std::u8string_view source)
        = 0;
};

/// @brief Turns module bytes into `Plugin`s.
struct Plugin_Factory {

    virtual ~Plugin_Factory() = default;

    /// @brief Instantiates the module given by `bytes`,
    /// which has been fetched for `entry`.
    /// Returns `Host_Error::instantiation_failure` on failure.
    [[nodiscard]]
    virtual Result<std::shared_ptr<Plugin>, Host_Error>
    instantiate(std::span<const unsigned char> bytes, const Catalog_Entry& entry)
        = 0;
};

} // namespace arborium

#endif
