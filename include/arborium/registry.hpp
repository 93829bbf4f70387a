#ifndef ARBORIUM_REGISTRY_HPP
#define ARBORIUM_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "arborium/util/result.hpp"

#include "arborium/error.hpp"
#include "arborium/fwd.hpp"
#include "arborium/plugin.hpp"
#include "arborium/services.hpp"

namespace arborium {

using Acquire_Result = Result<std::shared_ptr<Plugin>, Host_Error>;

/// @brief Maps language identifiers to ready plugin instances,
/// loading them on first use.
///
/// Instances are cached per canonical language and interface version.
/// Concurrent first uses of the same language share a single fetch and instantiation.
/// Failures are not cached, so a later `acquire` retries.
///
/// All operations are thread-safe.
/// The registry lock is never held while fetching, instantiating, or running a plugin.
struct Plugin_Registry {
private:
    Module_Catalog& m_catalog;
    Module_Fetcher& m_fetcher;
    Plugin_Factory& m_factory;
    Logger& m_logger;

    mutable std::mutex m_mutex;
    std::map<std::u8string, std::shared_ptr<Plugin>, std::less<>> m_cache;
    std::map<std::u8string, std::shared_future<Acquire_Result>, std::less<>> m_in_flight;

public:
    [[nodiscard]]
    Plugin_Registry(
        Module_Catalog& catalog,
        Module_Fetcher& fetcher,
        Plugin_Factory& factory,
        Logger& logger
    );

    Plugin_Registry(const Plugin_Registry&) = delete;
    Plugin_Registry& operator=(const Plugin_Registry&) = delete;

    /// @brief Returns the plugin for `language`, loading it if necessary.
    /// Unknown languages fail with `Host_Error::unknown_language` without any fetch.
    [[nodiscard]]
    Acquire_Result acquire(std::u8string_view language);

    /// @brief Removes `plugin` from the cache if it is still the cached instance for `language`.
    /// This is used after `plugin` trapped, so that the next `acquire` re-instantiates the module.
    /// An instance that has already been replaced is left alone.
    /// Returns `true` if the plugin was removed.
    bool discard(std::u8string_view language, const Plugin* plugin);

    /// @brief Removes the cached instance for `language`, if any.
    /// Returns `true` if an instance was removed.
    bool evict(std::u8string_view language);

    /// @brief Removes all cached instances.
    /// Loads that are in flight are unaffected.
    void clear();

    /// @brief Returns `true` if an instance for `language` is cached.
    [[nodiscard]]
    bool contains(std::u8string_view language) const;

    /// @brief Returns the number of cached instances.
    [[nodiscard]]
    std::size_t size() const;

    [[nodiscard]]
    const Module_Catalog& get_catalog() const noexcept
    {
        return m_catalog;
    }

private:
    [[nodiscard]]
    Acquire_Result load(const Catalog_Entry& entry);

    void log_unknown_language(std::u8string_view language);
};

/// @brief Returns the key under which the instance for `entry` is cached.
[[nodiscard]]
std::u8string plugin_cache_key(const Catalog_Entry& entry);

} // namespace arborium

#endif
