#ifndef ARBORIUM_HOST_HPP
#define ARBORIUM_HOST_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <memory_resource>

#include "arborium/util/result.hpp"
#include "arborium/util/severity.hpp"

#include "arborium/capabilities.hpp"
#include "arborium/catalog.hpp"
#include "arborium/fetch.hpp"
#include "arborium/fwd.hpp"
#include "arborium/highlighter.hpp"
#include "arborium/invoker.hpp"
#include "arborium/registry.hpp"
#include "arborium/services.hpp"
#include "arborium/stderr_logger.hpp"
#include "arborium/wasm.hpp"
#include "arborium/wasm_plugin.hpp"

namespace arborium {

struct Host_Options {
    /// @brief The directory that module paths in the catalog are relative to.
    std::filesystem::path plugins_directory = ".";
    /// @brief The JSON manifest that the catalog is loaded from.
    /// If empty, the catalog starts out empty and is populated programmatically.
    std::filesystem::path manifest_path {};
    /// @brief The time that a single call into a plugin may take.
    std::chrono::nanoseconds call_timeout = std::chrono::seconds { 10 };
    /// @brief The granularity at which call timeouts are checked.
    std::chrono::nanoseconds epoch_interval = std::chrono::milliseconds { 10 };
    /// @brief The maximum size of the linear memory of one plugin instance, in bytes.
    std::size_t max_memory_bytes = std::size_t(256) * 1024 * 1024;
    /// @brief How deeply language injections are resolved.
    /// Zero disables injections.
    std::size_t max_injection_depth = 3;
    /// @brief The minimum severity of diagnostics that the default logger prints.
    Severity min_log_severity = Severity::warning;
};

/// @brief Owns everything needed to highlight code with sandboxed grammar plugins.
///
/// The catalog should be fully populated before highlighting starts,
/// since it is not synchronized.
/// All other operations may be used from multiple threads.
struct Host {
private:
    Stderr_Logger m_stderr_logger;
    Logger& m_logger;
    wasm::Engine m_engine;
    Capability_Environment m_capabilities;
    Wasm_Plugin_Factory m_factory;
    Static_Catalog m_catalog;
    Directory_Module_Fetcher m_fetcher;
    Plugin_Registry m_registry;
    Highlight_Invoker m_invoker;
    Highlighter m_highlighter;

public:
    /// @brief Creates a host that reports diagnostics to `stderr`.
    [[nodiscard]]
    explicit Host(const Host_Options& options);

    /// @brief Creates a host that reports diagnostics to `logger`,
    /// which has to outlive the host.
    [[nodiscard]]
    Host(const Host_Options& options, Logger& logger);

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

private:
    /// @brief Uses `*logger`, or the stderr logger if `logger` is null.
    [[nodiscard]]
    Host(const Host_Options& options, Logger* logger);

public:

    /// @brief Adds the plugins listed in the manifest at `path` to the catalog.
    [[nodiscard]]
    Result<void, Manifest_Error> load_manifest(const std::filesystem::path& path);

    [[nodiscard]]
    Highlighter& get_highlighter() noexcept
    {
        return m_highlighter;
    }

    [[nodiscard]]
    Plugin_Registry& get_registry() noexcept
    {
        return m_registry;
    }

    [[nodiscard]]
    Static_Catalog& get_catalog() noexcept
    {
        return m_catalog;
    }

    [[nodiscard]]
    Logger& get_logger() noexcept
    {
        return m_logger;
    }
};

/// @brief Creates a `Host` and, if `options.manifest_path` is not empty,
/// loads the manifest into its catalog.
[[nodiscard]]
Result<std::unique_ptr<Host>, Manifest_Error> make_host(const Host_Options& options, Logger& logger);

/// @brief Like the other overload, but diagnostics are printed to `stderr`.
[[nodiscard]]
Result<std::unique_ptr<Host>, Manifest_Error> make_host(const Host_Options& options);

} // namespace arborium

#endif
