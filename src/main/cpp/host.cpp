#include <filesystem>
#include <memory>
#include <memory_resource>
#include <string>

#include "arborium/util/result.hpp"

#include "arborium/catalog.hpp"
#include "arborium/host.hpp"
#include "arborium/services.hpp"

namespace arborium {
namespace {

[[nodiscard]]
Sandbox_Limits to_sandbox_limits(const Host_Options& options)
{
    return { .call_timeout = options.call_timeout, .max_memory_bytes = options.max_memory_bytes };
}

[[nodiscard]]
Result<std::unique_ptr<Host>, Manifest_Error>
finish_host(std::unique_ptr<Host> host, const Host_Options& options)
{
    if (!options.manifest_path.empty()) {
        if (const Result<void, Manifest_Error> r = host->load_manifest(options.manifest_path); !r) {
            return r.error();
        }
    }
    return host;
}

} // namespace

Host::Host(const Host_Options& options)
    : Host { options, nullptr }
{
}

Host::Host(const Host_Options& options, Logger& logger)
    : Host { options, &logger }
{
}

Host::Host(const Host_Options& options, Logger* logger)
    : m_stderr_logger { options.min_log_severity }
    , m_logger { logger ? *logger : m_stderr_logger }
    , m_engine { options.epoch_interval }
    , m_capabilities { m_engine }
    , m_factory { m_engine, m_capabilities, m_logger, to_sandbox_limits(options) }
    , m_fetcher { std::filesystem::path { options.plugins_directory } }
    , m_registry { m_catalog, m_fetcher, m_factory, m_logger }
    , m_invoker { m_registry, m_logger }
    , m_highlighter { m_invoker, m_logger, options.max_injection_depth }
{
}

Result<void, Manifest_Error> Host::load_manifest(const std::filesystem::path& path)
{
    std::pmr::unsynchronized_pool_resource memory;
    const std::u8string path_string = path.generic_u8string();
    return arborium::load_manifest_file(m_catalog, path_string, m_logger, &memory);
}

Result<std::unique_ptr<Host>, Manifest_Error> make_host(const Host_Options& options, Logger& logger)
{
    return finish_host(std::make_unique<Host>(options, logger), options);
}

Result<std::unique_ptr<Host>, Manifest_Error> make_host(const Host_Options& options)
{
    return finish_host(std::make_unique<Host>(options), options);
}

} // namespace arborium
