#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/registry.hpp"
#include "arborium/services.hpp"

namespace arborium {
namespace {

using In_Flight_Loads = std::map<std::u8string, std::shared_future<Acquire_Result>, std::less<>>;

/// @brief Registers a load as in flight for the lifetime of this object.
/// If the load is abandoned because an exception propagates out of it,
/// the registration is removed and waiting callers receive `std::future_error`,
/// so that the next `acquire` starts a new load.
struct Scoped_Load {
private:
    std::mutex& m_mutex;
    In_Flight_Loads& m_in_flight;
    In_Flight_Loads::iterator m_entry;
    std::promise<Acquire_Result> m_promise;
    bool m_finished = false;

public:
    /// @brief The caller shall hold `mutex`.
    Scoped_Load(std::mutex& mutex, In_Flight_Loads& in_flight, const std::u8string& key)
        : m_mutex { mutex }
        , m_in_flight { in_flight }
    {
        m_entry = m_in_flight.emplace(key, m_promise.get_future().share()).first;
    }

    Scoped_Load(const Scoped_Load&) = delete;
    Scoped_Load& operator=(const Scoped_Load&) = delete;

    ~Scoped_Load()
    {
        if (!m_finished) {
            const std::scoped_lock lock { m_mutex };
            m_in_flight.erase(m_entry);
        }
    }

    /// @brief Removes the registration.
    /// The caller shall hold the mutex.
    void finish_locked()
    {
        m_in_flight.erase(m_entry);
        m_finished = true;
    }

    /// @brief Hands `result` to every caller waiting on this load.
    void publish(const Acquire_Result& result)
    {
        m_promise.set_value(result);
    }
};

} // namespace

std::u8string plugin_cache_key(const Catalog_Entry& entry)
{
    std::u8string result = entry.language;
    result += u8'@';
    result += entry.interface_version;
    return result;
}

Plugin_Registry::Plugin_Registry(
    Module_Catalog& catalog,
    Module_Fetcher& fetcher,
    Plugin_Factory& factory,
    Logger& logger
)
    : m_catalog { catalog }
    , m_fetcher { fetcher }
    , m_factory { factory }
    , m_logger { logger }
{
}

void Plugin_Registry::log_unknown_language(std::u8string_view language)
{
    if (!m_logger.can_log(Severity::error)) {
        return;
    }
    std::pmr::unsynchronized_pool_resource memory;
    std::pmr::u8string message { &memory };
    message += u8"No plugin is known for the language \"";
    message += language;
    message += u8"\".";
    if (const std::optional<Language_Suggestion> suggestion
        = m_catalog.suggest_language(language, &memory)) {
        message += u8" Did you mean \"";
        message += suggestion->language;
        message += u8"\"?";
    }
    try_log(m_logger, Severity::error, diagnostic::unknown_language, message);
}

Acquire_Result Plugin_Registry::acquire(std::u8string_view language)
{
    const std::optional<Catalog_Entry> entry = m_catalog.find(language);
    if (!entry) {
        log_unknown_language(language);
        return Host_Error::unknown_language;
    }
    std::u8string key = plugin_cache_key(*entry);

    std::unique_lock lock { m_mutex };
    if (const auto it = m_cache.find(key); it != m_cache.end()) {
        return it->second;
    }
    if (const auto it = m_in_flight.find(key); it != m_in_flight.end()) {
        std::shared_future<Acquire_Result> pending = it->second;
        lock.unlock();
        return pending.get();
    }
    Scoped_Load scoped_load { m_mutex, m_in_flight, key };
    lock.unlock();

    Acquire_Result result = load(*entry);

    lock.lock();
    scoped_load.finish_locked();
    if (result) {
        m_cache.insert_or_assign(std::move(key), *result);
    }
    lock.unlock();

    scoped_load.publish(result);
    return result;
}

Acquire_Result Plugin_Registry::load(const Catalog_Entry& entry)
{
    std::pmr::unsynchronized_pool_resource memory;
    std::pmr::vector<unsigned char> bytes { &memory };
    if (const Result<void, IO_Error_Code> r = m_fetcher.fetch(bytes, entry); !r) {
        std::pmr::u8string message { &memory };
        message += u8"Failed to fetch the module \"";
        message += entry.module_path;
        message += u8"\" for the language \"";
        message += entry.language;
        message += u8"\": ";
        message += io_error_code_message(r.error());
        try_log(m_logger, Severity::error, diagnostic::fetch_failed, message);
        return Host_Error::fetch_failure;
    }

    Acquire_Result result = m_factory.instantiate(bytes, entry);
    if (result && m_logger.can_log(Severity::debug)) {
        std::pmr::u8string message { &memory };
        message += u8"Loaded the plugin for the language \"";
        message += entry.language;
        message += u8"\".";
        try_log(m_logger, Severity::debug, diagnostic::plugin_loaded, message);
    }
    return result;
}

bool Plugin_Registry::discard(std::u8string_view language, const Plugin* plugin)
{
    const std::optional<Catalog_Entry> entry = m_catalog.find(language);
    if (!entry) {
        return false;
    }
    const std::u8string key = plugin_cache_key(*entry);

    {
        const std::scoped_lock lock { m_mutex };
        const auto it = m_cache.find(key);
        if (it == m_cache.end() || it->second.get() != plugin) {
            return false;
        }
        m_cache.erase(it);
    }

    if (m_logger.can_log(Severity::debug)) {
        std::u8string message = u8"Discarded the plugin for the language \"";
        message += entry->language;
        message += u8"\". It is instantiated again when next needed.";
        try_log(m_logger, Severity::debug, diagnostic::plugin_discarded, message);
    }
    return true;
}

bool Plugin_Registry::evict(std::u8string_view language)
{
    const std::optional<Catalog_Entry> entry = m_catalog.find(language);
    if (!entry) {
        return false;
    }
    const std::u8string key = plugin_cache_key(*entry);
    const std::scoped_lock lock { m_mutex };
    return m_cache.erase(key) != 0;
}

void Plugin_Registry::clear()
{
    const std::scoped_lock lock { m_mutex };
    m_cache.clear();
}

bool Plugin_Registry::contains(std::u8string_view language) const
{
    const std::optional<Catalog_Entry> entry = m_catalog.find(language);
    if (!entry) {
        return false;
    }
    const std::u8string key = plugin_cache_key(*entry);
    const std::scoped_lock lock { m_mutex };
    return m_cache.contains(key);
}

std::size_t Plugin_Registry::size() const
{
    const std::scoped_lock lock { m_mutex };
    return m_cache.size();
}

} // namespace arborium
