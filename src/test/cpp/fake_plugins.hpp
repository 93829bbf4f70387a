#ifndef ARBORIUM_FAKE_PLUGINS_HPP
#define ARBORIUM_FAKE_PLUGINS_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <iterator>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"

#include "arborium/error.hpp"
#include "arborium/plugin.hpp"
#include "arborium/services.hpp"
#include "arborium/wire.hpp"

namespace arborium {

/// @brief What a `Fake_Plugin` does when asked to highlight.
struct Fake_Behavior {
    struct Capture {
        std::uint32_t start;
        std::uint32_t end;
        std::u8string_view name;
    };
    struct Injection {
        std::uint32_t start;
        std::uint32_t end;
        std::u8string_view language;
    };

    std::vector<Capture> captures {};
    std::vector<Injection> injections {};
    /// @brief If set, every call fails with this error instead of producing captures.
    std::optional<Host_Error> failure {};
    std::size_t malformed_records = 0;
};

struct Fake_Plugin final : Plugin {
    Fake_Behavior behavior;
    std::atomic<std::size_t> calls = 0;

    [[nodiscard]]
    explicit Fake_Plugin(const Fake_Behavior& behavior)
        : behavior { behavior }
    {
    }

    [[nodiscard]]
    Result<void, Host_Error> highlight(Raw_Parse_Result& out, std::u8string_view) final
    {
        ++calls;
        if (behavior.failure) {
            return *behavior.failure;
        }
        std::pmr::memory_resource* const memory = out.captures.get_allocator().resource();
        for (const Fake_Behavior::Capture& c : behavior.captures) {
            out.captures.push_back({
                .start = c.start,
                .end = c.end,
                .name = std::pmr::u8string { c.name, memory },
            });
        }
        for (const Fake_Behavior::Injection& i : behavior.injections) {
            out.injections.push_back({
                .start = i.start,
                .end = i.end,
                .language = std::pmr::u8string { i.language, memory },
            });
        }
        out.malformed_records += behavior.malformed_records;
        return {};
    }
};

/// @brief Creates a `Fake_Plugin` per instantiation,
/// with the behavior registered for the language of the catalog entry.
struct Fake_Plugin_Factory final : Plugin_Factory {
private:
    mutable std::mutex m_mutex;
    std::map<std::u8string, Fake_Behavior, std::less<>> m_behaviors;
    std::vector<std::shared_ptr<Fake_Plugin>> m_created;

public:
    std::atomic<std::size_t> instantiations = 0;
    std::atomic<bool> fail_instantiation = false;
    /// @brief If set, `instantiate` throws `std::runtime_error` instead of returning.
    std::atomic<bool> throw_on_instantiation = false;

    void set_behavior(std::u8string_view language, const Fake_Behavior& behavior)
    {
        const std::scoped_lock lock { m_mutex };
        m_behaviors.insert_or_assign(std::u8string { language }, behavior);
    }

    [[nodiscard]]
    Result<std::shared_ptr<Plugin>, Host_Error>
    instantiate(std::span<const unsigned char>, const Catalog_Entry& entry) final
    {
        ++instantiations;
        if (throw_on_instantiation) {
            throw std::runtime_error("instantiation threw");
        }
        if (fail_instantiation) {
            return Host_Error::instantiation_failure;
        }
        const std::scoped_lock lock { m_mutex };
        const auto it = m_behaviors.find(entry.language);
        auto plugin = std::make_shared<Fake_Plugin>(
            it == m_behaviors.end() ? Fake_Behavior {} : it->second
        );
        m_created.push_back(plugin);
        return std::shared_ptr<Plugin> { plugin };
    }

    [[nodiscard]]
    std::size_t total_calls() const
    {
        const std::scoped_lock lock { m_mutex };
        std::size_t result = 0;
        for (const auto& plugin : m_created) {
            result += plugin->calls;
        }
        return result;
    }
};

/// @brief Serves a fixed byte sequence for every entry and counts fetches.
struct Counting_Fetcher final : Module_Fetcher {
    std::atomic<std::size_t> fetches = 0;
    std::atomic<bool> fail = false;
    std::chrono::milliseconds delay { 0 };

    [[nodiscard]]
    Result<void, IO_Error_Code>
    fetch(std::pmr::vector<unsigned char>& out, const Catalog_Entry&) final
    {
        ++fetches;
        if (delay != std::chrono::milliseconds { 0 }) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            return IO_Error_Code::cannot_open;
        }
        constexpr unsigned char magic[] { 0x00, 0x61, 0x73, 0x6d };
        out.insert(out.end(), std::begin(magic), std::end(magic));
        return {};
    }
};

} // namespace arborium

#endif
