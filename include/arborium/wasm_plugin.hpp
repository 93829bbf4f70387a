#ifndef ARBORIUM_WASM_PLUGIN_HPP
#define ARBORIUM_WASM_PLUGIN_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <wasmtime.h>

#include "arborium/util/result.hpp"

#include "arborium/capabilities.hpp"
#include "arborium/error.hpp"
#include "arborium/fwd.hpp"
#include "arborium/plugin.hpp"
#include "arborium/services.hpp"
#include "arborium/wasm.hpp"
#include "arborium/wire.hpp"

namespace arborium {

struct Sandbox_Limits {
    /// @brief The time that a single call into a module may take,
    /// including instantiation and initialization.
    std::chrono::nanoseconds call_timeout = std::chrono::seconds { 10 };
    /// @brief The maximum size of the linear memory of one instance, in bytes.
    std::size_t max_memory_bytes = std::size_t(256) * 1024 * 1024;
};

/// @brief The exports of an instance that the host calls.
struct Wasm_Plugin_Exports {
    wasmtime_memory_t memory;
    wasmtime_func_t cabi_realloc;
    wasmtime_func_t highlight;
    std::optional<wasmtime_func_t> post_highlight;
};

/// @brief A grammar module instantiated in its own wasmtime store.
/// Calls are serialized by a per-instance mutex,
/// so different plugins can run concurrently.
struct Wasm_Plugin final : Plugin {
private:
    std::mutex m_mutex;
    wasm::Unique_Store m_store;
    Wasm_Plugin_Exports m_exports;
    std::u8string m_language;
    Logger& m_logger;
    std::uint64_t m_deadline_ticks;
    std::size_t m_max_source_bytes;
    bool m_poisoned = false;

public:
    /// @brief Takes ownership of `store`,
    /// which contains an instance that `exports` belong to.
    /// Source text longer than `max_memory_bytes` is rejected without calling the module.
    [[nodiscard]]
    Wasm_Plugin(
        wasm::Unique_Store store,
        const Wasm_Plugin_Exports& exports,
        std::u8string_view language,
        Logger& logger,
        std::uint64_t deadline_ticks,
        std::size_t max_memory_bytes
    );

    [[nodiscard]]
    Result<void, Host_Error> highlight(Raw_Parse_Result& out, std::u8string_view source) final;

    [[nodiscard]]
    std::u8string_view get_language() const noexcept
    {
        return m_language;
    }

private:
    [[nodiscard]]
    Result<void, Host_Error> call(
        const wasmtime_func_t& func,
        std::span<const wasmtime_val_t> args,
        std::span<wasmtime_val_t> results,
        std::u8string_view export_name
    );
};

struct Wasm_Plugin_Factory final : Plugin_Factory {
private:
    const wasm::Engine& m_engine;
    const Capability_Environment& m_capabilities;
    Logger& m_logger;
    Sandbox_Limits m_limits;

public:
    [[nodiscard]]
    Wasm_Plugin_Factory(
        const wasm::Engine& engine,
        const Capability_Environment& capabilities,
        Logger& logger,
        const Sandbox_Limits& limits = {}
    );

    /// @brief Compiles and instantiates a module that implements the wire contract.
    /// This includes checking that every import is provided by the capability environment,
    /// that the module reports the supported wire version,
    /// and running its `_initialize` export if it has one.
    [[nodiscard]]
    Result<std::shared_ptr<Plugin>, Host_Error>
    instantiate(std::span<const unsigned char> bytes, const Catalog_Entry& entry) final;
};

} // namespace arborium

#endif
