#ifndef ARBORIUM_WASM_HPP
#define ARBORIUM_WASM_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <wasmtime.h>

#include "arborium/util/result.hpp"

#include "arborium/fwd.hpp"

namespace arborium::wasm {

struct Error_Deleter {
    void operator()(wasmtime_error_t* error) const noexcept
    {
        wasmtime_error_delete(error);
    }
};

struct Trap_Deleter {
    void operator()(wasm_trap_t* trap) const noexcept
    {
        wasm_trap_delete(trap);
    }
};

struct Module_Deleter {
    void operator()(wasmtime_module_t* module) const noexcept
    {
        wasmtime_module_delete(module);
    }
};

struct Store_Deleter {
    void operator()(wasmtime_store_t* store) const noexcept
    {
        wasmtime_store_delete(store);
    }
};

struct Linker_Deleter {
    void operator()(wasmtime_linker_t* linker) const noexcept
    {
        wasmtime_linker_delete(linker);
    }
};

struct Engine_Deleter {
    void operator()(wasm_engine_t* engine) const noexcept
    {
        wasm_engine_delete(engine);
    }
};

struct Functype_Deleter {
    void operator()(wasm_functype_t* type) const noexcept
    {
        wasm_functype_delete(type);
    }
};

using Unique_Error = std::unique_ptr<wasmtime_error_t, Error_Deleter>;
using Unique_Trap = std::unique_ptr<wasm_trap_t, Trap_Deleter>;
using Unique_Module = std::unique_ptr<wasmtime_module_t, Module_Deleter>;
using Unique_Store = std::unique_ptr<wasmtime_store_t, Store_Deleter>;
using Unique_Linker = std::unique_ptr<wasmtime_linker_t, Linker_Deleter>;
using Unique_Functype = std::unique_ptr<wasm_functype_t, Functype_Deleter>;

/// @brief Appends the message of `error` to `out`.
void append_message(std::pmr::u8string& out, const wasmtime_error_t& error);

/// @brief Appends the message of `trap` to `out`.
void append_message(std::pmr::u8string& out, const wasm_trap_t& trap);

/// @brief Returns `true` if `trap` was raised because the epoch deadline of the store passed,
/// i.e. because the call took too long.
[[nodiscard]]
bool is_interrupt(const wasm_trap_t& trap);

/// @brief Creates a function type from the given parameter and result kinds.
[[nodiscard]]
Unique_Functype
make_functype(std::span<const wasm_valkind_t> params, std::span<const wasm_valkind_t> results);

/// @brief Returns `true` if `type` has exactly the given parameter and result kinds.
[[nodiscard]]
bool has_signature(
    const wasm_functype_t& type,
    std::span<const wasm_valkind_t> params,
    std::span<const wasm_valkind_t> results
);

/// @brief Returns `true` if `func` has exactly the given parameter and result kinds.
[[nodiscard]]
bool has_signature(
    wasmtime_context_t* context,
    const wasmtime_func_t& func,
    std::span<const wasm_valkind_t> params,
    std::span<const wasm_valkind_t> results
);

/// @brief Returns the current contents of `memory`.
/// The returned span is invalidated by any call into the store,
/// since memory may grow during the call.
[[nodiscard]]
std::span<unsigned char> memory_data(wasmtime_context_t* context, const wasmtime_memory_t& memory);

enum struct Call_Status : Default_Underlying {
    /// @brief The call returned normally.
    ok,
    /// @brief The call trapped.
    trap,
    /// @brief The call did not finish before the epoch deadline.
    timeout,
    /// @brief The call could not be made, for example because of mismatched arguments.
    error,
};

/// @brief Calls `func` and, if the call does not return normally,
/// appends a description of what happened to `message`.
[[nodiscard]]
Call_Status call(
    wasmtime_context_t* context,
    const wasmtime_func_t& func,
    std::span<const wasmtime_val_t> args,
    std::span<wasmtime_val_t> results,
    std::pmr::u8string& message
);

/// @brief Owns a `wasm_engine_t` with epoch interruption enabled,
/// along with a thread that advances the epoch at a fixed interval.
/// Stores created from this engine can then bound the duration of calls by setting a deadline
/// in epoch ticks.
struct Engine {
private:
    std::unique_ptr<wasm_engine_t, Engine_Deleter> m_engine;
    std::chrono::nanoseconds m_epoch_interval;
    // Declared last so that the thread stops before the engine is destroyed.
    std::jthread m_ticker;

public:
    [[nodiscard]]
    explicit Engine(std::chrono::nanoseconds epoch_interval);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]]
    wasm_engine_t* get() const noexcept
    {
        return m_engine.get();
    }

    [[nodiscard]]
    std::chrono::nanoseconds get_epoch_interval() const noexcept
    {
        return m_epoch_interval;
    }

    /// @brief Returns the number of epoch ticks that cover at least `timeout`.
    /// The result is at least one.
    [[nodiscard]]
    std::uint64_t ticks_for(std::chrono::nanoseconds timeout) const noexcept;
};

/// @brief A compiled module.
struct Module {
private:
    Unique_Module m_module;

public:
    [[nodiscard]]
    explicit Module(Unique_Module module) noexcept
        : m_module { std::move(module) }
    {
    }

    /// @brief Validates and compiles `bytes`.
    [[nodiscard]]
    static Result<Module, Unique_Error>
    compile(const Engine& engine, std::span<const unsigned char> bytes);

    [[nodiscard]]
    wasmtime_module_t* get() const noexcept
    {
        return m_module.get();
    }
};

/// @brief Converts WebAssembly text format into a binary module.
[[nodiscard]]
Result<std::vector<unsigned char>, Unique_Error> wat_to_wasm(std::string_view wat);

} // namespace arborium::wasm

#endif
