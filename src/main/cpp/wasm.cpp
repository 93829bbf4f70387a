#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <wasmtime.h>

#include "arborium/util/assert.hpp"
#include "arborium/util/result.hpp"

#include "arborium/wasm.hpp"

namespace arborium::wasm {
namespace {

/// @brief Appends the contents of `vec` to `out` and deletes `vec`.
/// A trailing null terminator, which some messages carry, is not appended.
void append_and_delete(std::pmr::u8string& out, wasm_byte_vec_t& vec)
{
    std::size_t size = vec.size;
    if (size != 0 && vec.data[size - 1] == '\0') {
        --size;
    }
    out.append(reinterpret_cast<const char8_t*>(vec.data), size);
    wasm_byte_vec_delete(&vec);
}

void tick_until_stopped(
    wasm_engine_t* engine,
    std::chrono::nanoseconds interval,
    const std::stop_token& stop
)
{
    std::mutex mutex;
    std::condition_variable_any condition;
    std::unique_lock lock { mutex };
    while (!stop.stop_requested()) {
        // The predicate never holds, so this only returns on timeout or on a stop request.
        condition.wait_for(lock, stop, interval, [] { return false; });
        if (stop.stop_requested()) {
            break;
        }
        wasmtime_engine_increment_epoch(engine);
    }
}

[[nodiscard]]
bool kinds_match(const wasm_valtype_vec_t& types, std::span<const wasm_valkind_t> kinds)
{
    if (types.size != kinds.size()) {
        return false;
    }
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        if (wasm_valtype_kind(types.data[i]) != kinds[i]) {
            return false;
        }
    }
    return true;
}

void make_valtype_vec(wasm_valtype_vec_t& out, std::span<const wasm_valkind_t> kinds)
{
    std::vector<wasm_valtype_t*> types;
    types.reserve(kinds.size());
    for (const wasm_valkind_t kind : kinds) {
        types.push_back(wasm_valtype_new(kind));
    }
    wasm_valtype_vec_new(&out, types.size(), types.data());
}

} // namespace

void append_message(std::pmr::u8string& out, const wasmtime_error_t& error)
{
    wasm_name_t message;
    wasmtime_error_message(&error, &message);
    append_and_delete(out, message);
}

void append_message(std::pmr::u8string& out, const wasm_trap_t& trap)
{
    wasm_message_t message;
    wasm_trap_message(&trap, &message);
    append_and_delete(out, message);
}

bool is_interrupt(const wasm_trap_t& trap)
{
    wasmtime_trap_code_t code;
    return wasmtime_trap_code(&trap, &code) && code == WASMTIME_TRAP_CODE_INTERRUPT;
}

Unique_Functype
make_functype(std::span<const wasm_valkind_t> params, std::span<const wasm_valkind_t> results)
{
    wasm_valtype_vec_t param_types;
    wasm_valtype_vec_t result_types;
    make_valtype_vec(param_types, params);
    make_valtype_vec(result_types, results);
    // Takes ownership of both vectors.
    return Unique_Functype { wasm_functype_new(&param_types, &result_types) };
}

bool has_signature(
    const wasm_functype_t& type,
    std::span<const wasm_valkind_t> params,
    std::span<const wasm_valkind_t> results
)
{
    return kinds_match(*wasm_functype_params(&type), params)
        && kinds_match(*wasm_functype_results(&type), results);
}

bool has_signature(
    wasmtime_context_t* context,
    const wasmtime_func_t& func,
    std::span<const wasm_valkind_t> params,
    std::span<const wasm_valkind_t> results
)
{
    const Unique_Functype type { wasmtime_func_type(context, &func) };
    return has_signature(*type, params, results);
}

std::span<unsigned char> memory_data(wasmtime_context_t* context, const wasmtime_memory_t& memory)
{
    return { wasmtime_memory_data(context, &memory), wasmtime_memory_data_size(context, &memory) };
}

Call_Status call(
    wasmtime_context_t* context,
    const wasmtime_func_t& func,
    std::span<const wasmtime_val_t> args,
    std::span<wasmtime_val_t> results,
    std::pmr::u8string& message
)
{
    wasm_trap_t* raw_trap = nullptr;
    const Unique_Error error { wasmtime_func_call(
        context, &func, args.data(), args.size(), results.data(), results.size(), &raw_trap
    ) };
    const Unique_Trap trap { raw_trap };
    if (error) {
        append_message(message, *error);
        return Call_Status::error;
    }
    if (trap) {
        append_message(message, *trap);
        return is_interrupt(*trap) ? Call_Status::timeout : Call_Status::trap;
    }
    return Call_Status::ok;
}

Engine::Engine(std::chrono::nanoseconds epoch_interval)
    : m_epoch_interval { epoch_interval }
{
    ARBORIUM_ASSERT(epoch_interval > std::chrono::nanoseconds::zero());

    wasm_config_t* const config = wasm_config_new();
    wasmtime_config_epoch_interruption_set(config, true);
    // Takes ownership of the config.
    m_engine.reset(wasm_engine_new_with_config(config));
    ARBORIUM_ASSERT(m_engine);

    m_ticker = std::jthread { [engine = m_engine.get(), epoch_interval](std::stop_token stop) {
        tick_until_stopped(engine, epoch_interval, stop);
    } };
}

std::uint64_t Engine::ticks_for(std::chrono::nanoseconds timeout) const noexcept
{
    if (timeout <= std::chrono::nanoseconds::zero()) {
        return 1;
    }
    const auto ticks = std::uint64_t(
        (timeout.count() + m_epoch_interval.count() - 1) / m_epoch_interval.count()
    );
    // The epoch may advance right after the deadline is set,
    // so one extra tick guarantees that at least `timeout` passes.
    return ticks + 1;
}

Result<Module, Unique_Error>
Module::compile(const Engine& engine, std::span<const unsigned char> bytes)
{
    wasmtime_module_t* module = nullptr;
    Unique_Error error { wasmtime_module_new(engine.get(), bytes.data(), bytes.size(), &module) };
    if (error) {
        return std::move(error);
    }
    return Module { Unique_Module { module } };
}

Result<std::vector<unsigned char>, Unique_Error> wat_to_wasm(std::string_view wat)
{
    wasm_byte_vec_t bytes;
    Unique_Error error { wasmtime_wat2wasm(wat.data(), wat.size(), &bytes) };
    if (error) {
        return std::move(error);
    }
    std::vector<unsigned char> result(bytes.data, bytes.data + bytes.size);
    wasm_byte_vec_delete(&bytes);
    return result;
}

} // namespace arborium::wasm
