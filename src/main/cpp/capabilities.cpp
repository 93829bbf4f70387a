#include <algorithm>
#include <array>
#include <chrono>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <openssl/rand.h>
#include <wasmtime.h>

#include "arborium/util/assert.hpp"
#include "arborium/util/strings.hpp"

#include "arborium/capabilities.hpp"
#include "arborium/wasm.hpp"
#include "arborium/wire.hpp"

namespace arborium {
namespace {

constexpr std::int32_t stdin_handle = 0;
constexpr std::int32_t stdout_handle = 1;
constexpr std::int32_t stderr_handle = 2;

[[nodiscard]]
wasm_trap_t* make_trap(std::string_view message)
{
    return wasmtime_trap_new(message.data(), message.size());
}

void put_u32_le(unsigned char* out, std::uint32_t x)
{
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<unsigned char>(x >> (8 * i));
    }
}

void put_u64_le(unsigned char* out, std::uint64_t x)
{
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<unsigned char>(x >> (8 * i));
    }
}

[[nodiscard]]
std::optional<wasmtime_extern_t> caller_export(wasmtime_caller_t* caller, std::string_view name)
{
    wasmtime_extern_t item;
    if (!wasmtime_caller_export_get(caller, name.data(), name.size(), &item)) {
        return {};
    }
    return item;
}

/// @brief Copies `bytes` into the memory of the caller at `address`,
/// returning a trap if the caller has no memory or the destination is out of bounds.
[[nodiscard]]
wasm_trap_t*
store_bytes(wasmtime_caller_t* caller, std::uint32_t address, std::span<const unsigned char> bytes)
{
    const std::optional<wasmtime_extern_t> memory = caller_export(caller, "memory");
    if (!memory || memory->kind != WASMTIME_EXTERN_MEMORY) {
        return make_trap("the calling module exports no memory");
    }
    const std::span<unsigned char> data
        = wasm::memory_data(wasmtime_caller_context(caller), memory->of.memory);
    if (address > data.size() || bytes.size() > data.size() - address) {
        return make_trap("out of bounds memory access in capability handler");
    }
    std::memcpy(data.data() + address, bytes.data(), bytes.size());
    return nullptr;
}

[[nodiscard]]
wasm_trap_t* store_list(
    wasmtime_caller_t* caller,
    std::uint32_t address,
    std::uint32_t ptr,
    std::uint32_t len
)
{
    std::array<unsigned char, 8> record;
    put_u32_le(record.data(), ptr);
    put_u32_le(record.data() + 4, len);
    return store_bytes(caller, address, record);
}

[[nodiscard]]
wasm_trap_t* store_time(wasmtime_caller_t* caller, std::uint32_t address, Wall_Clock_Time time)
{
    std::array<unsigned char, 12> record;
    put_u64_le(record.data(), time.seconds);
    put_u32_le(record.data() + 8, time.nanoseconds);
    return store_bytes(caller, address, record);
}

/// @brief Fills `out` with cryptographically strong random bytes.
[[nodiscard]]
bool fill_random(std::span<unsigned char> out)
{
    while (!out.empty()) {
        const std::size_t chunk = std::min(out.size(), std::size_t(INT_MAX));
        if (RAND_bytes(out.data(), int(chunk)) != 1) {
            return false;
        }
        out = out.subspan(chunk);
    }
    return true;
}

[[nodiscard]]
std::uint32_t arg_u32(const wasmtime_val_t* args, std::size_t i)
{
    return static_cast<std::uint32_t>(args[i].of.i32);
}

// HANDLERS ========================================================================================

wasm_trap_t* get_empty_list(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    return store_list(caller, arg_u32(args, 0), 0, 0);
}

wasm_trap_t* exit_with_status(
    void*,
    wasmtime_caller_t*,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    const std::int32_t status = args[0].of.i32;
    if (status == 0) {
        return nullptr;
    }
    const std::string message = "plugin exited with status " + std::to_string(status);
    return make_trap(message);
}

template <std::int32_t handle>
wasm_trap_t* get_stream(
    void*,
    wasmtime_caller_t*,
    const wasmtime_val_t*,
    std::size_t,
    wasmtime_val_t* results,
    std::size_t
)
{
    results[0].kind = WASMTIME_I32;
    results[0].of.i32 = handle;
    return nullptr;
}

/// @brief Writes `ok(list<u8>)` with an empty list as a `result<list<u8>, stream-error>`.
wasm_trap_t* read_nothing(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    // tag at 0, list pointer at 4, list length at 8
    constexpr std::array<unsigned char, 12> record {};
    return store_bytes(caller, arg_u32(args, 2), record);
}

/// @brief Writes `ok(output_stream_write_budget)` as a `result<u64, stream-error>`.
wasm_trap_t* check_write(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    // tag at 0, u64 at 8
    std::array<unsigned char, 16> record {};
    put_u64_le(record.data() + 8, std::uint64_t(output_stream_write_budget));
    return store_bytes(caller, arg_u32(args, 1), record);
}

/// @brief Writes `ok` as a `result<_, stream-error>` to the last argument.
template <std::size_t retptr_index>
wasm_trap_t* succeed(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    constexpr std::array<unsigned char, 1> ok_tag {};
    return store_bytes(caller, arg_u32(args, retptr_index), ok_tag);
}

/// @brief Writes `none` as an `option<error-code>`.
wasm_trap_t* no_filesystem_error_code(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    constexpr std::array<unsigned char, 2> none_record {};
    return store_bytes(caller, arg_u32(args, 1), none_record);
}

wasm_trap_t*
no_op(void*, wasmtime_caller_t*, const wasmtime_val_t*, std::size_t, wasmtime_val_t*, std::size_t)
{
    return nullptr;
}

wasm_trap_t* wall_clock_now(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto nanoseconds
        = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
    const Wall_Clock_Time time {
        .seconds = std::uint64_t(seconds.count()),
        .nanoseconds = std::uint32_t(nanoseconds.count()),
    };
    return store_time(caller, arg_u32(args, 0), time);
}

wasm_trap_t* wall_clock_resolution(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    return store_time(caller, arg_u32(args, 0), wall_clock_resolution);
}

wasm_trap_t* get_random_bytes(
    void*,
    wasmtime_caller_t* caller,
    const wasmtime_val_t* args,
    std::size_t,
    wasmtime_val_t*,
    std::size_t
)
{
    const std::int64_t length = args[0].of.i64;
    const std::uint32_t retptr = arg_u32(args, 1);
    if (length < 0 || length > std::int64_t(UINT32_MAX)) {
        return make_trap("requested random byte count is out of range");
    }

    const std::optional<wasmtime_extern_t> memory = caller_export(caller, "memory");
    if (!memory || memory->kind != WASMTIME_EXTERN_MEMORY) {
        return make_trap("the calling module exports no memory");
    }
    wasmtime_context_t* const context = wasmtime_caller_context(caller);
    const auto size = std::size_t(length);
    if (size > wasm::memory_data(context, memory->of.memory).size()) {
        return make_trap("requested random byte count exceeds the memory of the calling module");
    }

    std::uint32_t address = 0;
    if (size != 0) {
        const std::optional<wasmtime_extern_t> realloc = caller_export(caller, "cabi_realloc");
        if (!realloc || realloc->kind != WASMTIME_EXTERN_FUNC) {
            return make_trap("the calling module exports no cabi_realloc");
        }
        const wasmtime_val_t realloc_args[] {
            { .kind = WASMTIME_I32, .of = { .i32 = 0 } },
            { .kind = WASMTIME_I32, .of = { .i32 = 0 } },
            { .kind = WASMTIME_I32, .of = { .i32 = 1 } },
            { .kind = WASMTIME_I32, .of = { .i32 = std::int32_t(std::uint32_t(size)) } },
        };
        wasmtime_val_t realloc_result[1];
        wasm_trap_t* trap = nullptr;
        const wasm::Unique_Error error { wasmtime_func_call(
            context, &realloc->of.func, realloc_args, 4, realloc_result, 1, &trap
        ) };
        if (trap) {
            // Propagating the trap unwinds the calling module as well.
            return trap;
        }
        if (error) {
            return make_trap("cabi_realloc could not be called");
        }
        address = static_cast<std::uint32_t>(realloc_result[0].of.i32);
    }

    // cabi_realloc may have grown the memory.
    const std::span<unsigned char> data = wasm::memory_data(context, memory->of.memory);
    if (address > data.size() || size > data.size() - address) {
        return make_trap("cabi_realloc returned an out of bounds allocation");
    }
    if (!fill_random(data.subspan(address, size))) {
        return make_trap("the host entropy source failed");
    }
    return store_list(caller, retptr, address, std::uint32_t(size));
}

wasm_trap_t* get_random_u64(
    void*,
    wasmtime_caller_t*,
    const wasmtime_val_t*,
    std::size_t,
    wasmtime_val_t* results,
    std::size_t
)
{
    std::array<unsigned char, 8> bytes;
    if (!fill_random(bytes)) {
        return make_trap("the host entropy source failed");
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        value |= std::uint64_t(bytes[i]) << (8 * i);
    }
    results[0].kind = WASMTIME_I64;
    results[0].of.i64 = std::int64_t(value);
    return nullptr;
}

// TABLE ===========================================================================================

constexpr std::span<const wasm_valkind_t> none {};
constexpr wasm_valkind_t i32_kinds[] { WASM_I32 };
constexpr wasm_valkind_t i64_kinds[] { WASM_I64 };
constexpr wasm_valkind_t i32_i32_kinds[] { WASM_I32, WASM_I32 };
constexpr wasm_valkind_t i64_i32_kinds[] { WASM_I64, WASM_I32 };
constexpr wasm_valkind_t i32_i64_i32_kinds[] { WASM_I32, WASM_I64, WASM_I32 };
constexpr wasm_valkind_t i32_i32_i32_i32_kinds[] { WASM_I32, WASM_I32, WASM_I32, WASM_I32 };

struct Handler {
    std::string_view interface;
    std::string_view function;
    std::span<const wasm_valkind_t> params;
    std::span<const wasm_valkind_t> results;
    wasmtime_func_callback_t callback;
};

// clang-format off
constexpr Handler handlers[] {
    { "wasi:cli/environment", "get-environment", i32_kinds, none, get_empty_list },
    { "wasi:cli/environment", "get-arguments", i32_kinds, none, get_empty_list },
    { "wasi:cli/exit", "exit", i32_kinds, none, exit_with_status },
    { "wasi:cli/stdin", "get-stdin", none, i32_kinds, get_stream<stdin_handle> },
    { "wasi:cli/stdout", "get-stdout", none, i32_kinds, get_stream<stdout_handle> },
    { "wasi:cli/stderr", "get-stderr", none, i32_kinds, get_stream<stderr_handle> },
    { "wasi:io/streams", "[method]input-stream.read", i32_i64_i32_kinds, none, read_nothing },
    { "wasi:io/streams", "[method]input-stream.blocking-read", i32_i64_i32_kinds, none, read_nothing },
    { "wasi:io/streams", "[method]output-stream.check-write", i32_i32_kinds, none, check_write },
    { "wasi:io/streams", "[method]output-stream.write", i32_i32_i32_i32_kinds, none, succeed<3> },
    { "wasi:io/streams", "[method]output-stream.blocking-write-and-flush", i32_i32_i32_i32_kinds, none, succeed<3> },
    { "wasi:io/streams", "[method]output-stream.blocking-flush", i32_i32_kinds, none, succeed<1> },
    { "wasi:io/streams", "[resource-drop]input-stream", i32_kinds, none, no_op },
    { "wasi:io/streams", "[resource-drop]output-stream", i32_kinds, none, no_op },
    { "wasi:io/error", "[resource-drop]error", i32_kinds, none, no_op },
    { "wasi:clocks/wall-clock", "now", i32_kinds, none, wall_clock_now },
    { "wasi:clocks/wall-clock", "resolution", i32_kinds, none, wall_clock_resolution },
    { "wasi:filesystem/preopens", "get-directories", i32_kinds, none, get_empty_list },
    { "wasi:filesystem/types", "[resource-drop]descriptor", i32_kinds, none, no_op },
    { "wasi:filesystem/types", "[resource-drop]directory-entry-stream", i32_kinds, none, no_op },
    { "wasi:filesystem/types", "filesystem-error-code", i32_i32_kinds, none, no_filesystem_error_code },
    { "wasi:random/random", "get-random-bytes", i64_i32_kinds, none, get_random_bytes },
    { "wasi:random/random", "get-random-u64", none, i64_kinds, get_random_u64 },
};
// clang-format on

void define(wasmtime_linker_t* linker, std::string_view module_name, const Handler& handler)
{
    const wasm::Unique_Functype type = wasm::make_functype(handler.params, handler.results);
    const wasm::Unique_Error error { wasmtime_linker_define_func(
        linker, module_name.data(), module_name.size(), handler.function.data(),
        handler.function.size(), type.get(), handler.callback, nullptr, nullptr
    ) };
    ARBORIUM_ASSERT(!error);
}

} // namespace

Interface_Name Interface_Name::parse(std::string_view module_name) noexcept
{
    const std::size_t at = module_name.rfind('@');
    if (at == std::string_view::npos) {
        return { .interface = module_name, .version = {} };
    }
    return { .interface = module_name.substr(0, at), .version = module_name.substr(at + 1) };
}

Capability_Environment::Capability_Environment(const wasm::Engine& engine)
    : m_linker { wasmtime_linker_new(engine.get()) }
{
    std::string versioned_name;
    for (const Handler& handler : handlers) {
        define(m_linker.get(), handler.interface, handler);

        versioned_name = handler.interface;
        versioned_name += '@';
        versioned_name += as_string_view(interface_version);
        define(m_linker.get(), versioned_name, handler);
    }
}

Import_Resolution Capability_Environment::resolve_import(
    std::string_view module_name,
    std::string_view name,
    const wasm_functype_t* type
)
{
    const auto [interface, version] = Interface_Name::parse(module_name);

    bool interface_known = false;
    const Handler* match = nullptr;
    for (const Handler& handler : handlers) {
        if (handler.interface == interface) {
            interface_known = true;
            if (handler.function == name) {
                match = &handler;
            }
        }
    }

    if (interface_known && !version.empty() && version != as_string_view(interface_version)) {
        return Import_Resolution::unsupported_version;
    }
    if (!match) {
        return Import_Resolution::unknown;
    }
    if (!type || !wasm::has_signature(*type, match->params, match->results)) {
        return Import_Resolution::mismatched_signature;
    }
    return Import_Resolution::provided;
}

} // namespace arborium
