#ifndef ARBORIUM_CAPABILITIES_HPP
#define ARBORIUM_CAPABILITIES_HPP

#include <cstdint>
#include <string_view>

#include <wasmtime.h>

#include "arborium/wasm.hpp"

#include "arborium/fwd.hpp"

namespace arborium {

/// @brief Seconds and nanoseconds since the Unix epoch,
/// as written by the wall clock handlers.
struct Wall_Clock_Time {
    std::uint64_t seconds;
    std::uint32_t nanoseconds;
};

/// @brief The granularity reported by the `resolution` handler of the wall clock.
inline constexpr Wall_Clock_Time wall_clock_resolution { .seconds = 0, .nanoseconds = 1'000'000 };

/// @brief The number of bytes that `check-write` reports as writable.
inline constexpr std::int64_t output_stream_write_budget = 1024 * 1024;

enum struct Import_Resolution : Default_Underlying {
    /// @brief A handler for the import exists.
    provided,
    /// @brief The import belongs to a known interface,
    /// but its version suffix does not match the supported interface version.
    unsupported_version,
    /// @brief There is no handler for the import.
    unknown,
    /// @brief A handler exists, but the import is not a function of the same type.
    mismatched_signature,
};

/// @brief Splits a module name such as `wasi:cli/exit@0.2.3` into the interface name
/// `wasi:cli/exit` and the version `0.2.3`.
/// If the name carries no version, the returned version is empty.
struct Interface_Name {
    std::string_view interface;
    std::string_view version;

    [[nodiscard]]
    static Interface_Name parse(std::string_view module_name) noexcept;
};

/// @brief The set of effect handlers that sandboxed modules can import.
///
/// Every handler is neutered except for the wall clock and randomness:
/// environment and arguments are empty, standard input is at its end,
/// output is discarded (but reported as fully written),
/// and there are no preopened directories.
/// A nonzero exit status traps the calling module.
/// Filesystem access beyond releasing handles is not provided at all,
/// so modules that need it fail to instantiate.
///
/// Each handler is defined under its unversioned interface name
/// as well as under the name suffixed with `@` and `interface_version`.
struct Capability_Environment {
private:
    wasm::Unique_Linker m_linker;

public:
    [[nodiscard]]
    explicit Capability_Environment(const wasm::Engine& engine);

    Capability_Environment(const Capability_Environment&) = delete;
    Capability_Environment& operator=(const Capability_Environment&) = delete;

    /// @brief Returns a linker which resolves all handlers.
    /// The linker is not modified after construction and can be used from multiple threads.
    [[nodiscard]]
    const wasmtime_linker_t* get_linker() const noexcept
    {
        return m_linker.get();
    }

    /// @brief Determines whether an import of a module can be satisfied.
    /// `type` is the type of the imported function, or null if the import is not a function.
    [[nodiscard]]
    static Import_Resolution resolve_import(
        std::string_view module_name,
        std::string_view name,
        const wasm_functype_t* type
    );
};

} // namespace arborium

#endif
