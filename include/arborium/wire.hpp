#ifndef ARBORIUM_WIRE_HPP
#define ARBORIUM_WIRE_HPP

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "arborium/wire.h"

#include "arborium/fwd.hpp"

namespace arborium {

inline constexpr std::int32_t wire_version = ARBORIUM_WIRE_VERSION;

/// @brief The interface version of the capability handlers provided by the host.
inline constexpr std::u8string_view interface_version = u8"" ARBORIUM_INTERFACE_VERSION;

inline constexpr std::size_t wire_result_size = 20;
inline constexpr std::size_t wire_span_size = 16;
inline constexpr std::size_t wire_injection_size = 16;

static_assert(sizeof(arborium_wire_result) == wire_result_size);
static_assert(sizeof(arborium_wire_span) == wire_span_size);
static_assert(sizeof(arborium_wire_injection) == wire_injection_size);

/// @brief A capture as emitted by a plugin.
/// The offsets are UTF-16 code units and have not been validated against the source text.
struct Raw_Capture {
    std::uint32_t start;
    std::uint32_t end;
    std::pmr::u8string name;
};

/// @brief An injection as emitted by a plugin.
/// The offsets are UTF-16 code units and have not been validated against the source text.
struct Raw_Injection {
    std::uint32_t start;
    std::uint32_t end;
    std::pmr::u8string language;
};

struct Raw_Parse_Result {
    std::pmr::vector<Raw_Capture> captures;
    std::pmr::vector<Raw_Injection> injections;
    /// @brief The number of span or injection records that could not be read,
    /// for example because their name lies outside of the module's memory.
    /// Such records are not contained in `captures` or `injections`.
    std::size_t malformed_records = 0;

    [[nodiscard]]
    explicit Raw_Parse_Result(std::pmr::memory_resource* memory)
        : captures { memory }
        , injections { memory }
    {
    }

    void clear()
    {
        captures.clear();
        injections.clear();
        malformed_records = 0;
    }
};

enum struct Wire_Status : Default_Underlying {
    /// @brief The result was decoded into a `Raw_Parse_Result`.
    ok,
    /// @brief The module reported an error, whose message was decoded.
    plugin_error,
    /// @brief The result structure itself could not be read.
    /// Nothing was decoded.
    malformed,
};

/// @brief Decodes the `arborium_wire_result` located at `result_ptr` within `memory`.
/// Every pointer and length within the result is bounds-checked against `memory`.
/// Individual span and injection records that cannot be read are skipped and counted in
/// `out.malformed_records`,
/// whereas an unreadable header or record array results in `Wire_Status::malformed`.
/// @param out Receives captures and injections if `Wire_Status::ok` is returned.
/// @param error_message Receives the module's message if `Wire_Status::plugin_error` is returned.
/// @param memory The linear memory of the module.
/// @param result_ptr The value returned by the module's `highlight` export.
[[nodiscard]]
Wire_Status decode_parse_result(
    Raw_Parse_Result& out,
    std::pmr::u8string& error_message,
    std::span<const unsigned char> memory,
    std::uint32_t result_ptr
);

} // namespace arborium

#endif
