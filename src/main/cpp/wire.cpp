#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "arborium/util/unicode.hpp"

#include "arborium/wire.h"
#include "arborium/wire.hpp"

namespace arborium {
namespace {

[[nodiscard]]
bool is_in_bounds(std::span<const unsigned char> memory, std::uint64_t offset, std::uint64_t size)
{
    return offset <= memory.size() && size <= memory.size() - offset;
}

[[nodiscard]]
std::uint32_t load_u32_le(std::span<const unsigned char> memory, std::size_t offset)
{
    return std::uint32_t(memory[offset]) //
        | (std::uint32_t(memory[offset + 1]) << 8)
        | (std::uint32_t(memory[offset + 2]) << 16)
        | (std::uint32_t(memory[offset + 3]) << 24);
}

/// @brief Returns a view of the UTF-8 string `[ptr, ptr + len)` within `memory`,
/// or `std::nullopt` if the string is out of bounds or not valid UTF-8.
[[nodiscard]]
std::optional<std::u8string_view>
load_string(std::span<const unsigned char> memory, std::uint32_t ptr, std::uint32_t len)
{
    if (!is_in_bounds(memory, ptr, len)) {
        return {};
    }
    const std::u8string_view result { reinterpret_cast<const char8_t*>(memory.data() + ptr),
                                      len };
    if (!utf8::is_valid(result)) {
        return {};
    }
    return result;
}

/// @brief Assigns `str` to `out`,
/// with each ill-formed UTF-8 sequence replaced by U+FFFD REPLACEMENT CHARACTER.
void assign_or_replace_invalid(std::pmr::u8string& out, std::u8string_view str)
{
    if (utf8::is_valid(str)) {
        out.assign(str);
        return;
    }
    out.clear();
    while (!str.empty()) {
        const auto length = std::size_t(utf8::decode_and_length_or_replacement(str).length);
        const std::u8string_view sequence = str.substr(0, length);
        if (utf8::is_valid(sequence)) {
            out += sequence;
        }
        else {
            out += u8"\uFFFD";
        }
        str.remove_prefix(length);
    }
}

/// @brief The common shape of span and injection records.
struct Named_Range_Record {
    std::uint32_t start;
    std::uint32_t end;
    std::u8string_view name;
};

[[nodiscard]]
std::optional<Named_Range_Record>
load_named_range(std::span<const unsigned char> memory, std::size_t offset)
{
    const std::uint32_t name_ptr = load_u32_le(memory, offset + 8);
    const std::uint32_t name_len = load_u32_le(memory, offset + 12);
    const std::optional<std::u8string_view> name = load_string(memory, name_ptr, name_len);
    if (!name) {
        return {};
    }
    return Named_Range_Record {
        .start = load_u32_le(memory, offset),
        .end = load_u32_le(memory, offset + 4),
        .name = *name,
    };
}

} // namespace

Wire_Status decode_parse_result(
    Raw_Parse_Result& out,
    std::pmr::u8string& error_message,
    std::span<const unsigned char> memory,
    std::uint32_t result_ptr
)
{
    if (!is_in_bounds(memory, result_ptr, wire_result_size)) {
        return Wire_Status::malformed;
    }

    const std::uint32_t tag = load_u32_le(memory, result_ptr);
    if (tag == ARBORIUM_WIRE_RESULT_ERROR) {
        const std::uint32_t message_ptr = load_u32_le(memory, result_ptr + 4);
        const std::uint32_t message_len = load_u32_le(memory, result_ptr + 8);
        if (!is_in_bounds(memory, message_ptr, message_len)) {
            return Wire_Status::malformed;
        }
        const auto* const message = reinterpret_cast<const char8_t*>(memory.data() + message_ptr);
        assign_or_replace_invalid(error_message, { message, message_len });
        return Wire_Status::plugin_error;
    }
    if (tag != ARBORIUM_WIRE_RESULT_OK) {
        return Wire_Status::malformed;
    }

    const std::uint32_t spans_ptr = load_u32_le(memory, result_ptr + 4);
    const std::uint32_t spans_len = load_u32_le(memory, result_ptr + 8);
    const std::uint32_t injections_ptr = load_u32_le(memory, result_ptr + 12);
    const std::uint32_t injections_len = load_u32_le(memory, result_ptr + 16);

    const std::uint64_t spans_size = std::uint64_t(spans_len) * wire_span_size;
    const std::uint64_t injections_size = std::uint64_t(injections_len) * wire_injection_size;
    if (!is_in_bounds(memory, spans_ptr, spans_size)
        || !is_in_bounds(memory, injections_ptr, injections_size)) {
        return Wire_Status::malformed;
    }

    std::pmr::memory_resource* const memory_resource = out.captures.get_allocator().resource();

    out.captures.reserve(out.captures.size() + spans_len);
    for (std::uint32_t i = 0; i < spans_len; ++i) {
        const std::optional<Named_Range_Record> record
            = load_named_range(memory, spans_ptr + std::size_t(i) * wire_span_size);
        if (!record) {
            ++out.malformed_records;
            continue;
        }
        out.captures.push_back({
            .start = record->start,
            .end = record->end,
            .name = std::pmr::u8string { record->name, memory_resource },
        });
    }

    out.injections.reserve(out.injections.size() + injections_len);
    for (std::uint32_t i = 0; i < injections_len; ++i) {
        const std::optional<Named_Range_Record> record
            = load_named_range(memory, injections_ptr + std::size_t(i) * wire_injection_size);
        if (!record) {
            ++out.malformed_records;
            continue;
        }
        out.injections.push_back({
            .start = record->start,
            .end = record->end,
            .language = std::pmr::u8string { record->name, memory_resource },
        });
    }

    return Wire_Status::ok;
}

} // namespace arborium
