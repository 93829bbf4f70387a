#include <cstddef>
#include <memory_resource>
#include <string_view>

#include "arborium/util/assert.hpp"
#include "arborium/util/unicode.hpp"

namespace arborium {

Utf16_Index::Utf16_Index(std::u8string_view source, std::pmr::memory_resource* memory)
    : m_offsets { memory }
{
    m_offsets.reserve(source.size() + 1);

    std::size_t byte_offset = 0;
    while (byte_offset < source.size()) {
        const auto [code_point, length]
            = utf8::decode_and_length_or_replacement(source.substr(byte_offset));
        ARBORIUM_ASSERT(length > 0);
        m_offsets.push_back(byte_offset);
        if (utf16::code_unit_count(code_point) == 2) {
            // The low surrogate of a pair starts in the middle of a code point.
            m_offsets.push_back(npos);
        }
        byte_offset += std::size_t(length);
    }
    m_offsets.push_back(source.size());
}

} // namespace arborium
