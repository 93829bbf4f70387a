#include <cstddef>
#include <cstdio>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ulight/function_ref.hpp"
#include "arborium/util/io.hpp"
#include "arborium/util/result.hpp"
#include "arborium/util/unicode.hpp"

#include "arborium/settings.hpp"

namespace arborium {

Result<void, IO_Error_Code> file_to_bytes_chunked(
    ulight::Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
)
{
    // fopen needs a null-terminated path.
    const std::string path_string { reinterpret_cast<const char*>(path.data()), path.size() };

    const Unique_File stream = fopen_unique(path_string.c_str(), "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::byte buffer[file_read_buffer_size];
    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, file_read_buffer_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        consume_chunk(std::span<const std::byte> { buffer, read_size });
    } while (read_size == file_read_buffer_size);

    return {};
}

Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path)
{
    const std::size_t initial_size = out.size();
    Result<void, IO_Error_Code> r = file_to_bytes(out, path);
    if (!r) {
        return r;
    }
    const std::u8string_view str { out.data() + initial_size, out.size() - initial_size };
    if (!utf8::is_valid(str)) {
        return IO_Error_Code::corrupted;
    }
    return {};
}

} // namespace arborium
