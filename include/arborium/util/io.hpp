#ifndef ARBORIUM_IO_HPP
#define ARBORIUM_IO_HPP

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "ulight/function_ref.hpp"
#include "arborium/util/result.hpp"

#include "arborium/fwd.hpp"

namespace arborium {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An I/O error occurred while reading the file.";
    case IO_Error_Code::corrupted: return u8"The file is not properly encoded.";
    }
    return u8"Unknown I/O error.";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    constexpr Unique_File& operator=(Unique_File&& other) noexcept
    {
        swap(*this, other);
        other.close();
        return *this;
    }

    constexpr friend void swap(Unique_File& x, Unique_File& y) noexcept
    {
        std::swap(x.m_file, y.m_file);
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(m_file);
            m_file = nullptr;
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const char* path, const char* mode) noexcept
{
    return std::fopen(path, mode);
}

/// @brief Reads all bytes from a file and calls a given consumer with them, chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes.
/// The chunks may be located within the same underlying buffer,
/// so they should not be used after `consume_chunk` has been invoked.
/// @param path the file path
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    ulight::Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
);

/// @brief Reads all bytes from a file and appends them to a given vector.
/// @param path the file path
template <typename Byte, typename Alloc>
    requires(sizeof(Byte) == 1)
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes(std::vector<Byte, Alloc>& out, std::u8string_view path)
{
    return file_to_bytes_chunked(
        [&out](std::span<const std::byte> chunk) -> void {
            if (chunk.empty()) {
                return;
            }
            const std::size_t old_size = out.size();
            out.resize(out.size() + chunk.size());
            std::memcpy(out.data() + old_size, chunk.data(), chunk.size());
        },
        path
    );
}

/// @brief Reads a whole file and appends it to `out`,
/// failing with `IO_Error_Code::corrupted` if the file is not valid UTF-8.
[[nodiscard]]
Result<void, IO_Error_Code> load_utf8_file(std::pmr::vector<char8_t>& out, std::u8string_view path);

} // namespace arborium

#endif
