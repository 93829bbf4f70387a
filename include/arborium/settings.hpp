#ifndef ARBORIUM_SETTINGS_HPP
#define ARBORIUM_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define ARBORIUM_DEBUG 1
#define ARBORIUM_IF_DEBUG(...) __VA_ARGS__
#define ARBORIUM_IF_NOT_DEBUG(...)
#else // release builds
#define ARBORIUM_IF_DEBUG(...)
#define ARBORIUM_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define ARBORIUM_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define ARBORIUM_GCC 1
#endif

#define ARBORIUM_UNREACHABLE() __builtin_unreachable()

#define ARBORIUM_HOT ULIGHT_HOT
#define ARBORIUM_COLD ULIGHT_COLD

namespace arborium {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = ARBORIUM_IF_DEBUG(true) ARBORIUM_IF_NOT_DEBUG(false);

/// @brief The buffer size used when reading module artifacts and manifests from disk.
inline constexpr std::size_t file_read_buffer_size = 8192;

} // namespace arborium

#endif
