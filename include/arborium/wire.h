#ifndef ARBORIUM_WIRE_H
#define ARBORIUM_WIRE_H

// Binary layout of the values exchanged between the host and a grammar module.
// All fields are little-endian and all records are 4-byte aligned in the module's linear memory.
// Pointers are offsets into that linear memory.
// Text offsets are measured in UTF-16 code units of the highlighted source.

#include <stdint.h> // NOLINT(modernize-deprecated-headers)

#ifdef __cplusplus
extern "C" {
#endif

/// @brief The version of this layout.
/// A module reports the version it was built against through its `wire-version` export,
/// and the host refuses modules whose version differs.
#define ARBORIUM_WIRE_VERSION 1

/// @brief The version of the capability interface that the host provides handlers for.
/// Imports are resolved both under the unversioned module names (e.g. `wasi:cli/exit`)
/// and under names carrying this suffix (e.g. `wasi:cli/exit@0.2.3`).
#define ARBORIUM_INTERFACE_VERSION "0.2.3"

// NOLINTNEXTLINE(performance-enum-size)
enum arborium_wire_result_tag {
    /// @brief The module produced spans and injections.
    ARBORIUM_WIRE_RESULT_OK = 0,
    /// @brief The module failed to parse the text and produced a message.
    ARBORIUM_WIRE_RESULT_ERROR = 1,
};

/// @brief A highlight capture, such as `keyword` or `string.special`.
typedef struct arborium_wire_span {
    uint32_t start;
    uint32_t end;
    /// @brief UTF-8 capture name.
    uint32_t capture_ptr;
    uint32_t capture_len;
} arborium_wire_span;

/// @brief A range of text written in another language, such as a `<script>` body in HTML.
typedef struct arborium_wire_injection {
    uint32_t start;
    uint32_t end;
    /// @brief UTF-8 language identifier.
    uint32_t language_ptr;
    uint32_t language_len;
} arborium_wire_injection;

typedef struct arborium_wire_ok {
    uint32_t spans_ptr;
    uint32_t spans_len;
    uint32_t injections_ptr;
    uint32_t injections_len;
} arborium_wire_ok;

typedef struct arborium_wire_error {
    /// @brief UTF-8 error message.
    uint32_t message_ptr;
    uint32_t message_len;
} arborium_wire_error;

/// @brief The value that the `highlight` export returns a pointer to.
typedef struct arborium_wire_result {
    /// @brief One of `arborium_wire_result_tag`.
    uint32_t tag;
    union {
        arborium_wire_ok ok;
        arborium_wire_error error;
    } payload;
} arborium_wire_result;

#ifdef __cplusplus
}
#endif

#endif
