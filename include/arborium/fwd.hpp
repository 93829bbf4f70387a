#ifndef ARBORIUM_FWD_HPP
#define ARBORIUM_FWD_HPP

#include "arborium/settings.hpp"

ARBORIUM_IF_DEBUG() // silence unused warning for settings.hpp

namespace arborium {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define ARBORIUM_ENUM_STRING_CASE8(...)                                                            \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Capability_Environment;
struct Catalog_Entry;
struct Collected_Diagnostic;
struct Diagnostic;
struct Directory_Module_Fetcher;
struct Highlight_Invoker;
struct Highlighter;
struct Host;
enum struct Host_Error : Default_Underlying;
struct Host_Options;
struct Ignorant_Logger;
struct Injection_Span;
enum struct IO_Error_Code : Default_Underlying;
struct Logger;
struct Module_Catalog;
struct Module_Fetcher;
struct Plugin;
struct Plugin_Factory;
struct Plugin_Registry;
struct Raw_Capture;
struct Raw_Injection;
struct Raw_Parse_Result;
template <typename, typename>
struct Result;
struct Sandbox_Limits;
enum struct Severity : Default_Underlying;
struct Span;
struct Static_Catalog;
struct Stderr_Logger;
struct Utf16_Index;
struct Wasm_Plugin;
struct Wasm_Plugin_Factory;

namespace json {
struct Value;
struct Member;
struct Array;
struct Object;
} // namespace json

namespace wasm {
struct Engine;
struct Module;
} // namespace wasm

} // namespace arborium

#endif
