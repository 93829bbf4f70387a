#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <wasmtime.h>

#include "arborium/util/assert.hpp"
#include "arborium/util/result.hpp"
#include "arborium/util/strings.hpp"

#include "arborium/capabilities.hpp"
#include "arborium/diagnostic.hpp"
#include "arborium/error.hpp"
#include "arborium/services.hpp"
#include "arborium/wasm.hpp"
#include "arborium/wasm_plugin.hpp"
#include "arborium/wire.hpp"

namespace arborium {
namespace {

constexpr wasm_valkind_t i32_kinds[] { WASM_I32 };
constexpr wasm_valkind_t i32_i32_kinds[] { WASM_I32, WASM_I32 };
constexpr wasm_valkind_t i32_i32_i32_i32_kinds[] { WASM_I32, WASM_I32, WASM_I32, WASM_I32 };
constexpr std::span<const wasm_valkind_t> none {};

[[nodiscard]]
wasmtime_val_t i32_value(std::uint32_t x)
{
    return { .kind = WASMTIME_I32, .of = { .i32 = static_cast<std::int32_t>(x) } };
}

void append(std::pmr::u8string& out, std::string_view text)
{
    out += as_u8string_view(text);
}

[[nodiscard]]
std::optional<wasmtime_func_t> find_func(
    wasmtime_context_t* context,
    const wasmtime_instance_t& instance,
    std::string_view name,
    std::span<const wasm_valkind_t> params,
    std::span<const wasm_valkind_t> results
)
{
    wasmtime_extern_t item;
    if (!wasmtime_instance_export_get(context, &instance, name.data(), name.size(), &item)) {
        return {};
    }
    if (item.kind != WASMTIME_EXTERN_FUNC) {
        wasmtime_extern_delete(&item);
        return {};
    }
    if (!wasm::has_signature(context, item.of.func, params, results)) {
        return {};
    }
    return item.of.func;
}

[[nodiscard]]
std::optional<wasmtime_memory_t>
find_memory(wasmtime_context_t* context, const wasmtime_instance_t& instance)
{
    constexpr std::string_view name = "memory";
    wasmtime_extern_t item;
    if (!wasmtime_instance_export_get(context, &instance, name.data(), name.size(), &item)) {
        return {};
    }
    if (item.kind != WASMTIME_EXTERN_MEMORY) {
        wasmtime_extern_delete(&item);
        return {};
    }
    return item.of.memory;
}

struct Instantiation {
    const wasm::Engine& engine;
    const Capability_Environment& capabilities;
    Logger& logger;
    const Sandbox_Limits& limits;
    const Catalog_Entry& entry;
    std::pmr::u8string message {};

    void log(std::u8string_view id)
    {
        try_log(logger, Severity::error, id, message);
        message.clear();
    }

    void begin_message()
    {
        message.clear();
        message += u8"Plugin for \"";
        message += entry.language;
        message += u8"\": ";
    }

    /// @brief Reports every import that the capability environment cannot satisfy.
    /// Returns `true` if all imports can be satisfied.
    [[nodiscard]]
    bool check_imports(const wasm::Module& module)
    {
        wasm_importtype_vec_t imports;
        wasmtime_module_imports(module.get(), &imports);

        bool all_provided = true;
        for (std::size_t i = 0; i < imports.size; ++i) {
            const wasm_name_t* const module_name = wasm_importtype_module(imports.data[i]);
            const wasm_name_t* const name = wasm_importtype_name(imports.data[i]);
            const std::string_view module_string { module_name->data, module_name->size };
            const std::string_view name_string { name->data, name->size };

            const wasm_functype_t* const type
                = wasm_externtype_as_functype_const(wasm_importtype_type(imports.data[i]));

            const Import_Resolution resolution
                = Capability_Environment::resolve_import(module_string, name_string, type);
            if (resolution == Import_Resolution::provided) {
                continue;
            }
            all_provided = false;
            begin_message();
            const bool is_version = resolution == Import_Resolution::unsupported_version;
            switch (resolution) {
            case Import_Resolution::unsupported_version:
                message += u8"unsupported interface version in import \"";
                break;
            case Import_Resolution::mismatched_signature:
                message += u8"mismatched signature in import \"";
                break;
            default: message += u8"no capability handler for import \""; break;
            }
            append(message, module_string);
            message += u8"\" \"";
            append(message, name_string);
            message += u8"\".";
            log(is_version ? diagnostic::instantiate_version : diagnostic::instantiate_import);
        }

        wasm_importtype_vec_delete(&imports);
        return all_provided;
    }

    /// @brief Maps the outcome of a call made during instantiation to a result.
    [[nodiscard]]
    bool check_call(wasm::Call_Status status, std::u8string_view export_name)
    {
        if (status == wasm::Call_Status::ok) {
            return true;
        }
        std::pmr::u8string details = std::move(message);
        begin_message();
        message += export_name;
        message += status == wasm::Call_Status::timeout ? u8" timed out: " : u8" failed: ";
        message += details;
        log(diagnostic::instantiate_failed);
        return false;
    }

    [[nodiscard]]
    Result<std::shared_ptr<Plugin>, Host_Error> run(std::span<const unsigned char> bytes)
    {
        if (!entry.interface_version.empty() && entry.interface_version != interface_version) {
            begin_message();
            message += u8"the module was built against interface version ";
            message += entry.interface_version;
            message += u8", but only ";
            message += interface_version;
            message += u8" is supported.";
            log(diagnostic::instantiate_version);
            return Host_Error::instantiation_failure;
        }

        Result<wasm::Module, wasm::Unique_Error> module = wasm::Module::compile(engine, bytes);
        if (!module) {
            begin_message();
            message += u8"the module could not be compiled: ";
            wasm::append_message(message, *module.error());
            log(diagnostic::instantiate_compile);
            return Host_Error::instantiation_failure;
        }

        if (!check_imports(*module)) {
            return Host_Error::instantiation_failure;
        }

        wasm::Unique_Store store { wasmtime_store_new(engine.get(), nullptr, nullptr) };
        wasmtime_store_limiter(store.get(), std::int64_t(limits.max_memory_bytes), -1, -1, -1, -1);
        wasmtime_context_t* const context = wasmtime_store_context(store.get());
        const std::uint64_t deadline_ticks = engine.ticks_for(limits.call_timeout);

        // Instantiation runs the start function of the module, if any.
        wasmtime_context_set_epoch_deadline(context, deadline_ticks);
        wasmtime_instance_t instance;
        wasm_trap_t* raw_trap = nullptr;
        const wasm::Unique_Error error { wasmtime_linker_instantiate(
            capabilities.get_linker(), context, module->get(), &instance, &raw_trap
        ) };
        const wasm::Unique_Trap trap { raw_trap };
        if (error || trap) {
            begin_message();
            message += u8"instantiation failed: ";
            if (error) {
                wasm::append_message(message, *error);
            }
            else {
                wasm::append_message(message, *trap);
            }
            log(diagnostic::instantiate_failed);
            return Host_Error::instantiation_failure;
        }

        const std::optional<wasmtime_memory_t> memory = find_memory(context, instance);
        const std::optional<wasmtime_func_t> cabi_realloc
            = find_func(context, instance, "cabi_realloc", i32_i32_i32_i32_kinds, i32_kinds);
        const std::optional<wasmtime_func_t> highlight
            = find_func(context, instance, "highlight", i32_i32_kinds, i32_kinds);
        const std::optional<wasmtime_func_t> version
            = find_func(context, instance, "wire-version", none, i32_kinds);
        if (!memory || !cabi_realloc || !highlight || !version) {
            begin_message();
            message += u8"the module does not export all of memory, cabi_realloc, highlight, and "
                       u8"wire-version with the expected types.";
            log(diagnostic::instantiate_export);
            return Host_Error::instantiation_failure;
        }

        if (const std::optional<wasmtime_func_t> initialize
            = find_func(context, instance, "_initialize", none, none)) {
            wasmtime_context_set_epoch_deadline(context, deadline_ticks);
            message.clear();
            const wasm::Call_Status status = wasm::call(context, *initialize, {}, {}, message);
            if (!check_call(status, u8"_initialize")) {
                return Host_Error::instantiation_failure;
            }
        }

        wasmtime_context_set_epoch_deadline(context, deadline_ticks);
        wasmtime_val_t version_result[1];
        message.clear();
        const wasm::Call_Status version_status
            = wasm::call(context, *version, {}, version_result, message);
        if (!check_call(version_status, u8"wire-version")) {
            return Host_Error::instantiation_failure;
        }
        if (version_result[0].of.i32 != wire_version) {
            begin_message();
            message += u8"the module uses wire version ";
            append(message, std::to_string(version_result[0].of.i32));
            message += u8", but the host uses wire version ";
            append(message, std::to_string(wire_version));
            message += u8'.';
            log(diagnostic::instantiate_version);
            return Host_Error::instantiation_failure;
        }

        const Wasm_Plugin_Exports exports {
            .memory = *memory,
            .cabi_realloc = *cabi_realloc,
            .highlight = *highlight,
            .post_highlight = find_func(context, instance, "cabi_post_highlight", i32_kinds, none),
        };
        return std::make_shared<Wasm_Plugin>(
            std::move(store), exports, entry.language, logger, deadline_ticks,
            limits.max_memory_bytes
        );
    }
};

} // namespace

Wasm_Plugin::Wasm_Plugin(
    wasm::Unique_Store store,
    const Wasm_Plugin_Exports& exports,
    std::u8string_view language,
    Logger& logger,
    std::uint64_t deadline_ticks,
    std::size_t max_memory_bytes
)
    : m_store { std::move(store) }
    , m_exports { exports }
    , m_language { language }
    , m_logger { logger }
    , m_deadline_ticks { deadline_ticks }
    // The text must fit into the memory of the module and its 32-bit address space.
    , m_max_source_bytes { std::min(max_memory_bytes, std::size_t(UINT32_MAX)) }
{
}

Result<void, Host_Error> Wasm_Plugin::call(
    const wasmtime_func_t& func,
    std::span<const wasmtime_val_t> args,
    std::span<wasmtime_val_t> results,
    std::u8string_view export_name
)
{
    wasmtime_context_t* const context = wasmtime_store_context(m_store.get());
    wasmtime_context_set_epoch_deadline(context, m_deadline_ticks);

    std::pmr::u8string details;
    const wasm::Call_Status status = wasm::call(context, func, args, results, details);
    if (status == wasm::Call_Status::ok) {
        return {};
    }

    // After a trap, the state of the instance is undefined.
    m_poisoned = true;

    const bool timed_out = status == wasm::Call_Status::timeout;
    std::pmr::u8string message;
    message += u8"Plugin for \"";
    message += m_language;
    message += u8"\": ";
    message += export_name;
    message += timed_out ? u8" exceeded the call timeout: " : u8" trapped: ";
    message += details;
    try_log(
        m_logger, Severity::error,
        timed_out ? diagnostic::execute_timeout : diagnostic::execute_trap, message
    );
    return Host_Error::execution_trap;
}

Result<void, Host_Error> Wasm_Plugin::highlight(Raw_Parse_Result& out, std::u8string_view source)
{
    const std::scoped_lock lock { m_mutex };
    if (m_poisoned) {
        return Host_Error::execution_trap;
    }

    wasmtime_context_t* const context = wasmtime_store_context(m_store.get());

    if (source.size() > m_max_source_bytes) {
        std::pmr::u8string message;
        message += u8"Plugin for \"";
        message += m_language;
        message += u8"\": the source text of ";
        append(message, std::to_string(source.size()));
        message += u8" bytes does not fit into the memory of the module.";
        try_log(m_logger, Severity::error, diagnostic::input_too_large, message);
        return Host_Error::input_too_large;
    }
    const auto source_size = std::uint32_t(source.size());

    std::uint32_t text_ptr = 0;
    if (source_size != 0) {
        const wasmtime_val_t realloc_args[] {
            i32_value(0),
            i32_value(0),
            i32_value(1),
            i32_value(source_size),
        };
        wasmtime_val_t realloc_result[1];
        if (auto r = call(m_exports.cabi_realloc, realloc_args, realloc_result, u8"cabi_realloc");
            !r) {
            return r;
        }
        text_ptr = static_cast<std::uint32_t>(realloc_result[0].of.i32);

        const std::span<unsigned char> memory = wasm::memory_data(context, m_exports.memory);
        if (text_ptr > memory.size() || source_size > memory.size() - text_ptr) {
            m_poisoned = true;
            try_log(
                m_logger, Severity::error, diagnostic::execute_trap,
                u8"cabi_realloc returned memory outside of the linear memory of the plugin."
            );
            return Host_Error::execution_trap;
        }
        std::memcpy(memory.data() + text_ptr, source.data(), source.size());
    }

    const wasmtime_val_t highlight_args[] { i32_value(text_ptr), i32_value(source_size) };
    wasmtime_val_t highlight_result[1];
    if (auto r = call(m_exports.highlight, highlight_args, highlight_result, u8"highlight"); !r) {
        return r;
    }
    const auto result_ptr = static_cast<std::uint32_t>(highlight_result[0].of.i32);

    std::pmr::u8string error_message { out.captures.get_allocator().resource() };
    const Wire_Status status = decode_parse_result(
        out, error_message, wasm::memory_data(context, m_exports.memory), result_ptr
    );

    if (m_exports.post_highlight) {
        const wasmtime_val_t post_args[] { i32_value(result_ptr) };
        if (auto r = call(*m_exports.post_highlight, post_args, {}, u8"cabi_post_highlight"); !r) {
            return r;
        }
    }

    switch (status) {
    case Wire_Status::ok: return {};

    case Wire_Status::plugin_error: {
        std::pmr::u8string message;
        message += u8"Plugin for \"";
        message += m_language;
        message += u8"\" reported an error: ";
        message += error_message;
        try_log(m_logger, Severity::warning, diagnostic::execute_plugin_error, message);
        return Host_Error::plugin_failure;
    }

    case Wire_Status::malformed: {
        std::pmr::u8string message;
        message += u8"Plugin for \"";
        message += m_language;
        message += u8"\" returned an unreadable result. The text is left unhighlighted.";
        try_log(m_logger, Severity::warning, diagnostic::output_malformed, message);
        out.clear();
        return {};
    }
    }
    ARBORIUM_ASSERT_UNREACHABLE(u8"Invalid wire status.");
}

Wasm_Plugin_Factory::Wasm_Plugin_Factory(
    const wasm::Engine& engine,
    const Capability_Environment& capabilities,
    Logger& logger,
    const Sandbox_Limits& limits
)
    : m_engine { engine }
    , m_capabilities { capabilities }
    , m_logger { logger }
    , m_limits { limits }
{
}

Result<std::shared_ptr<Plugin>, Host_Error>
Wasm_Plugin_Factory::instantiate(std::span<const unsigned char> bytes, const Catalog_Entry& entry)
{
    Instantiation instantiation {
        .engine = m_engine,
        .capabilities = m_capabilities,
        .logger = m_logger,
        .limits = m_limits,
        .entry = entry,
    };
    return instantiation.run(bytes);
}

} // namespace arborium
