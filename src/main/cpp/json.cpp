#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "ulight/json.hpp"

#include "arborium/util/assert.hpp"

#include "arborium/json.hpp"

namespace arborium::json {
namespace {

/// @brief An array or object whose closing bracket has not been reached yet.
struct Open_Container {
    Value value;
    /// @brief For objects, the key of the member whose value is being parsed.
    String key;
};

/// @brief Assembles a `Value` from the events of the ulight JSON parser.
struct Document_Builder final : ulight::JSON_Visitor {
    using Pos = ulight::Source_Position;

    std::pmr::memory_resource* memory;
    std::pmr::vector<Open_Container> open;
    std::optional<Value> document;
    /// @brief The contents of the string or property name being parsed.
    String text;

    explicit Document_Builder(std::pmr::memory_resource* memory)
        : memory { memory }
        , open { memory }
        , text { memory }
    {
    }

    void literal(const Pos&, std::u8string_view chars) final
    {
        text += chars;
    }

    void escape(const Pos&, std::u8string_view, char32_t, std::u8string_view code_units) final
    {
        text += code_units;
    }

    void number(const Pos&, std::u8string_view, double) final
    {
        close_value(Value { Scalar {} });
    }

    void null(const Pos&) final
    {
        close_value(Value { Scalar {} });
    }

    void boolean(const Pos&, bool) final
    {
        close_value(Value { Scalar {} });
    }

    void push_string(const Pos&) final
    {
        text.clear();
    }

    void pop_string(const Pos&) final
    {
        close_value(Value { String { text, memory } });
    }

    void push_property(const Pos&) final
    {
        text.clear();
    }

    void pop_property(const Pos&) final
    {
        ARBORIUM_ASSERT(!open.empty());
        open.back().key = text;
    }

    void push_object(const Pos&) final
    {
        open.push_back({ .value = Value { Object { memory } }, .key = String { memory } });
    }

    void pop_object(const Pos&) final
    {
        close_container();
    }

    void push_array(const Pos&) final
    {
        open.push_back({ .value = Value { Array { memory } }, .key = String { memory } });
    }

    void pop_array(const Pos&) final
    {
        close_container();
    }

    void close_container()
    {
        ARBORIUM_ASSERT(!open.empty());
        Value container = std::move(open.back().value);
        open.pop_back();
        close_value(std::move(container));
    }

    /// @brief Places a completed value into the innermost open container,
    /// or makes it the document if no container is open.
    void close_value(Value&& value)
    {
        if (open.empty()) {
            document = std::move(value);
            return;
        }
        Open_Container& parent = open.back();
        if (Array* const array = std::get_if<Array>(&parent.value.data)) {
            array->push_back(std::move(value));
            return;
        }
        Object& object = std::get<Object>(parent.value.data);
        object.push_back({ .key = std::move(parent.key), .value = std::move(value) });
        parent.key = String { memory };
    }
};

} // namespace

const Value* find(const Object& object, std::u8string_view key) noexcept
{
    for (auto it = object.rbegin(); it != object.rend(); ++it) {
        if (it->key == key) {
            return &it->value;
        }
    }
    return nullptr;
}

std::optional<Value> parse(std::u8string_view source, std::pmr::memory_resource* memory)
{
    constexpr ulight::JSON_Options options { .allow_comments = true,
                                             .parse_numbers = true,
                                             .escapes = ulight::Escape_Parsing::parse_encode };
    Document_Builder builder { memory };
    if (!ulight::parse_json(builder, source, options)) {
        return {};
    }
    return std::move(builder.document);
}

} // namespace arborium::json
