#ifndef ARBORIUM_JSON_HPP
#define ARBORIUM_JSON_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arborium::json {

struct Value;
struct Member;

/// @brief A `null`, boolean, or number.
/// Manifests never read these, so only their presence is kept.
struct Scalar { };

using String = std::pmr::u8string;
using Array = std::pmr::vector<Value>;
using Object = std::pmr::vector<Member>;

/// @brief A parsed JSON document, reduced to the structure that manifests are made of.
struct Value {
    std::variant<Scalar, String, Array, Object> data;

    [[nodiscard]]
    const String* as_string() const noexcept
    {
        return std::get_if<String>(&data);
    }

    [[nodiscard]]
    const Array* as_array() const noexcept
    {
        return std::get_if<Array>(&data);
    }

    [[nodiscard]]
    const Object* as_object() const noexcept
    {
        return std::get_if<Object>(&data);
    }
};

struct Member {
    String key;
    Value value;
};

/// @brief Returns the value of the member named `key`, or `nullptr` if there is none.
/// If `key` appears more than once, the last member wins.
[[nodiscard]]
const Value* find(const Object& object, std::u8string_view key) noexcept;

[[nodiscard]]
inline const String* find_string(const Object& object, std::u8string_view key) noexcept
{
    const Value* const value = find(object, key);
    return value ? value->as_string() : nullptr;
}

[[nodiscard]]
inline const Array* find_array(const Object& object, std::u8string_view key) noexcept
{
    const Value* const value = find(object, key);
    return value ? value->as_array() : nullptr;
}

/// @brief Parses `source` as JSON, where comments are permitted.
/// Returns `std::nullopt` if `source` is not valid JSON.
[[nodiscard]]
std::optional<Value> parse(std::u8string_view source, std::pmr::memory_resource* memory);

} // namespace arborium::json

#endif
