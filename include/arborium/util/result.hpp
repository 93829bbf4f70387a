#ifndef ARBORIUM_RESULT_HPP
#define ARBORIUM_RESULT_HPP

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

#include "arborium/util/assert.hpp"

namespace arborium {

/// @brief Either a value of type `T` or an error of type `E`.
/// Both alternatives are implicitly convertible to `Result`,
/// so that functions can simply `return value;` or `return error;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "The value and error type must be distinct.");

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_storage;

public:
    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
        : m_storage { std::in_place_index<0> }
    {
    }

    template <typename U = T>
        requires std::constructible_from<T, U&&>
                  && (!std::same_as<std::remove_cvref_t<U>, Result>)
                  && (!std::same_as<std::remove_cvref_t<U>, E>)
    [[nodiscard]]
    constexpr Result(U&& value) // NOLINT(google-explicit-constructor)
        : m_storage { std::in_place_index<0>, std::forward<U>(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error) // NOLINT(google-explicit-constructor)
        : m_storage { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error) // NOLINT(google-explicit-constructor)
        : m_storage { std::in_place_index<1>, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        ARBORIUM_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        ARBORIUM_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        ARBORIUM_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_storage));
    }

    [[nodiscard]]
    constexpr const E& error() const
    {
        ARBORIUM_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    template <typename U>
    [[nodiscard]]
    constexpr T value_or(U&& fallback) const&
    {
        return has_value() ? value() : T(std::forward<U>(fallback));
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&)
        = default;
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    E m_error {};
    bool m_has_value = true;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(const E& error) // NOLINT(google-explicit-constructor)
        : m_error { error }
        , m_has_value { false }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr const E& error() const
    {
        ARBORIUM_ASSERT(!m_has_value);
        return m_error;
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&)
        = default;
};

} // namespace arborium

#endif
