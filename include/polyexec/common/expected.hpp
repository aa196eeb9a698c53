#pragma once

#include <polyexec/common/extra_formatters.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace polyexec {

/// Tag to disambiguate construction from an error when T and E could be confused
struct UnexpectedT
{
};

inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<StorageT, Args...>)
        : data_{std::in_place_index<0>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<Tu>, Expected> &&
                 std::convertible_to<Tu, StorageT> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<Eu>, Expected> && std::convertible_to<Eu, E> &&
                 (std::is_void_v<T> || !std::convertible_to<Eu, StorageT>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value(), "Bad expected error access");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    /// Apply `func` to the contained value, if there is one; otherwise forward the error
    template <typename Func>
    constexpr auto transform(const Func& func) const {
        if constexpr (std::is_void_v<T>) {
            using ResT = std::invoke_result_t<Func>;
            if (!has_value()) {
                return Expected<ResT, E>{unexpected, error()};
            }
            if constexpr (std::is_void_v<ResT>) {
                func();
                return Expected<void, E>{};
            } else {
                return Expected<ResT, E>{std::in_place, func()};
            }
        } else {
            using ResT = std::invoke_result_t<Func, const T&>;
            if (!has_value()) {
                return Expected<ResT, E>{unexpected, error()};
            }
            if constexpr (std::is_void_v<ResT>) {
                func(value());
                return Expected<void, E>{};
            } else {
                return Expected<ResT, E>{std::in_place, func(value())};
            }
        }
    }

    /// Map the error, if there is one, into another error type
    template <typename Func>
    constexpr auto transform_error(const Func& func) const {
        using ErrResT = std::invoke_result_t<Func, const E&>;
        if (has_value()) {
            if constexpr (std::is_void_v<T>) {
                return Expected<void, ErrResT>{};
            } else {
                return Expected<T, ErrResT>{std::in_place, value()};
            }
        }
        return Expected<T, ErrResT>{unexpected, func(error())};
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StorageT, E> data_;
};

} // namespace polyexec

template <typename T, typename E>
struct fmt::formatter<::polyexec::Expected<T, E>> : ::polyexec::DebugFormatter
{
    auto format(const ::polyexec::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
