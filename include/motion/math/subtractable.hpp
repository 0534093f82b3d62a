/**
 * @file subtractable.hpp
 * @brief Compile-time capability check for animated value types
 *
 * A spring interpolates between two values of T and adds a velocity term,
 * so T needs T - T, T + T and T * double, each yielding something
 * convertible back to T.
 */

#pragma once

#include <type_traits>
#include <utility>

namespace Math {

template <typename T, typename = void>
struct is_subtractable : std::false_type {};

template <typename T>
struct is_subtractable<T, std::void_t<
    decltype(std::declval<const T&>() - std::declval<const T&>()),
    decltype(std::declval<const T&>() + std::declval<const T&>()),
    decltype(std::declval<const T&>() * std::declval<double>())>>
    : std::integral_constant<bool,
        std::is_convertible_v<decltype(std::declval<const T&>() - std::declval<const T&>()), T> &&
        std::is_convertible_v<decltype(std::declval<const T&>() + std::declval<const T&>()), T> &&
        std::is_convertible_v<decltype(std::declval<const T&>() * std::declval<double>()), T>> {};

template <typename T>
inline constexpr bool is_subtractable_v = is_subtractable<T>::value;

} // namespace Math
