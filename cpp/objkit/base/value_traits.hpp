#pragma once
/*
================================================================================
Base: Value Traits
FILE: cpp/objkit/base/value_traits.hpp

Compile-time detection used to pick how a value is hashed and rendered:
  - is_string_like_v        convertible to std::string_view
  - has_member_to_string    v.to_string()
  - has_member_hash_code    v.hash_code() returning an integer
  - is_range                std::begin(v) / std::end(v)
  - is_streamable           os << v
  - is_std_hashable_v       std::hash<T> is enabled
================================================================================
*/

#include <functional>
#include <iterator>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace objkit::traits {

template <class>
inline constexpr bool dependent_false_v = false;

// Anything std::string_view can be built from: std::string, string_view,
// char arrays (string literals).
template <class T>
inline constexpr bool is_string_like_v = std::is_convertible_v<const T&, std::string_view>;

template <class T, class = void>
struct has_member_to_string : std::false_type {};
template <class T>
struct has_member_to_string<T, std::void_t<decltype(std::declval<const T&>().to_string())>>
    : std::true_type {};

template <class T, class = void>
struct has_member_hash_code : std::false_type {};
template <class T>
struct has_member_hash_code<T, std::void_t<decltype(std::declval<const T&>().hash_code())>>
    : std::is_integral<decltype(std::declval<const T&>().hash_code())> {};

template <class T, class = void>
struct is_range : std::false_type {};
template <class T>
struct is_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                               decltype(std::end(std::declval<const T&>()))>>
    : std::true_type {};

template <class T, class = void>
struct is_streamable : std::false_type {};
template <class T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                             << std::declval<const T&>())>>
    : std::true_type {};

template <class T>
inline constexpr bool is_std_hashable_v = std::is_default_constructible_v<std::hash<T>>;

}  // namespace objkit::traits
