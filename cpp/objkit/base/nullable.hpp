#pragma once
/*
================================================================================
Base: Nullable Access
FILE: cpp/objkit/base/nullable.hpp

Purpose:
  - One vocabulary for "possibly absent" across the C++ nullable kinds:
      * raw pointers            (absent == nullptr)
      * C strings               (absent == nullptr, present -> std::string_view)
      * std::optional<T>        (absent == !has_value())
      * std::shared_ptr<T>      (absent == nullptr)
      * std::unique_ptr<T, D>   (absent == nullptr)
      * std::nullptr_t / std::nullopt_t (always absent)
  - Plain values are always present; get() returns the value itself.

Contract:
  - get(v) may only be called when present(v) is true.
  - kAlwaysAbsent types have no get().
================================================================================
*/

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace objkit {

template <class T>
struct Nullable {
  static constexpr bool kNullable = false;
  static constexpr bool kAlwaysAbsent = false;

  static constexpr bool present(const T&) noexcept { return true; }
  static constexpr const T& get(const T& v) noexcept { return v; }
};

template <class T>
struct Nullable<T*> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = false;

  static constexpr bool present(T* p) noexcept { return p != nullptr; }
  static constexpr const T& get(T* p) noexcept { return *p; }
};

template <>
struct Nullable<const char*> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = false;

  static constexpr bool present(const char* p) noexcept { return p != nullptr; }
  static constexpr std::string_view get(const char* p) noexcept { return std::string_view(p); }
};

template <>
struct Nullable<char*> : Nullable<const char*> {};

template <class T>
struct Nullable<std::optional<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = false;

  static constexpr bool present(const std::optional<T>& o) noexcept { return o.has_value(); }
  static constexpr const T& get(const std::optional<T>& o) noexcept { return *o; }
};

template <class T>
struct Nullable<std::shared_ptr<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = false;

  static bool present(const std::shared_ptr<T>& p) noexcept { return p != nullptr; }
  static const T& get(const std::shared_ptr<T>& p) noexcept { return *p; }
};

template <class T, class D>
struct Nullable<std::unique_ptr<T, D>> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = false;

  static bool present(const std::unique_ptr<T, D>& p) noexcept { return p != nullptr; }
  static const T& get(const std::unique_ptr<T, D>& p) noexcept { return *p; }
};

template <>
struct Nullable<std::nullptr_t> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = true;

  static constexpr bool present(std::nullptr_t) noexcept { return false; }
};

template <>
struct Nullable<std::nullopt_t> {
  static constexpr bool kNullable = true;
  static constexpr bool kAlwaysAbsent = true;

  static constexpr bool present(const std::nullopt_t&) noexcept { return false; }
};

template <class T>
inline constexpr bool is_nullable_v = Nullable<T>::kNullable;

}  // namespace objkit
