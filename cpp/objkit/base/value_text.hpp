#pragma once
/*
================================================================================
Base: Value Text
FILE: cpp/objkit/base/value_text.hpp

Purpose:
  - Render any supported value the way ToStringHelper prints field values.

Rendering, first match wins:
  - absent (see nullable.hpp)  -> null_text
  - member to_string()         -> its result
  - bool                       -> "true" / "false"
  - char                       -> the character
  - string-like                -> as-is
  - other integers             -> decimal
  - floating point             -> shortest round-trip text, ".0" kept for
                                  integral values ("1.0", "2.5", "1e+20")
  - enums                      -> underlying integer
  - ranges                     -> "[a, b, c]" (elements rendered recursively)
  - operator<<                 -> streamed text
================================================================================
*/

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "objkit/base/nullable.hpp"
#include "objkit/base/value_traits.hpp"

namespace objkit {

inline constexpr std::string_view kNullText = "null";

// Shortest text that parses back to v at v's own precision.
void append_float(std::string& out, float v);
void append_double(std::string& out, double v);

template <class T>
void append_value_text(std::string& out, const T& v, std::string_view null_text = kNullText) {
  using N = Nullable<T>;

  if constexpr (N::kAlwaysAbsent) {
    out += null_text;
  } else if constexpr (N::kNullable) {
    if (!N::present(v)) {
      out += null_text;
    } else {
      append_value_text(out, N::get(v), null_text);
    }
  } else if constexpr (traits::has_member_to_string<T>::value) {
    out += v.to_string();
  } else if constexpr (std::is_same_v<T, bool>) {
    out += v ? "true" : "false";
  } else if constexpr (std::is_same_v<T, char>) {
    out += v;
  } else if constexpr (traits::is_string_like_v<T>) {
    out += std::string_view(v);
  } else if constexpr (std::is_integral_v<T>) {
    out += std::to_string(v);
  } else if constexpr (std::is_floating_point_v<T>) {
    if constexpr (std::is_same_v<T, float>) {
      append_float(out, v);
    } else {
      append_double(out, static_cast<double>(v));
    }
  } else if constexpr (std::is_enum_v<T>) {
    append_value_text(out, static_cast<std::underlying_type_t<T>>(v), null_text);
  } else if constexpr (traits::is_range<T>::value) {
    out += '[';
    bool first = true;
    for (const auto& e : v) {
      if (!first) out += ", ";
      first = false;
      append_value_text(out, e, null_text);
    }
    out += ']';
  } else if constexpr (traits::is_streamable<T>::value) {
    std::ostringstream oss;
    oss << v;
    out += oss.str();
  } else {
    static_assert(traits::dependent_false_v<T>,
                  "objkit: no text rendering for this type; give it to_string() or operator<<");
  }
}

template <class T>
std::string value_text(const T& v, std::string_view null_text = kNullText) {
  std::string out;
  append_value_text(out, v, null_text);
  return out;
}

}  // namespace objkit
