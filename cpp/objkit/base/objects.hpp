#pragma once
/*
================================================================================
Base: Objects
FILE: cpp/objkit/base/objects.hpp

Helper functions that operate on any value, nullable or not:
  - equal()            null-safe equality with an identity short-circuit
  - hash_code()        multi-value hash aggregation (variadic)
  - hash_sequence()    the same aggregation over a range
  - to_string_helper() builder for "TypeName{x=1, y=2}" strings
  - first_non_null()   first of two candidates that is present

"Absent" is defined by Nullable<T> (nullable.hpp): nullptr, an empty
optional/shared_ptr/unique_ptr, a null C string.

Errors:
  - Contract violations throw objkit::Error with ErrorCode::kInvalidArgument.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "objkit/base/nullable.hpp"
#include "objkit/base/value_text.hpp"
#include "objkit/base/value_traits.hpp"
#include "objkit/core/error.hpp"
#include "objkit/core/hashing.hpp"
#include "objkit/core/settings.hpp"
#include "objkit/core/type_name.hpp"

namespace objkit {

// ----------------------------- equal -----------------------------------------
namespace detail {

// Integers of any width and signedness compare by mathematical value,
// matching element_hash, which widens before hashing.
template <class X, class Y>
bool integers_equal(X x, Y y) {
  if constexpr (std::is_signed_v<X> == std::is_signed_v<Y>) {
    if constexpr (std::is_signed_v<X>) {
      return static_cast<int64_t>(x) == static_cast<int64_t>(y);
    } else {
      return static_cast<uint64_t>(x) == static_cast<uint64_t>(y);
    }
  } else if constexpr (std::is_signed_v<X>) {
    return x >= 0 && static_cast<uint64_t>(x) == static_cast<uint64_t>(y);
  } else {
    return y >= 0 && static_cast<uint64_t>(x) == static_cast<uint64_t>(y);
  }
}

template <class X, class Y>
bool equal_present(const X& x, const Y& y) {
  if constexpr (std::is_same_v<X, Y>) {
    // Same object: do not ask operator==, it may be expensive or recursive.
    if (std::addressof(x) == std::addressof(y)) return true;
  }
  if constexpr (std::is_arithmetic_v<X> && std::is_arithmetic_v<Y>) {
    // No promotion across kinds: bool, integer and floating values hash in
    // separate families, so 1, 1.0 and true are all unequal.
    if constexpr (std::is_same_v<X, bool> && std::is_same_v<Y, bool>) {
      return x == y;
    } else if constexpr (std::is_same_v<X, bool> || std::is_same_v<Y, bool>) {
      return false;
    } else if constexpr (std::is_integral_v<X> != std::is_integral_v<Y>) {
      return false;
    } else if constexpr (std::is_integral_v<X>) {
      return integers_equal(x, y);
    } else {
      return static_cast<double>(x) == static_cast<double>(y);
    }
  } else if constexpr (traits::is_string_like_v<X> && traits::is_string_like_v<Y>) {
    return std::string_view(x) == std::string_view(y);
  } else {
    return static_cast<bool>(x == y);
  }
}

}  // namespace detail

// Determines whether two possibly-absent values are equal. Returns:
//   - true if a and b are both absent
//   - true if both are present and the present values compare equal with ==
//   - false otherwise
// C strings compare by content. Integers compare by value whatever their
// width; a bool, an integer and a floating value are never equal to each other.
template <class A, class B>
bool equal(const A& a, const B& b) {
  using NA = Nullable<A>;
  using NB = Nullable<B>;

  if constexpr (NA::kAlwaysAbsent || NB::kAlwaysAbsent) {
    return !NA::present(a) && !NB::present(b);
  } else {
    const bool pa = NA::present(a);
    const bool pb = NB::present(b);
    if (!pa || !pb) return pa == pb;
    return detail::equal_present(NA::get(a), NB::get(b));
  }
}

// ----------------------------- hashing ---------------------------------------
template <class T>
int32_t element_hash(const T& value);

template <class Range>
int32_t hash_sequence(const Range& values);

// Hash code of one value; 0 when absent.
template <class T>
int32_t element_hash(const T& value) {
  using N = Nullable<T>;

  if constexpr (N::kAlwaysAbsent) {
    return 0;
  } else if constexpr (N::kNullable) {
    return N::present(value) ? element_hash(N::get(value)) : 0;
  } else if constexpr (traits::has_member_hash_code<T>::value) {
    return static_cast<int32_t>(value.hash_code());
  } else if constexpr (std::is_same_v<T, bool>) {
    return hash_bool(value);
  } else if constexpr (traits::is_string_like_v<T>) {
    return hash_string(std::string_view(value));
  } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    return hash_i64(static_cast<int64_t>(value));
  } else if constexpr (std::is_integral_v<T>) {
    return hash_u64(static_cast<uint64_t>(value));
  } else if constexpr (std::is_enum_v<T>) {
    return element_hash(static_cast<std::underlying_type_t<T>>(value));
  } else if constexpr (std::is_floating_point_v<T>) {
    return hash_f64(static_cast<double>(value));
  } else if constexpr (traits::is_range<T>::value) {
    return hash_sequence(value);
  } else if constexpr (traits::is_std_hashable_v<T>) {
    return fold_to_i32(static_cast<uint64_t>(std::hash<T>{}(value)));
  } else {
    static_assert(traits::dependent_false_v<T>,
                  "objkit: no hash for this type; give it hash_code() or std::hash");
  }
}

inline constexpr uint32_t kHashSeed = 1;
inline constexpr uint32_t kHashMultiplier = 31;

// Generates a hash code for multiple values:
//   result = 1; for each value: result = 31 * result + element_hash(value)
// in wrapping 32-bit arithmetic. hash_code() == 1.
//
// Warning: for a single value the result is 31 + element_hash(value), not
// element_hash(value).
template <class... Ts>
int32_t hash_code(const Ts&... values) {
  uint32_t result = kHashSeed;
  ((result = kHashMultiplier * result + static_cast<uint32_t>(element_hash(values))), ...);
  return static_cast<int32_t>(result);
}

// Same aggregation over the elements of a range, in iteration order.
template <class Range>
int32_t hash_sequence(const Range& values) {
  uint32_t result = kHashSeed;
  for (const auto& v : values) {
    result = kHashMultiplier * result + static_cast<uint32_t>(element_hash(v));
  }
  return static_cast<int32_t>(result);
}

template <class T>
int32_t hash_sequence(std::initializer_list<T> values) {
  uint32_t result = kHashSeed;
  for (const auto& v : values) {
    result = kHashMultiplier * result + static_cast<uint32_t>(element_hash(v));
  }
  return static_cast<int32_t>(result);
}

// Functors so nullable keys hash and compare by value in unordered containers.
struct ValueHash {
  template <class T>
  size_t operator()(const T& v) const {
    return static_cast<size_t>(static_cast<uint32_t>(element_hash(v)));
  }
};

struct ValueEqual {
  template <class A, class B>
  bool operator()(const A& a, const B& b) const {
    return equal(a, b);
  }
};

// ----------------------------- ToStringHelper --------------------------------
// Accumulates "name=value" / "value" fields and formats them as
// "TypeName{field1, field2}". Not thread-safe.
class ToStringHelper {
 public:
  // Prefer to_string_helper(subject), which derives the name from a value.
  explicit ToStringHelper(std::string class_name,
                          FormatSettings settings = FormatSettings::defaults());

  // Adds name=value. An absent value prints as null; a null name throws.
  template <class T>
  ToStringHelper& add(const char* name, const T& value) {
    OBJKIT_CHECK_PRESENT(name != nullptr, "ToStringHelper::add: name");
    return add(std::string_view(name), value);
  }

  template <class T>
  ToStringHelper& add(std::string_view name, const T& value) {
    std::string field(name);
    field += settings_.name_value_separator;
    append_value_text(field, value, settings_.null_text);
    fields_.push_back(std::move(field));
    return *this;
  }

  // Adds a bare value. Prefer add() with a readable name.
  template <class T>
  ToStringHelper& add_value(const T& value) {
    fields_.push_back(value_text(value, settings_.null_text));
    return *this;
  }

  // Returns the formatted string. Does not modify the helper.
  std::string format() const;

  // Same as format(); lets a helper be added as a field of another helper.
  std::string to_string() const { return format(); }

  const std::string& class_name() const noexcept { return class_name_; }
  size_t field_count() const noexcept { return fields_.size(); }

 private:
  std::string class_name_;
  FormatSettings settings_;
  std::vector<std::string> fields_;
};

std::ostream& operator<<(std::ostream& os, const ToStringHelper& helper);

// Creates a ToStringHelper named after the subject's simple type name (the
// dynamic type for polymorphic subjects). Throws if the subject is absent.
//
//   std::string Point::to_string() const {
//     return objkit::to_string_helper(*this).add("x", x).add("y", y).format();
//   }
//
// returns "Point{x=1, y=2}".
template <class T>
ToStringHelper to_string_helper(const T& subject,
                                FormatSettings settings = FormatSettings::defaults()) {
  using N = Nullable<T>;

  if constexpr (N::kAlwaysAbsent) {
    OBJKIT_THROW(ErrorCode::kInvalidArgument, "to_string_helper: subject must not be null");
  } else {
    OBJKIT_CHECK_PRESENT(N::present(subject), "to_string_helper: subject");
    const auto& value = N::get(subject);
    return ToStringHelper(simple_name(qualified_type_name(typeid(value))), std::move(settings));
  }
}

// ----------------------------- first_non_null --------------------------------
// first if present, else second if present; throws if both are absent.

// C strings are nullable strings here, as in equal() and element_hash().
std::string_view first_non_null(const char* first, const char* second);

template <class T>
T& first_non_null(T* first, T* second) {
  if (first != nullptr) return *first;
  OBJKIT_ENSURE(second != nullptr, ErrorCode::kInvalidArgument,
                "first_non_null: both arguments are null");
  return *second;
}

// The second argument may be a plain value: first_non_null(maybe, 5).
template <class T>
T first_non_null(std::optional<T> first, std::type_identity_t<std::optional<T>> second) {
  if (first.has_value()) return std::move(*first);
  OBJKIT_ENSURE(second.has_value(), ErrorCode::kInvalidArgument,
                "first_non_null: both arguments are empty");
  return std::move(*second);
}

template <class T>
std::shared_ptr<T> first_non_null(std::shared_ptr<T> first, std::shared_ptr<T> second) {
  if (first != nullptr) return first;
  OBJKIT_ENSURE(second != nullptr, ErrorCode::kInvalidArgument,
                "first_non_null: both arguments are null");
  return second;
}

}  // namespace objkit
