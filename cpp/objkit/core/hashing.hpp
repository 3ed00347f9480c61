#pragma once
/*
================================================================================
Core: Deterministic Hashing Utilities
FILE: cpp/objkit/core/hashing.hpp

Purpose:
  - Stable 64-bit stream hash behind element_hash() for the primitive kinds
    (booleans, integers, floating point, strings).
  - Fold to the 32-bit hash codes the aggregation functions return.

Design constraints:
  - Determinism > speed. Same value -> same code in every process and build.
  - No dependence on std::hash for primitives (not stable across platforms).
  - Avoid UB: use std::bit_cast for floating types, normalize NaNs.

Hardening:
  - Canonicalize -0.0 -> +0.0 (they compare equal, so they must hash equal)
  - Canonicalize NaN -> fixed quiet-NaN payload
  - Integers are encoded little-endian explicitly.

Notes:
  - This is NOT cryptographic.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace objkit {

// ----------------------------- FNV-1a 64 -------------------------------------
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}
  explicit Fnv1a64(uint64_t seed) : h_(seed ? seed : kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void update_bytes(const void* data, size_t n);

  void update_u8(uint8_t v) { update_bytes(&v, 1); }

  void update_u64(uint64_t v) { update_le(v); }
  void update_i64(int64_t v)  { update_le(static_cast<uint64_t>(v)); }

  void update_bool(bool b) { update_u8(static_cast<uint8_t>(b ? 1 : 0)); }

  // Length delimiter first, so "ab"+"c" and "a"+"bc" differ.
  void update_string(std::string_view s);

  // float is widened by the caller; 1.5f and 1.5 hash the same.
  void update_f64(double x);

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && sizeof(T) == 8,
                  "update_le supports 64-bit integral types only");
    std::array<uint8_t, sizeof(T)> b{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<uint8_t>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  uint64_t h_;
};

// 64 -> 32 bit fold: low word XOR high word.
int32_t fold_to_i32(uint64_t h) noexcept;

// Convenience one-shot hashes used by element_hash().
int32_t hash_i64(int64_t v);
int32_t hash_u64(uint64_t v);
int32_t hash_bool(bool v);
int32_t hash_f64(double v);
int32_t hash_string(std::string_view s);

}  // namespace objkit
