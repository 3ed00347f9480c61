#include "objkit/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace objkit {

namespace {

constexpr uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonicalize_f64(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == 0.0) return 0.0;
  return v;
}

// Distinct seeds per kind keep false(0) / 0 / 0.0 / "" apart.
constexpr uint64_t kSeedInt    = 0x9e3779b97f4a7c15ull;
constexpr uint64_t kSeedBool   = 0xbf58476d1ce4e5b9ull;
constexpr uint64_t kSeedDouble = 0x94d049bb133111ebull;
constexpr uint64_t kSeedString = 0xd6e8feb86659fd93ull;

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) {
  const double c = canonicalize_f64(x);
  update_u64(std::bit_cast<uint64_t>(c));
}

int32_t fold_to_i32(uint64_t h) noexcept {
  const auto folded = static_cast<uint32_t>(h ^ (h >> 32));
  return static_cast<int32_t>(folded);
}

int32_t hash_i64(int64_t v) {
  Fnv1a64 h(kSeedInt);
  h.update_i64(v);
  return fold_to_i32(h.value());
}

int32_t hash_u64(uint64_t v) {
  // Non-negative values share the signed encoding, so 5 and 5u agree.
  Fnv1a64 h(kSeedInt);
  h.update_u64(v);
  return fold_to_i32(h.value());
}

int32_t hash_bool(bool v) {
  Fnv1a64 h(kSeedBool);
  h.update_bool(v);
  return fold_to_i32(h.value());
}

int32_t hash_f64(double v) {
  Fnv1a64 h(kSeedDouble);
  h.update_f64(v);
  return fold_to_i32(h.value());
}

int32_t hash_string(std::string_view s) {
  Fnv1a64 h(kSeedString);
  h.update_string(s);
  return fold_to_i32(h.value());
}

}  // namespace objkit
