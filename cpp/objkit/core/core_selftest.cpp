/*
  Core Selftest

  Validates:
    1) Fnv1a64 matches the published FNV-1a 64 test vectors and encodes
       integers little-endian.
    2) Canonical float hashing: -0.0 == +0.0, every NaN hashes the same.
    3) simple_name() strips '$', '.', "::" qualification outside templates.
    4) FormatSettings validation and Error formatting.
    5) Log level parsing.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "objkit/core/error.hpp"
#include "objkit/core/hashing.hpp"
#include "objkit/core/logging.hpp"
#include "objkit/core/settings.hpp"
#include "objkit/core/type_name.hpp"

namespace objkit {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_eq_u64(uint64_t a, uint64_t b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << std::hex << "  a: 0x" << a << "\n  b: 0x" << b << std::dec << "\n";
  } else {
    pass(msg);
  }
}

uint64_t fnv_of(std::string_view s) {
  Fnv1a64 h;
  h.update_bytes(s.data(), s.size());
  return h.value();
}

void test_fnv_vectors() {
  expect_eq_u64(fnv_of(""), 0xcbf29ce484222325ull, "FNV-1a 64: empty input is the offset basis");
  expect_eq_u64(fnv_of("a"), 0xaf63dc4c8601ec8cull, "FNV-1a 64: \"a\"");
  expect_eq_u64(fnv_of("foobar"), 0x85944171f73967e8ull, "FNV-1a 64: \"foobar\"");

  Fnv1a64 le;
  le.update_u64(0x0102030405060708ull);
  const uint8_t bytes[] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
  Fnv1a64 raw;
  raw.update_bytes(bytes, sizeof(bytes));
  expect_eq_u64(le.value(), raw.value(), "update_u64 encodes little-endian");

  Fnv1a64 whole;
  whole.update_string("ab");
  Fnv1a64 split;
  split.update_string("a");
  split.update_string("b");
  expect_true(whole.value() != split.value(), "update_string is length-delimited");
}

void test_fold_and_primitives() {
  expect_true(fold_to_i32(0x0000000100000002ull) == 3, "fold_to_i32 XORs high and low words");
  expect_true(fold_to_i32(0xFFFFFFFF00000000ull) == -1, "fold_to_i32 wraps to negative");

  expect_true(hash_f64(0.0) == hash_f64(-0.0), "hash_f64: -0.0 == +0.0");
  const double qnan = std::numeric_limits<double>::quiet_NaN();
  expect_true(hash_f64(qnan) == hash_f64(-qnan), "hash_f64: NaN payloads canonicalized");
  expect_true(hash_f64(1.5) == hash_f64(static_cast<double>(1.5f)), "hash_f64: widened float agrees");

  expect_true(hash_i64(5) == hash_u64(5u), "hash_i64/hash_u64 agree on non-negative values");
  expect_true(hash_string("abc") == hash_string(std::string("abc")), "hash_string is content based");
  expect_true(hash_bool(true) != hash_bool(false), "hash_bool distinguishes true/false");
}

void test_simple_name() {
  expect_eq_str(simple_name("com.example.Outer$Inner"), "Inner", "simple_name: inner type after '$'");
  expect_eq_str(simple_name("com.example.Outer"), "Outer", "simple_name: after last '.'");
  expect_eq_str(simple_name("Outer"), "Outer", "simple_name: no separator");
  expect_eq_str(simple_name("a.b.Outer$Mid$Inner"), "Inner", "simple_name: last '$' wins");
  expect_eq_str(simple_name("ns::Outer::Inner"), "Inner", "simple_name: after last '::'");
  expect_eq_str(simple_name("ns::Box<ns::Item>"), "Box<ns::Item>", "simple_name: template args kept");
  expect_eq_str(simple_name("(anonymous namespace)::Local"), "Local", "simple_name: anonymous namespace");
  expect_eq_str(simple_name("class ns::Widget"), "Widget", "simple_name: MSVC class prefix");
  expect_eq_str(simple_name("struct Plain"), "Plain", "simple_name: MSVC struct prefix");
  expect_eq_str(simple_name(""), "", "simple_name: empty stays empty");

  expect_eq_str(simple_type_name<FormatSettings>(), "FormatSettings", "simple_type_name: namespaced struct");
#if defined(__GNUG__)
  expect_eq_str(qualified_type_name<FormatSettings>(), "objkit::FormatSettings",
                "qualified_type_name: demangled");
  expect_eq_str(qualified_type_name<int>(), "int", "qualified_type_name: builtin");
#endif
}

void test_settings_validation() {
  bool threw = false;
  try {
    FormatSettings::defaults().validate_or_throw();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(!threw, "FormatSettings::defaults() validates");

  FormatSettings empty_null = FormatSettings::defaults();
  empty_null.null_text.clear();
  threw = false;
  try {
    empty_null.validate_or_throw();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "FormatSettings: empty null_text rejected");

  FormatSettings huge = FormatSettings::defaults();
  huge.reserve_hint = FormatSettings::kMaxReserveHint + 1;
  threw = false;
  try {
    huge.validate_or_throw();
  } catch (const ObjkitError&) {
    threw = true;
  }
  expect_true(threw, "FormatSettings: reserve_hint bound enforced");
}

void test_error_format() {
  try {
    OBJKIT_THROW(ErrorCode::kInvalidArgument, "boom");
  } catch (const Error& e) {
    const std::string what = e.what();
    expect_true(e.code() == ErrorCode::kInvalidArgument, "Error carries its code");
    expect_eq_str(e.message(), "boom", "Error keeps the bare message");
    expect_true(what.find("InvalidArgument") != std::string::npos, "what() names the code");
    expect_true(what.find("core_selftest.cpp") != std::string::npos, "what() names the file");
    expect_true(e.line() > 0, "Error records the line");
  }
}

void test_log_level_parse() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", &lvl) && lvl == LogLevel::DEBUG, "parse_log_level: debug");
  expect_true(parse_log_level("WARN", &lvl) && lvl == LogLevel::WARN, "parse_log_level: case-insensitive");
  expect_true(!parse_log_level("verbose", &lvl) && lvl == LogLevel::WARN,
              "parse_log_level: unknown leaves level untouched");
  expect_true(!parse_log_level("info", nullptr), "parse_log_level: null out rejected");

  const LogLevel saved = get_log_level();
  set_log_level(LogLevel::ERROR);
  expect_true(get_log_level() == LogLevel::ERROR, "set_log_level round-trips");
  expect_true(log_enabled(LogLevel::ERROR), "log_enabled: level at threshold");
  expect_true(!log_enabled(LogLevel::WARN), "log_enabled: level below threshold");
  set_log_level(LogLevel::DEBUG);
  expect_true(log_enabled(LogLevel::DEBUG), "log_enabled: DEBUG threshold admits everything");
  set_log_level(saved);
}

}  // namespace
}  // namespace objkit

int main() {
  using namespace objkit;

  test_fnv_vectors();
  test_fold_and_primitives();
  test_simple_name();
  test_settings_validation();
  test_error_format();
  test_log_level_parse();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
