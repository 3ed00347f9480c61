/*
  Objects Selftest

  Validates:
    1) equal(): both-absent, one-absent, identity short-circuit, mixed
       nullable kinds, C strings by content, arithmetic kinds kept apart
       so equal values always hash equally.
    2) hash_code()/hash_sequence(): empty constant, absent contributes 0,
       pairwise-equal sequences agree, single-value caveat.
    3) ToStringHelper: "TypeName{x=1, y=null}", bare values, dynamic and
       nested type names, custom FormatSettings, contract errors.
    4) first_non_null() for pointers, C strings, optionals and shared_ptr.

  Framework-free; non-zero return code indicates failure.
*/

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "objkit/base/objects.hpp"

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

template <class Fn>
void expect_invalid_argument(Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected objkit::Error(InvalidArgument), nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() == ErrorCode::kInvalidArgument) pass(msg);
    else fail(msg);
  }
}

// ----------------------------- fixtures --------------------------------------

// operator== counts calls and never matches, so equal() returning true proves
// the identity short-circuit.
struct Counted {
  mutable int compares = 0;
  bool operator==(const Counted& o) const {
    ++compares;
    ++o.compares;
    return false;
  }
};

struct Point {
  int x = 0;
  int y = 0;
  bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

struct Shape {
  virtual ~Shape() = default;
};

struct Circle : Shape {};

struct Outer {
  struct Inner {};
};

struct Tagged {
  int64_t hash_code() const { return 42; }
};

enum class Color : int { kRed = 2 };

// ----------------------------- equal -----------------------------------------

void test_equal() {
  expect_true(equal(nullptr, nullptr), "equal: nullptr/nullptr");
  expect_true(equal(std::nullopt, std::optional<int>{}), "equal: nullopt/empty optional");

  const int* n1 = nullptr;
  const int* n2 = nullptr;
  expect_true(equal(n1, n2), "equal: two null pointers");

  int five = 5;
  int other_five = 5;
  int six = 6;
  expect_true(equal(&five, &other_five), "equal: pointers to equal values");
  expect_true(!equal(&five, &six), "equal: pointers to different values");
  expect_true(!equal(&five, n1), "equal: present vs absent");
  expect_true(!equal(n1, &five), "equal: absent vs present");
  expect_true(!equal(five, nullptr), "equal: plain value vs nullptr");

  expect_true(equal(std::optional<int>{3}, 3), "equal: optional vs plain value");
  expect_true(!equal(std::optional<int>{}, std::optional<int>{3}), "equal: empty vs engaged optional");
  expect_true(equal(std::make_shared<Point>(Point{1, 2}), std::make_unique<Point>(Point{1, 2})),
              "equal: shared_ptr vs unique_ptr compare pointees");

  const char* cstr = "abc";
  const char* null_cstr = nullptr;
  expect_true(equal(cstr, std::string("abc")), "equal: C string vs std::string by content");
  expect_true(!equal(null_cstr, std::string("abc")), "equal: null C string vs std::string");
  expect_true(equal(null_cstr, nullptr), "equal: null C string vs nullptr");

  Counted c;
  expect_true(equal(c, c), "equal: same object is equal");
  expect_true(equal(&c, &c), "equal: same pointer is equal");
  expect_true(c.compares == 0, "equal: identity short-circuits operator==");

  Counted d;
  expect_true(!equal(c, d), "equal: distinct objects use operator==");
  expect_true(d.compares == 1, "equal: operator== invoked once for distinct objects");
}

// equal(a, b) must imply hash_code(a) == hash_code(b).
template <class A, class B>
void expect_equal_hash_agree(const A& a, const B& b, bool want_equal, std::string_view msg) {
  const bool eq = equal(a, b);
  expect_true(eq == want_equal, msg);
  if (eq) expect_true(hash_code(a) == hash_code(b), msg);
}

void test_equal_arithmetic_kinds() {
  expect_equal_hash_agree(1, 1.0, false, "equal: int vs double are different kinds");
  expect_equal_hash_agree(true, 1, false, "equal: bool vs int are different kinds");
  expect_equal_hash_agree(1, true, false, "equal: int vs bool are different kinds");
  expect_equal_hash_agree(0.0, false, false, "equal: double vs bool are different kinds");
  expect_equal_hash_agree(-1, 4294967295u, false, "equal: -1 vs UINT32_MAX by value");
  expect_equal_hash_agree(int64_t{-1}, std::numeric_limits<uint64_t>::max(), false,
                          "equal: -1 vs UINT64_MAX by value");

  expect_equal_hash_agree(5, 5u, true, "equal: int vs unsigned with same value");
  expect_equal_hash_agree(5u, 5LL, true, "equal: unsigned vs long long with same value");
  expect_equal_hash_agree(-7, int64_t{-7}, true, "equal: negative ints of different widths");
  expect_equal_hash_agree(1.5f, 1.5, true, "equal: float vs double exactly representable");
  expect_equal_hash_agree(0.1f, 0.1, false, "equal: float 0.1 vs double 0.1 differ");
  expect_equal_hash_agree(0.0, -0.0, true, "equal: +0.0 vs -0.0");
  expect_equal_hash_agree(std::optional<int>{1}, 1.0, false, "equal: optional<int> vs double");
  expect_equal_hash_agree(std::optional<unsigned>{3}, 3, true, "equal: optional<unsigned> vs int");
}

// ----------------------------- hashing ---------------------------------------

void test_hash_code() {
  expect_true(hash_code() == 1, "hash_code: empty sequence is 1");
  expect_true(hash_code(nullptr) == 31, "hash_code: single absent value is 31");
  expect_true(hash_sequence(std::vector<int>{}) == 1, "hash_sequence: empty range is 1");

  expect_true(hash_code(1, "a", nullptr) == hash_code(1, std::string("a"), std::optional<int>{}),
              "hash_code: pairwise-equal sequences agree");
  expect_true(hash_code(5) == hash_code(5LL) && hash_code(5) == hash_code(5u),
              "hash_code: equal integers of different widths agree");

  const auto single = static_cast<int32_t>(31u + static_cast<uint32_t>(element_hash(7)));
  expect_true(hash_code(7) == single, "hash_code: single value is 31 + element_hash");

  std::vector<std::optional<int>> seq{1, std::nullopt, 3};
  expect_true(hash_sequence(seq) == hash_code(1, std::optional<int>{}, 3),
              "hash_sequence: range agrees with variadic form");
  expect_true(hash_sequence({1, 2, 3}) == hash_code(1, 2, 3),
              "hash_sequence: initializer_list agrees with variadic form");

  const std::vector<int> inner{1, 2};
  expect_true(element_hash(inner) == hash_sequence(inner), "element_hash: nested range aggregates");

  Tagged t;
  expect_true(element_hash(t) == 42, "element_hash: member hash_code() used");
  expect_true(element_hash(Color::kRed) == element_hash(2), "element_hash: enum hashes as underlying");
  expect_true(element_hash(0.0) == element_hash(-0.0), "element_hash: -0.0 == +0.0");

  std::unordered_set<std::optional<std::string>, ValueHash, ValueEqual> keys;
  keys.insert(std::string("a"));
  keys.insert(std::string("a"));
  keys.insert(std::nullopt);
  keys.insert(std::nullopt);
  expect_true(keys.size() == 2, "ValueHash/ValueEqual: nullable keys deduplicate by value");
}

// ----------------------------- ToStringHelper --------------------------------

void test_to_string_helper() {
  Point p{1, 2};

  expect_eq_str(to_string_helper(p).add("x", 1).add("y", nullptr).format(), "Point{x=1, y=null}",
                "to_string_helper: named fields with null");
  expect_eq_str(to_string_helper(p).add_value(5).add_value("a").format(), "Point{5, a}",
                "to_string_helper: bare values");
  expect_eq_str(to_string_helper(p).format(), "Point{}", "to_string_helper: no fields");
  expect_eq_str(to_string_helper(&p).add("x", p.x).format(), "Point{x=1}",
                "to_string_helper: pointer subject uses pointee type");

  Circle circle;
  const Shape& shape = circle;
  expect_eq_str(to_string_helper(shape).format(), "Circle{}", "to_string_helper: dynamic type name");
  expect_eq_str(to_string_helper(Outer::Inner{}).format(), "Inner{}",
                "to_string_helper: nested type keeps innermost name");

  ToStringHelper helper = to_string_helper(p);
  helper.add("x", 1);
  const std::string first = helper.format();
  expect_eq_str(helper.format(), first, "format: idempotent");
  helper.add("y", 2);
  expect_eq_str(helper.format(), "Point{x=1, y=2}", "format: reflects later appends");
  expect_true(helper.field_count() == 2, "field_count tracks appends");

  std::optional<int> none;
  expect_eq_str(to_string_helper(p)
                    .add("b", true)
                    .add("c", 'z')
                    .add("d", 1.0)
                    .add("e", 2.5)
                    .add("f", 0.1)
                    .add("g", -0.0)
                    .add("s", std::string("txt"))
                    .add("o", std::optional<int>{7})
                    .add("n", none)
                    .add("v", std::vector<int>{1, 2})
                    .add("k", Color::kRed)
                    .format(),
                "Point{b=true, c=z, d=1.0, e=2.5, f=0.1, g=-0.0, s=txt, o=7, n=null, v=[1, 2], k=2}",
                "to_string_helper: value rendering");

  expect_eq_str(to_string_helper(p).add("f", 0.1f).add("g", 1.1f).add("h", 2.0f).add_value(-0.5f).format(),
                "Point{f=0.1, g=1.1, h=2.0, -0.5}", "to_string_helper: float keeps float precision");

  expect_eq_str(to_string_helper(p).add("inner", to_string_helper(circle).add("r", 3)).format(),
                "Point{inner=Circle{r=3}}", "to_string_helper: helpers nest");

  std::ostringstream oss;
  oss << to_string_helper(p).add("x", 1);
  expect_eq_str(oss.str(), "Point{x=1}", "operator<< streams the formatted text");
}

void test_to_string_helper_settings() {
  FormatSettings s = FormatSettings::defaults();
  s.null_text = "<none>";
  s.open_brace = "(";
  s.close_brace = ")";
  s.field_separator = "; ";
  s.name_value_separator = ": ";

  Point p{};
  expect_eq_str(to_string_helper(p, s).add("x", 1).add("y", nullptr).format(), "Point(x: 1; y: <none>)",
                "FormatSettings: custom layout");

  ToStringHelper named("Manual");
  expect_eq_str(named.add_value(1).format(), "Manual{1}", "ToStringHelper: explicit class name");

  FormatSettings bad = FormatSettings::defaults();
  bad.open_brace.clear();
  bool threw = false;
  try {
    ToStringHelper h("Bad", bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "FormatSettings: invalid settings rejected at construction");
}

void test_to_string_helper_contract() {
  const Point* no_point = nullptr;
  expect_invalid_argument([&] { (void)to_string_helper(no_point); },
                          "to_string_helper: null pointer subject");
  expect_invalid_argument([] { (void)to_string_helper(nullptr); }, "to_string_helper: nullptr subject");
  expect_invalid_argument([] { (void)to_string_helper(std::optional<Point>{}); },
                          "to_string_helper: empty optional subject");

  Point p{};
  const char* no_name = nullptr;
  expect_invalid_argument([&] { to_string_helper(p).add(no_name, 1); }, "ToStringHelper::add: null name");
}

// ----------------------------- first_non_null --------------------------------

void test_first_non_null() {
  int five = 5;
  int* none = nullptr;
  expect_true(first_non_null(none, &five) == 5, "first_non_null: (null, 5) -> 5");
  expect_true(first_non_null(&five, none) == 5, "first_non_null: (5, null) -> 5");
  expect_true(&first_non_null(&five, none) == &five, "first_non_null: returns the same object");
  expect_invalid_argument([&] { (void)first_non_null(none, none); }, "first_non_null: both null");

  expect_true(first_non_null(std::optional<int>{}, std::optional<int>{5}) == 5,
              "first_non_null: optional (empty, 5) -> 5");
  expect_true(first_non_null(std::optional<int>{4}, std::optional<int>{5}) == 4,
              "first_non_null: optional prefers first");
  expect_invalid_argument([] { (void)first_non_null(std::optional<int>{}, std::optional<int>{}); },
                          "first_non_null: both optionals empty");

  expect_true(first_non_null(std::optional<int>{}, 5) == 5, "first_non_null: optional (empty, plain 5) -> 5");
  expect_true(first_non_null(std::optional<int>{5}, std::nullopt) == 5,
              "first_non_null: optional (5, nullopt) -> 5");

  const char* no_text = nullptr;
  const std::string_view picked = first_non_null(no_text, "abc");
  expect_true(picked == "abc", "first_non_null: C string falls back to the whole second string");
  expect_true(first_non_null("xy", no_text) == "xy", "first_non_null: C string prefers first");
  expect_invalid_argument([&] { (void)first_non_null(no_text, no_text); }, "first_non_null: both C strings null");

  auto shared = std::make_shared<int>(9);
  expect_true(first_non_null(std::shared_ptr<int>{}, shared) == shared,
              "first_non_null: shared_ptr falls back to second");
  expect_invalid_argument([] { (void)first_non_null(std::shared_ptr<int>{}, std::shared_ptr<int>{}); },
                          "first_non_null: both shared_ptr null");
}

}  // namespace
}  // namespace objkit

int main() {
  using namespace objkit;

  test_equal();
  test_equal_arithmetic_kinds();
  test_hash_code();
  test_to_string_helper();
  test_to_string_helper_settings();
  test_to_string_helper_contract();
  test_first_non_null();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
