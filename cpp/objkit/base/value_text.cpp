#include "objkit/base/value_text.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace objkit {

namespace {

float parse_back(const std::string& text, float) { return std::strtof(text.c_str(), nullptr); }
double parse_back(const std::string& text, double) { return std::strtod(text.c_str(), nullptr); }

template <class F>
void append_floating(std::string& out, F v) {
  if (std::isnan(v)) {
    out += "NaN";
    return;
  }
  if (std::isinf(v)) {
    out += (v > 0) ? "Infinity" : "-Infinity";
    return;
  }

  // Shortest precision that parses back to the same F.
  std::string text;
  for (int precision = 1; precision <= std::numeric_limits<F>::max_digits10; ++precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(precision) << v;
    text = oss.str();
    if (parse_back(text, v) == v) break;
  }

  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  out += text;
}

}  // namespace

void append_float(std::string& out, float v) { append_floating(out, v); }

void append_double(std::string& out, double v) { append_floating(out, v); }

}  // namespace objkit
