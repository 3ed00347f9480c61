#include "objkit/core/type_name.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace objkit {

namespace {

std::string_view strip_decoration(std::string_view name) {
  for (std::string_view prefix : {"class ", "struct ", "enum ", "union "}) {
    if (name.substr(0, prefix.size()) == prefix) {
      name.remove_prefix(prefix.size());
      break;
    }
  }
  return name;
}

// Start of the simple name: one past the last separator at template depth 0,
// or 0 when there is none.
size_t last_scope_start(std::string_view name) {
  size_t start = 0;
  int depth = 0;
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '<' || c == '(' || c == '[') {
      ++depth;
    } else if ((c == '>' || c == ')' || c == ']') && depth > 0) {
      --depth;
    } else if (depth == 0) {
      if (c == '.') {
        start = i + 1;
      } else if (c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
        start = i + 2;
        ++i;
      }
    }
  }
  return start;
}

}  // namespace

std::string simple_name(std::string_view qualified) {
  std::string_view name = strip_decoration(qualified);

  // we want the name of the inner type all by its lonesome
  const size_t dollar = name.rfind('$');
  if (dollar != std::string_view::npos) {
    return std::string(name.substr(dollar + 1));
  }
  return std::string(name.substr(last_scope_start(name)));
}

std::string qualified_type_name(const std::type_info& info) {
  const char* raw = info.name();
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(raw, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return std::string(demangled.get());
  }
#endif
  return std::string(raw);
}

}  // namespace objkit
