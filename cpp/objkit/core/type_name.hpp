#pragma once
/*
================================================================================
Core: Type Names
FILE: cpp/objkit/core/type_name.hpp

Purpose:
  - Readable (demangled) names for std::type_info.
  - simple_name(): strip namespace and enclosing-type qualification.

simple_name rules:
  1) If a '$' occurs, everything after the last one ("a.b.Outer$Inner" -> "Inner").
  2) Else everything after the last '.' or "::" that is not inside template
     brackets ("ns::Outer::Inner" -> "Inner", "ns::Box<ns::Item>" -> "Box<ns::Item>").
  3) Else the whole identifier.
  Leading "class " / "struct " / "enum " (MSVC decoration) is dropped first.
================================================================================
*/

#include <string>
#include <string_view>
#include <typeinfo>

namespace objkit {

std::string simple_name(std::string_view qualified);

// Fully qualified, demangled where the ABI allows it.
std::string qualified_type_name(const std::type_info& info);

template <class T>
std::string qualified_type_name() {
  return qualified_type_name(typeid(T));
}

template <class T>
std::string simple_type_name() {
  return simple_name(qualified_type_name(typeid(T)));
}

}  // namespace objkit
