#pragma once
/*
================================================================================
Core: Formatting Settings
FILE: cpp/objkit/core/settings.hpp

Purpose:
  - Centralize the text layout knobs of ToStringHelper into a single
    validated object.
  - defaults() reproduces the canonical "TypeName{x=1, y=null}" layout; any
    other layout is opt-in per helper.

Hardening:
  - validate_or_throw() catches nonsensical values before a helper is built.
================================================================================
*/

#include <cstddef>
#include <string>

#include "objkit/core/error.hpp"

namespace objkit {

struct FormatSettings {
  // Text used for absent values.
  std::string null_text = "null";

  // Between two fields.
  std::string field_separator = ", ";

  // Between a field name and its value.
  std::string name_value_separator = "=";

  std::string open_brace = "{";
  std::string close_brace = "}";

  // Initial capacity reserved for the formatted string (chars).
  std::size_t reserve_hint = 100;

  static constexpr std::size_t kMaxReserveHint = 65536;

  void validate_or_throw() const {
    if (null_text.empty()) {
      throw ValidationError("FormatSettings: null_text must not be empty");
    }
    if (open_brace.empty() || close_brace.empty()) {
      throw ValidationError("FormatSettings: open_brace/close_brace must not be empty");
    }
    if (reserve_hint > kMaxReserveHint) {
      throw ValidationError("FormatSettings: reserve_hint outside sane bounds");
    }
  }

  static FormatSettings defaults() {
    FormatSettings s;
    return s;
  }
};

}  // namespace objkit
