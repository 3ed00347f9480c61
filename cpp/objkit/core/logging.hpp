#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/objkit/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by the library and the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Caller controls severity; implementation routes WARN/ERROR to stderr.
  - One line per call: "objkit <UTC time> <LEVEL> <message>".
===========================================================
*/

#include <string>
#include <string_view>

namespace objkit {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// True when a message at lvl would be written. Lets callers skip building
// expensive DEBUG text.
bool log_enabled(LogLevel lvl) noexcept;

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves *out untouched on anything else.
bool parse_log_level(std::string_view text, LogLevel* out) noexcept;

// Reads OBJKIT_LOG_LEVEL. Unset keeps the current level; an unknown value
// keeps it too and logs a WARN.
void init_log_level_from_env();

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace objkit
