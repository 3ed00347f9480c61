#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/objkit/core/error.hpp

Two failure families:
  - Error (ErrorCode::kInvalidArgument): a caller broke a precondition, e.g.
    passed an absent subject or field name. Always a caller bug; carries the
    throwing site (file/line/function).
  - ValidationError: a configuration object (FormatSettings) holds values
    outside their documented bounds.

Both derive from ObjkitError so callers can catch the library as a whole.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace objkit {

class ObjkitError : public std::runtime_error {
 public:
  explicit ObjkitError(const std::string& what) : std::runtime_error(what) {}
};

class ValidationError : public ObjkitError {
 public:
  explicit ValidationError(const std::string& msg) : ObjkitError(msg) {}
};

enum class ErrorCode : int {
  kInvalidArgument = 1,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    default:                          return "Unknown";
  }
}

class Error final : public ObjkitError {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : ObjkitError(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "objkit: " << to_string(code) << ": " << msg;
    if (file && *file) {
      oss << " [" << file << ":" << line;
      if (func && *func) oss << " in " << func;
      oss << "]";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string_view message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::string(message), file, line, function);
  }
}

}  // namespace objkit

#define OBJKIT_THROW(CODE, MSG) ::objkit::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define OBJKIT_ENSURE(EXPR, CODE, MSG) ::objkit::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)

// Precondition shorthand: throws Error(kInvalidArgument) naming the argument.
#define OBJKIT_CHECK_PRESENT(EXPR, WHAT) \
  OBJKIT_ENSURE((EXPR), ::objkit::ErrorCode::kInvalidArgument, WHAT " must not be null")
