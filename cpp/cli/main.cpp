/*
================================================================================
CLI: Main Entry Point (objkit_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line access to the Objects helpers for quick checks and scripts.
    * simple-name  type-name derivation
    * hash         hash_code over string arguments
    * equal        null-safe equality of two arguments
    * describe     ToStringHelper output for the invocation itself

Usage:
  objkit_cli [command] [args...]

  The argument token "null" stands for an absent value.

Hardening:
  - Explicit error codes for CI integration
  - Deterministic output format
================================================================================
*/

#include "objkit/base/objects.hpp"
#include "objkit/core/error.hpp"
#include "objkit/core/logging.hpp"
#include "objkit/core/type_name.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace objkit;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3
};

void print_help() {
  std::cout << R"(
objkit_cli - null-safe equality, hash aggregation and toString helpers

Usage:
  objkit_cli [command] [args...]

Commands:
  simple-name <qualified>...   Print the simple type name of each argument
  hash [value]...              Print hash_code over the values
  equal <a> <b>                Print true/false for equal(a, b)
  describe [value]...          Print a ToStringHelper rendering of the call
  help                         Show this help message

The token "null" stands for an absent value.

Examples:
  objkit_cli simple-name com.example.Outer\$Inner
  objkit_cli hash 1 null x
  objkit_cli equal null null
  objkit_cli describe a null

Environment:
  OBJKIT_LOG_LEVEL   debug | info | warn | error (default info)

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
)";
}

std::optional<std::string> parse_value(const char* arg) {
  const std::string s(arg);
  if (s == "null") return std::nullopt;
  return s;
}

std::vector<std::optional<std::string>> parse_values(int first, int argc, char** argv) {
  std::vector<std::optional<std::string>> out;
  for (int i = first; i < argc; ++i) {
    out.push_back(parse_value(argv[i]));
  }
  return out;
}

struct Invocation {
  std::string command;
  std::vector<std::optional<std::string>> args;

  std::string to_string() const {
    return to_string_helper(*this).add("command", command).add("args", args).format();
  }
};

int cmd_simple_name(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "simple-name: expected at least one qualified name\n";
    return ExitCode::INVALID_ARGS;
  }
  for (int i = 2; i < argc; ++i) {
    std::cout << simple_name(argv[i]) << "\n";
  }
  return ExitCode::SUCCESS;
}

int cmd_hash(int argc, char** argv) {
  const auto values = parse_values(2, argc, argv);
  if (log_enabled(LogLevel::DEBUG)) {
    log(LogLevel::DEBUG, "hash: " + std::to_string(values.size()) + " value(s)");
  }
  std::cout << hash_sequence(values) << "\n";
  return ExitCode::SUCCESS;
}

int cmd_equal(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "equal: expected exactly two values\n";
    return ExitCode::INVALID_ARGS;
  }
  const auto a = parse_value(argv[2]);
  const auto b = parse_value(argv[3]);
  std::cout << (equal(a, b) ? "true" : "false") << "\n";
  return ExitCode::SUCCESS;
}

int cmd_describe(int argc, char** argv) {
  Invocation inv;
  inv.command = argv[1];
  inv.args = parse_values(2, argc, argv);
  std::cout << inv.to_string() << "\n";
  return ExitCode::SUCCESS;
}

int dispatch(const std::string& cmd, int argc, char** argv) {
  if (cmd == "simple-name") return cmd_simple_name(argc, argv);
  if (cmd == "hash") return cmd_hash(argc, argv);
  if (cmd == "equal") return cmd_equal(argc, argv);
  if (cmd == "describe") return cmd_describe(argc, argv);

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'objkit_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}

int main(int argc, char** argv) {
  init_log_level_from_env();

  // Parse command
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (log_enabled(LogLevel::DEBUG)) {
    log(LogLevel::DEBUG, "objkit_cli: command '" + cmd + "'");
  }

  try {
    return dispatch(cmd, argc, argv);
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return ExitCode::INVALID_ARGS;
  } catch (const ValidationError& e) {
    log(LogLevel::ERROR, std::string("Validation FAILED: ") + e.what());
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::string("Error: ") + e.what());
    return ExitCode::COMPUTATION_FAILED;
  }
}
