/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/objkit/core/logging.cpp
===========================================================
Line layout:
  objkit <UTC time with milliseconds> <LEVEL> <message>

  e.g. "objkit 2026-10-18T09:14:03.512Z WARN  OBJKIT_LOG_LEVEL: ..."

Sinks:
  - Each level row in kLevels names its tag and its stream.
  - The whole line is built before the lock is taken, so the
    mutex only guards the single write + flush.
===========================================================
*/

#include "objkit/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

namespace objkit {

namespace {

struct LevelInfo {
  LogLevel level;
  const char* name;  // lower-case, as accepted by parse_log_level
  const char* tag;   // fixed width, as printed
  bool to_stderr;
};

constexpr LevelInfo kLevels[] = {
    {LogLevel::DEBUG, "debug", "DEBUG", false},
    {LogLevel::INFO, "info", "INFO ", false},
    {LogLevel::WARN, "warn", "WARN ", true},
    {LogLevel::ERROR, "error", "ERROR", true},
};

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_sink_mu;

const LevelInfo& info_for(LogLevel lvl) noexcept {
  for (const LevelInfo& li : kLevels) {
    if (li.level == lvl) return li;
  }
  return kLevels[1];
}

bool iequals(std::string_view a, const char* b) noexcept {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) {
      return false;
    }
  }
  return i == a.size() && b[i] == '\0';
}

// "2026-10-18T09:14:03.512Z"
void append_utc_millis(std::string& out) {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  out.append(buf, n);
  std::snprintf(buf, sizeof(buf), ".%03dZ", static_cast<int>(ms.count()));
  out += buf;
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

bool parse_log_level(std::string_view text, LogLevel* out) noexcept {
  if (out == nullptr) return false;
  for (const LevelInfo& li : kLevels) {
    if (iequals(text, li.name)) {
      *out = li.level;
      return true;
    }
  }
  return false;
}

void init_log_level_from_env() {
  const char* raw = std::getenv("OBJKIT_LOG_LEVEL");
  if (raw == nullptr || *raw == '\0') return;

  LogLevel lvl = get_log_level();
  if (parse_log_level(raw, &lvl)) {
    set_log_level(lvl);
    return;
  }
  log(LogLevel::WARN, std::string("OBJKIT_LOG_LEVEL: unknown level '") + raw + "', keeping " +
                          info_for(get_log_level()).name);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;
  try {
    const LevelInfo& li = info_for(lvl);

    std::string line;
    line.reserve(msg.size() + 40);
    line += "objkit ";
    append_utc_millis(line);
    line += ' ';
    line += li.tag;
    line += ' ';
    line += msg;
    line += '\n';

    std::ostream& sink = li.to_stderr ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lk(g_sink_mu);
    sink.write(line.data(), static_cast<std::streamsize>(line.size()));
    sink.flush();
  } catch (...) {
    // Must never throw. Swallow everything.
  }
}

}  // namespace objkit
