/**
 * @file log.cpp
 * @brief Logging implementation
 */

#include "pdrop/log.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

namespace pdrop {
namespace log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex &sink_mutex() {
  static std::mutex m;
  return m;
}

Sink &sink() {
  static Sink s;
  return s;
}

void timestamp(char *buf, size_t n) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  std::time_t tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<int>(ms.count()));
}

} // namespace

void set_level(Level level) { g_level.store(level); }

Level level() { return g_level.load(); }

bool parse_level(const std::string &name, Level &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") {
    out = Level::Debug;
  } else if (lower == "info") {
    out = Level::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = Level::Warning;
  } else if (lower == "error" || lower == "err") {
    out = Level::Error;
  } else if (lower == "off" || lower == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

bool set_level_by_name(const std::string &name) {
  Level parsed;
  if (!parse_level(name, parsed)) {
    return false;
  }
  set_level(parsed);
  return true;
}

const char *level_name(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARN";
  case Level::Error:
    return "ERROR";
  case Level::Off:
    return "OFF";
  }
  return "?";
}

void set_sink(Sink s) {
  std::lock_guard<std::mutex> lock(sink_mutex());
  sink() = std::move(s);
}

bool enabled(Level level) {
  return level != Level::Off &&
         static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void logf(Level level, const char *func, const char *fmt, ...) {
  if (!enabled(level)) {
    return;
  }

  va_list ap;
  va_start(ap, fmt);
  va_list ap_copy;
  va_copy(ap_copy, ap);
  int needed = std::vsnprintf(nullptr, 0, fmt, ap_copy);
  va_end(ap_copy);

  std::string msg;
  if (needed > 0) {
    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, ap);
    msg.assign(buf.data(), static_cast<size_t>(needed));
  }
  va_end(ap);

  while (!msg.empty() && msg.back() == '\n') {
    msg.pop_back();
  }

  std::lock_guard<std::mutex> lock(sink_mutex());
  if (sink()) {
    sink()(level, func ? func : "?", msg);
    return;
  }

  char ts[16];
  timestamp(ts, sizeof(ts));
  std::fprintf(stderr, "%s [%s] %s: %s\n", ts, level_name(level),
               func ? func : "?", msg.c_str());
}

} // namespace log
} // namespace pdrop
