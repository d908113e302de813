#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace veneer::dom {

enum class LogLevel { Debug, Info, Warn, Error, Off };

using LogSink = std::function<void(LogLevel, std::string_view)>;

inline const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Off:
    return "off";
  }
  return "?";
}

inline bool parse_log_level(std::string_view s, LogLevel &out) {
  if (s == "debug") {
    out = LogLevel::Debug;
  } else if (s == "info") {
    out = LogLevel::Info;
  } else if (s == "warn" || s == "warning") {
    out = LogLevel::Warn;
  } else if (s == "error") {
    out = LogLevel::Error;
  } else if (s == "off" || s == "none") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

namespace detail {
inline std::atomic<int> log_threshold{static_cast<int>(LogLevel::Warn)};

// Empty sink writes to stderr.
inline LogSink &log_sink() {
  static LogSink sink;
  return sink;
}
} // namespace detail

inline void set_log_level(LogLevel level) {
  detail::log_threshold.store(static_cast<int>(level),
                              std::memory_order_relaxed);
}

inline LogLevel log_level() {
  return static_cast<LogLevel>(
      detail::log_threshold.load(std::memory_order_relaxed));
}

inline bool log_enabled(LogLevel level) {
  return level != LogLevel::Off &&
         static_cast<int>(level) >=
             detail::log_threshold.load(std::memory_order_relaxed);
}

// Returns the previous sink.
inline LogSink set_log_sink(LogSink sink) {
  return std::exchange(detail::log_sink(), std::move(sink));
}

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
inline void log_message(LogLevel level, const char *fmt, ...) {
  if (!log_enabled(level)) {
    return;
  }

  char buf[512];
  va_list args;
  va_start(args, fmt);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  if (n < 0) {
    return;
  }

  std::string_view msg{buf, static_cast<std::size_t>(n) < sizeof(buf)
                                ? static_cast<std::size_t>(n)
                                : sizeof(buf) - 1};
  if (const auto &sink = detail::log_sink()) {
    sink(level, msg);
    return;
  }
  std::fprintf(stderr, "[veneer] %s: %.*s\n", log_level_name(level),
               static_cast<int>(msg.size()), msg.data());
}

} // namespace veneer::dom

#define VENEER_LOG_DEBUG(...)                                                  \
  ::veneer::dom::log_message(::veneer::dom::LogLevel::Debug, __VA_ARGS__)
#define VENEER_LOG_INFO(...)                                                   \
  ::veneer::dom::log_message(::veneer::dom::LogLevel::Info, __VA_ARGS__)
#define VENEER_LOG_WARN(...)                                                   \
  ::veneer::dom::log_message(::veneer::dom::LogLevel::Warn, __VA_ARGS__)
#define VENEER_LOG_ERROR(...)                                                  \
  ::veneer::dom::log_message(::veneer::dom::LogLevel::Error, __VA_ARGS__)
