#pragma once

#include <cstdio>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace dfs_core {

enum class LogLevel { off = 0, error = 1, warn = 2, info = 3, debug = 4 };

inline const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::error:
    return "[Error]";
  case LogLevel::warn:
    return "[Warn]";
  case LogLevel::info:
    return "[Info]";
  case LogLevel::debug:
    return "[Debug]";
  case LogLevel::off:
    break;
  }
  return "";
}

// Writes "[Level] component: message" to stderr when `level` passes the
// caller's threshold. The threshold travels in each operation's config.
template <typename... Args>
void log(LogLevel threshold, LogLevel level, const char *component,
         fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (level == LogLevel::off || static_cast<int>(level) >
                                    static_cast<int>(threshold)) {
    return;
  }
  fmt::print(stderr, "{} {}: {}\n", level_tag(level), component,
             fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace dfs_core
