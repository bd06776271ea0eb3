#pragma once
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace swa {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* to_string(LogLevel l);
std::optional<LogLevel> log_level_from_string(const std::string& s);

// Leveled logger that forwards formatted lines to an injected sink.
// Copyable; the default-constructed logger drops everything.
class Logger {
public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  Logger() = default;
  Logger(LogLevel min_level, Sink sink) : min_(min_level), sink_(std::move(sink)) {}

  // Writes "[LEVEL] message" lines to stderr.
  static Logger to_stderr(LogLevel min_level);
  // Shared do-nothing instance, used as the default argument.
  static const Logger& silent();

  bool enabled(LogLevel l) const { return sink_ && l >= min_ && min_ != LogLevel::Off; }
  LogLevel level() const { return min_; }

  void log(LogLevel l, const std::string& message) const {
    if (enabled(l)) sink_(l, message);
  }

  template <typename... Args>
  void debug(const char* format, Args... args) const { logf_(LogLevel::Debug, format, args...); }
  template <typename... Args>
  void info(const char* format, Args... args) const { logf_(LogLevel::Info, format, args...); }
  template <typename... Args>
  void warn(const char* format, Args... args) const { logf_(LogLevel::Warn, format, args...); }
  template <typename... Args>
  void error(const char* format, Args... args) const { logf_(LogLevel::Error, format, args...); }

private:
  template <typename... Args>
  void logf_(LogLevel l, const char* format, Args... args) const {
    if (!enabled(l)) return;
    if constexpr (sizeof...(Args) == 0) {
      sink_(l, format);
    } else {
      char buffer[1024];
      std::snprintf(buffer, sizeof(buffer), format, args...);
      sink_(l, buffer);
    }
  }

  LogLevel min_{LogLevel::Off};
  Sink sink_{};
};

} // namespace swa
