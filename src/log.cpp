#include <swa/log.hpp>
#include <cctype>

namespace swa {

const char* to_string(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "?";
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
  std::string key;
  for (char c : s) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (key == "debug") return LogLevel::Debug;
  if (key == "info")  return LogLevel::Info;
  if (key == "warn" || key == "warning") return LogLevel::Warn;
  if (key == "error") return LogLevel::Error;
  if (key == "off" || key == "none") return LogLevel::Off;
  return std::nullopt;
}

Logger Logger::to_stderr(LogLevel min_level) {
  return Logger(min_level, [](LogLevel l, const std::string& msg) {
    std::fprintf(stderr, "[%s] %s\n", to_string(l), msg.c_str());
  });
}

const Logger& Logger::silent() {
  static const Logger quiet;
  return quiet;
}

} // namespace swa
