#pragma once
#include <istream>
#include <optional>
#include <string>
#include <swa/log.hpp>

namespace swa {

// Pool and capture constants. Defaults are short-course yards.
struct AnalysisConfig {
  double pool_length = 25.0;          // one length, same unit as RaceContext::distance
  double hand_touch_allowance = 0.5;  // reach of the final hand touch, subtracted from overwater distance
  double debounce_s = 0.1;            // boundaries closer than this collapse into one
  LogLevel log_level = LogLevel::Info;
};

// Stream-based "key,value" loader. Accepts an optional "key,value" header,
// ignores blank lines and '#' comments, trims whitespace.
// Unknown keys and invalid values are skipped; keys not present keep their defaults.
AnalysisConfig config_from_csv_stream(std::istream& in, const Logger& log = Logger::silent());

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<AnalysisConfig> load_config_csv(const std::string& path,
                                              const Logger& log = Logger::silent());

} // namespace swa
