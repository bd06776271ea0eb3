#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <swa/event.hpp>
#include <swa/log.hpp>
#include <swa/metrics.hpp>

namespace swa {

// Stream-based event loader: "type,time" rows as written by the capture tool.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped (and logged).
std::vector<Event> events_from_csv_stream(std::istream& in, const Logger& log = Logger::silent());

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Event>> load_events_csv(const std::string& path,
                                                  const Logger& log = Logger::silent());

// "breakout_time,breakout_distance[,fifteen_time]" rows, one per lap, same rules.
ManualMeasurements manual_from_csv_stream(std::istream& in, const Logger& log = Logger::silent());

std::optional<ManualMeasurements> load_manual_csv(const std::string& path,
                                                  const Logger& log = Logger::silent());

} // namespace swa
