#include <swa/report.hpp>
#include <cstdio>
#include <sstream>
#include <nlohmann/json.hpp>

namespace swa {

namespace {

std::string num2(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", round2(v));
  return buf;
}

} // namespace

std::string fmt_value(const std::optional<double>& v) {
  return v ? num2(*v) : std::string("--");
}

std::string summary_string(const RaceAnalysis& a) {
  const auto& s = a.summary;
  std::ostringstream os;
  os << "Swimmer: " << (a.context.swimmer.empty() ? "(unknown)" : a.context.swimmer) << "\n";
  os << "Race Details: " << describe(a.context);
  if (!a.context.session.empty()) os << " (" << a.context.session << ")";
  os << "\n\n";

  os << "Race Metrics:\n";
  os << "  Total Race Time: " << num2(s.total_time) << " seconds\n";
  if (s.water_entry_time) os << "  Water Entry Time: " << num2(*s.water_entry_time) << " seconds\n";
  for (std::size_t i = 0; i < s.turns.size(); ++i) {
    os << "  Turn " << (i + 1) << ": " << num2(s.turns[i].duration()) << " seconds (Start: "
       << num2(s.turns[i].start) << ", End: " << num2(s.turns[i].end) << ")\n";
  }
  if (s.avg_turn_time) os << "  Avg Turn Time: " << num2(*s.avg_turn_time) << " seconds\n";
  for (std::size_t i = 0; i < s.underwater_times.size(); ++i) {
    os << "  Breakout " << (i + 1) << ": " << num2(s.breakout_times[i])
       << " s, Underwater Time: " << num2(s.underwater_times[i]) << " seconds\n";
  }
  if (s.avg_underwater_time) os << "  Avg Underwater Time: " << num2(*s.avg_underwater_time) << " seconds\n";
  if (s.total_strokes > 0) os << "  Total Strokes: " << s.total_strokes << "\n";
  if (s.avg_stroke_interval) os << "  Avg Stroke Interval: " << num2(*s.avg_stroke_interval) << " seconds\n";

  os << "\nLaps:\n";
  for (const auto& lap : a.laps) {
    os << "  Lap " << lap.lap << ": " << num2(lap.lap_time) << " s";
    os << ", strokes " << lap.stroke_count << " (" << num2(lap.strokes_per_second) << "/s)";
    if (lap.turn_time) os << ", turn " << num2(*lap.turn_time) << " s";
    if (lap.stroke_to_wall) os << ", stroke-to-wall " << num2(*lap.stroke_to_wall) << " s";
    if (lap.underwater_speed) os << ", underwater " << num2(*lap.underwater_speed);
    if (lap.overwater_speed) os << ", overwater " << num2(*lap.overwater_speed);
    os << "\n";
  }

  if (!a.overall.empty()) {
    os << "\nAverages:\n";
    for (const auto& [name, value] : a.overall.entries) {
      os << "  " << name << ": " << num2(value) << "\n";
    }
  }

  if (!a.warnings.empty()) {
    os << "\nWarnings:\n";
    for (const auto& w : a.warnings) {
      os << "  [" << to_string(w.kind) << "] " << w.message << "\n";
    }
  }
  return os.str();
}

void write_lap_stats_csv(std::ostream& out, const std::vector<LapStat>& laps) {
  out << "lap";
  for (const char* name : lap_stat_field_names()) out << "," << name;
  out << "\n";
  for (const auto& lap : laps) {
    out << lap.lap;
    for (const auto& [name, value] : lap.fields()) {
      out << ",";
      if (value) out << num2(*value);
    }
    out << "\n";
  }
}

void write_report_json(std::ostream& out, const RaceAnalysis& a) {
  nlohmann::json j;
  j["swimmer"] = a.context.swimmer;
  j["race"] = describe(a.context);
  j["stroke"] = to_string(a.context.stroke);
  j["distance"] = a.context.distance;
  j["session"] = a.context.session;
  j["relay"] = a.context.relay;
  j["total_time"] = round2(a.summary.total_time);
  j["used_fallback"] = a.boundaries.used_fallback;

  nlohmann::json boundaries = nlohmann::json::array();
  for (double t : a.boundaries.times) boundaries.push_back(round2(t));
  j["boundaries"] = boundaries;

  // absent fields are omitted from the lap object
  nlohmann::json laps = nlohmann::json::array();
  for (const auto& lap : a.laps) {
    nlohmann::json lapJson;
    lapJson["lap"] = lap.lap;
    for (const auto& [name, value] : lap.fields()) {
      if (value) lapJson[name] = round2(*value);
    }
    laps.push_back(lapJson);
  }
  j["laps"] = laps;

  nlohmann::json averages = nlohmann::json::object();
  for (const auto& [name, value] : a.overall.entries) averages[name] = round2(value);
  j["averages"] = averages;

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto& w : a.warnings) {
    nlohmann::json warningJson;
    warningJson["kind"] = to_string(w.kind);
    warningJson["message"] = w.message;
    warnings.push_back(warningJson);
  }
  j["warnings"] = warnings;

  out << j.dump(2) << "\n";
}

} // namespace swa
