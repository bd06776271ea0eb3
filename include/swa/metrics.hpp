#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include <swa/config.hpp>
#include <swa/errors.hpp>
#include <swa/event.hpp>
#include <swa/laps.hpp>
#include <swa/log.hpp>

namespace swa {

// One manually entered row per lap. Times are race-clock seconds.
struct ManualLap {
  double breakout_time = 0.0;
  double breakout_distance = 0.0;
  std::optional<double> fifteen_time;
};

// May cover fewer laps than the race has.
using ManualMeasurements = std::vector<ManualLap>;

struct LapStat {
  int lap = 0;                     // 1-based
  double lap_time = 0.0;
  std::optional<double> turn_time;
  std::optional<double> stroke_to_wall;
  int stroke_count = 0;
  double strokes_per_second = 0.0;

  // Present only when a manual row covers this lap.
  std::optional<double> breakout_time_rel;
  std::optional<double> breakout_distance;
  std::optional<double> underwater_speed;
  std::optional<double> overwater_speed;
  std::optional<double> breakout_to_fifteen;
  std::optional<double> fifteen_to_turn;

  // Numeric fields in report order, lap number excluded. Absent fields are nullopt.
  std::vector<std::pair<const char*, std::optional<double>>> fields() const;
};

// Field names in the order fields() returns them.
const std::vector<const char*>& lap_stat_field_names();

// Presentation rounding (2 decimals).
double round2(double v);

// Per-lap statistics over [boundaries[i], boundaries[i+1]].
// events must be time-ordered. manual may be null or shorter than the lap count;
// laps it does not cover get no underwater/overwater fields and a
// MismatchedManualData warning is added.
std::vector<LapStat> compute_lap_stats(const std::vector<Event>& events,
                                       const LapBoundaries& boundaries,
                                       const ManualMeasurements* manual,
                                       const AnalysisConfig& cfg,
                                       std::vector<DataWarning>& warnings,
                                       const Logger& log = Logger::silent());

} // namespace swa
