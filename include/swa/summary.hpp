#pragma once
#include <optional>
#include <vector>
#include <swa/laps.hpp>
#include <swa/validate.hpp>

namespace swa {

// Whole-race figures taken straight from the event stream.
struct RaceSummary {
  double total_time = 0.0;
  std::optional<double> water_entry_time;

  int total_strokes = 0;
  std::vector<double> stroke_intervals;       // tempo, seconds between strokes
  std::optional<double> avg_stroke_interval;

  std::vector<TurnPair> turns;                // matched turn_start -> turn_end
  std::optional<double> avg_turn_time;

  std::vector<double> breakout_times;         // recorded breakout events
  std::vector<double> underwater_times;       // breakout minus water entry / previous push-off
  std::optional<double> avg_underwater_time;
};

RaceSummary summarize_race(const ValidatedEvents& race);

} // namespace swa
