#include <swa/summary.hpp>
#include <numeric>

namespace swa {

static std::optional<double> mean_of(const std::vector<double>& v) {
  if (v.empty()) return std::nullopt;
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

RaceSummary summarize_race(const ValidatedEvents& race) {
  RaceSummary s;
  s.total_time = race.end_time - race.start_time;
  s.water_entry_time = race.water_entry_time;

  const auto strokes = events_of_type(race.events, EventType::Stroke);
  s.total_strokes = static_cast<int>(strokes.size());
  for (std::size_t i = 1; i < strokes.size(); ++i) {
    s.stroke_intervals.push_back(strokes[i].time - strokes[i - 1].time);
  }
  s.avg_stroke_interval = mean_of(s.stroke_intervals);

  s.turns = match_turn_pairs(race.events);
  std::vector<double> durations;
  for (const auto& t : s.turns) durations.push_back(t.duration());
  s.avg_turn_time = mean_of(durations);

  // Underwater phase: from water entry for the first breakout, from the
  // preceding push-off (turn_end) afterwards.
  const auto pushoffs = events_of_type(race.events, EventType::TurnEnd);
  const auto breakouts = events_of_type(race.events, EventType::Breakout);
  const double entry = race.water_entry_time.value_or(race.start_time);
  for (std::size_t i = 0; i < breakouts.size(); ++i) {
    const double t = breakouts[i].time;
    s.breakout_times.push_back(t);
    double from = t;
    if (i == 0) from = entry;
    else if (i - 1 < pushoffs.size()) from = pushoffs[i - 1].time;
    s.underwater_times.push_back(t - from);
  }
  s.avg_underwater_time = mean_of(s.underwater_times);
  return s;
}

} // namespace swa
