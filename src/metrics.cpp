#include <swa/metrics.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace swa {

namespace {

struct LapWindow {
  double start = 0.0;
  double end = 0.0;
  bool closed = false; // final lap includes its end time
  bool contains(double t) const { return t >= start && (t < end || (closed && t == end)); }
};

std::vector<double> strokes_in(const std::vector<Event>& events, const LapWindow& w) {
  std::vector<double> out;
  for (const auto& e : events) {
    if (e.type == EventType::Stroke && w.contains(e.time)) out.push_back(e.time);
  }
  return out;
}

// Attributes each matched pair to the lap whose window (start, end] holds the
// turn_start, else to the lap whose closing boundary lies inside the pair.
std::vector<std::optional<double>> turn_times_by_lap(const std::vector<TurnPair>& pairs,
                                                     const LapBoundaries& b) {
  const std::size_t n = b.lap_count();
  std::vector<std::optional<double>> out(n);
  for (const auto& p : pairs) {
    std::optional<std::size_t> lap;
    for (std::size_t k = 0; k < n; ++k) {
      if (p.start > b.times[k] && p.start <= b.times[k + 1]) { lap = k; break; }
    }
    if (!lap) {
      for (std::size_t k = 0; k < n; ++k) {
        const double wall = b.times[k + 1];
        if (wall >= p.start && wall <= p.end) { lap = k; break; }
      }
    }
    if (!lap || !b.pair_eligible(*lap) || out[*lap].has_value()) continue;
    out[*lap] = p.duration();
  }
  return out;
}

void apply_manual(LapStat& s,
                  const ManualLap& m,
                  const LapWindow& w,
                  double underwater_start,
                  const std::vector<double>& strokes,
                  const AnalysisConfig& cfg) {
  const double rel = m.breakout_time - underwater_start;
  s.breakout_time_rel = rel;
  s.breakout_distance = m.breakout_distance;
  s.underwater_speed = rel > 0.0 ? m.breakout_distance / rel : 0.0;

  const double over_distance = cfg.pool_length - m.breakout_distance - cfg.hand_touch_allowance;
  double swim_end = w.end;
  auto last_after = std::find_if(strokes.rbegin(), strokes.rend(),
                                 [&](double t){ return t > m.breakout_time; });
  if (last_after != strokes.rend()) swim_end = *last_after;
  const double over_time = swim_end - m.breakout_time;
  s.overwater_speed = over_time > 0.0 ? over_distance / over_time : 0.0;

  if (m.fifteen_time) {
    s.breakout_to_fifteen = *m.fifteen_time - m.breakout_time;
    s.fifteen_to_turn = w.end - *m.fifteen_time;
  }
}

} // namespace

const std::vector<const char*>& lap_stat_field_names() {
  static const std::vector<const char*> names = {
    "lap_time", "turn_time", "stroke_to_wall", "stroke_count", "strokes_per_second",
    "breakout_time_rel", "breakout_distance", "underwater_speed", "overwater_speed",
    "breakout_to_fifteen", "fifteen_to_turn"
  };
  return names;
}

std::vector<std::pair<const char*, std::optional<double>>> LapStat::fields() const {
  const auto& n = lap_stat_field_names();
  return {
    {n[0], lap_time},
    {n[1], turn_time},
    {n[2], stroke_to_wall},
    {n[3], static_cast<double>(stroke_count)},
    {n[4], strokes_per_second},
    {n[5], breakout_time_rel},
    {n[6], breakout_distance},
    {n[7], underwater_speed},
    {n[8], overwater_speed},
    {n[9], breakout_to_fifteen},
    {n[10], fifteen_to_turn},
  };
}

double round2(double v) {
  return std::round(v * 100.0) / 100.0;
}

std::vector<LapStat> compute_lap_stats(const std::vector<Event>& events,
                                       const LapBoundaries& boundaries,
                                       const ManualMeasurements* manual,
                                       const AnalysisConfig& cfg,
                                       std::vector<DataWarning>& warnings,
                                       const Logger& log) {
  const std::size_t n = boundaries.lap_count();
  std::vector<LapStat> out;
  out.reserve(n);
  if (n == 0) return out;

  const auto turns = turn_events(events);
  const auto turn_times = turn_times_by_lap(match_turn_pairs(events), boundaries);
  const auto water_entry = find_first(events, EventType::WaterEntry);
  const bool have_manual = manual != nullptr && !manual->empty();

  if (have_manual && manual->size() < n) {
    const std::string msg = "manual measurements cover " + std::to_string(manual->size()) +
                            " of " + std::to_string(n) + " laps";
    log.warn("%s", msg.c_str());
    warnings.push_back({WarningKind::MismatchedManualData, msg});
  } else if (have_manual && manual->size() > n) {
    log.debug("ignoring %zu manual rows past the last lap", manual->size() - n);
  }

  for (std::size_t i = 0; i < n; ++i) {
    const LapWindow w{boundaries.times[i], boundaries.times[i + 1], i + 1 == n};
    const auto strokes = strokes_in(events, w);
    const ManualLap* m = (have_manual && i < manual->size()) ? &(*manual)[i] : nullptr;

    LapStat s;
    s.lap = static_cast<int>(i + 1);
    s.lap_time = w.end - w.start;
    s.stroke_count = static_cast<int>(strokes.size());

    std::optional<double> swim_start;
    if (m) swim_start = m->breakout_time;
    else if (!strokes.empty()) swim_start = strokes.front();
    if (swim_start) {
      const double denom = w.end - *swim_start;
      s.strokes_per_second = denom > 0.0 ? s.stroke_count / denom : 0.0;
    }

    if (!strokes.empty()) {
      const double last_stroke = strokes.back();
      auto next_turn = std::find_if(turns.begin(), turns.end(),
                                    [&](const Event& e){ return e.time > last_stroke; });
      const double wall = next_turn != turns.end() ? next_turn->time : w.end;
      s.stroke_to_wall = wall - last_stroke;
    }

    if (boundaries.pair_eligible(i)) s.turn_time = turn_times[i];

    if (m) {
      const double underwater_start = i == 0 ? (water_entry ? water_entry->time : w.start) : w.start;
      apply_manual(s, *m, w, underwater_start, strokes, cfg);
    }

    out.push_back(s);
  }
  return out;
}

} // namespace swa
