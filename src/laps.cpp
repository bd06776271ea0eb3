#include <swa/laps.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <swa/validate.hpp>

namespace swa {

namespace {

// Absorbs binary rounding so a gap of exactly debounce_s collapses.
constexpr double kDebounceEpsilon = 1e-9;

enum class DistanceClass { Any, Medley, IrregularMedley };

struct RacePlan {
  std::size_t lengths = 0;  // pool lengths in the race
  std::size_t walls = 0;    // intermediate boundaries expected
};

enum class PairRule { None, AllLaps, Listed };

// Raw result of one strategy, before the end time is appended and debounced.
struct BoundaryWalk {
  std::vector<double> times;
  PairRule pair_rule = PairRule::None;
  std::set<std::size_t> pair_laps;
  bool used_fallback = false;
};

using BoundaryStrategy = BoundaryWalk (*)(const std::vector<Event>& turns, const RacePlan& plan);

bool is_pair_wall(std::size_t length, std::size_t per_stroke) {
  const Stroke here = medley_stroke(length, per_stroke);
  if (here == Stroke::Butterfly || here == Stroke::Breaststroke) return true;
  // back -> breast crossover
  return here == Stroke::Backstroke &&
         medley_stroke(length + 1, per_stroke) == Stroke::Breaststroke;
}

std::set<std::size_t> medley_pair_laps(const RacePlan& plan) {
  std::set<std::size_t> out;
  const std::size_t per = plan.lengths / 4;
  if (per == 0) return out;
  for (std::size_t j = 0; j < plan.walls; ++j) {
    if (is_pair_wall(j, per)) out.insert(j);
  }
  return out;
}

// Freestyle / backstroke: one key press per wall.
BoundaryWalk single_touch_walls(const std::vector<Event>& turns, const RacePlan&) {
  BoundaryWalk w;
  for (const auto& e : turns) {
    if (e.type == EventType::TurnEnd) w.times.push_back(e.time);
  }
  return w;
}

// Breaststroke / butterfly: the two-hand touch starts the turn.
BoundaryWalk two_hand_walls(const std::vector<Event>& turns, const RacePlan&) {
  BoundaryWalk w;
  w.pair_rule = PairRule::AllLaps;
  for (const auto& e : turns) {
    if (e.type == EventType::TurnStart) w.times.push_back(e.time);
  }
  return w;
}

BoundaryWalk first_n_turns(const std::vector<Event>& turns, std::size_t n) {
  BoundaryWalk w;
  w.used_fallback = true;
  for (std::size_t i = 0; i < turns.size() && i < n; ++i) {
    w.times.push_back(turns[i].time);
  }
  return w;
}

// Fewer than one length per stroke (50 IM) leaves no lap eligible for a turn pair.
BoundaryWalk irregular_medley(const std::vector<Event>& turns, const RacePlan& plan) {
  BoundaryWalk w = first_n_turns(turns, plan.walls);
  w.pair_rule = PairRule::Listed;
  w.pair_laps = medley_pair_laps(plan);
  return w;
}

// Walks the medley wall by wall, consuming turn events according to the stroke
// that finishes at each wall. Any mismatch discards the walk.
BoundaryWalk medley_walk(const std::vector<Event>& turns, const RacePlan& plan) {
  const std::size_t per = plan.lengths / 4;
  const std::size_t n = turns.size();
  std::size_t cur = 0;

  BoundaryWalk w;
  w.pair_rule = PairRule::Listed;
  bool ok = true;

  auto at = [&](EventType t){ return cur < n && turns[cur].type == t; };

  for (std::size_t wall = 0; wall < plan.walls && ok; ++wall) {
    const Stroke here = medley_stroke(wall, per);
    const Stroke next = medley_stroke(wall + 1, per);

    if (here == Stroke::Butterfly || here == Stroke::Breaststroke) {
      if (!at(EventType::TurnStart)) { ok = false; break; }
      w.times.push_back(turns[cur].time);
      w.pair_laps.insert(wall);
      ++cur;
      if (at(EventType::TurnEnd)) ++cur; // paired push-off
    } else if (here == Stroke::Backstroke && next == Stroke::Breaststroke) {
      if (at(EventType::TurnStart)) ++cur;
      if (!at(EventType::TurnEnd)) { ok = false; break; }
      w.times.push_back(turns[cur].time);
      w.pair_laps.insert(wall);
      ++cur;
    } else {
      if (!at(EventType::TurnEnd)) { ok = false; break; }
      w.times.push_back(turns[cur].time);
      ++cur;
    }
  }

  if (ok && w.times.size() == plan.walls) return w;

  BoundaryWalk fb = first_n_turns(turns, plan.walls);
  fb.pair_rule = PairRule::Listed;
  fb.pair_laps = medley_pair_laps(plan);
  return fb;
}

struct StrategyEntry {
  Stroke stroke;
  DistanceClass distance_class;
  BoundaryStrategy fn;
  const char* name;
};

const StrategyEntry kStrategies[] = {
  {Stroke::Freestyle,    DistanceClass::Any,             &single_touch_walls, "single-touch"},
  {Stroke::Backstroke,   DistanceClass::Any,             &single_touch_walls, "single-touch"},
  {Stroke::Breaststroke, DistanceClass::Any,             &two_hand_walls,     "two-hand"},
  {Stroke::Butterfly,    DistanceClass::Any,             &two_hand_walls,     "two-hand"},
  {Stroke::IM,           DistanceClass::Medley,          &medley_walk,        "medley"},
  {Stroke::IM,           DistanceClass::IrregularMedley, &irregular_medley,   "medley (first-n)"},
};

DistanceClass distance_class_of(Stroke stroke, const RacePlan& plan) {
  if (stroke != Stroke::IM) return DistanceClass::Any;
  if (plan.lengths >= 4 && plan.lengths % 4 == 0) return DistanceClass::Medley;
  return DistanceClass::IrregularMedley;
}

const StrategyEntry& strategy_for(Stroke stroke, DistanceClass cls) {
  for (const auto& s : kStrategies) {
    if (s.stroke == stroke && s.distance_class == cls) return s;
  }
  return kStrategies[0];
}

} // namespace

std::vector<TurnPair> match_turn_pairs(const std::vector<Event>& events) {
  const auto turns = turn_events(events);
  std::vector<TurnPair> out;
  std::size_t i = 0;
  while (i < turns.size()) {
    if (i + 1 < turns.size() &&
        turns[i].type == EventType::TurnStart &&
        turns[i + 1].type == EventType::TurnEnd) {
      out.push_back({turns[i].time, turns[i + 1].time});
      i += 2;
    } else {
      i += 1;
    }
  }
  return out;
}

std::size_t length_count(int distance, double pool_length) {
  if (distance <= 0 || pool_length <= 0.0) return 0;
  return static_cast<std::size_t>(std::lround(distance / pool_length));
}

std::size_t expected_turn_count(const RaceContext& ctx, const AnalysisConfig& cfg) {
  const std::size_t lengths = length_count(ctx.distance, cfg.pool_length);
  return lengths > 0 ? lengths - 1 : 0;
}

Stroke medley_stroke(std::size_t length, std::size_t lengths_per_stroke) {
  static const Stroke kOrder[] = {
    Stroke::Butterfly, Stroke::Backstroke, Stroke::Breaststroke, Stroke::Freestyle
  };
  if (lengths_per_stroke == 0) return Stroke::Freestyle;
  const std::size_t seg = length / lengths_per_stroke;
  return seg < 4 ? kOrder[seg] : Stroke::Freestyle;
}

std::vector<double> debounce_boundaries(std::vector<double> times, double debounce_s) {
  if (times.size() < 2) return times;
  std::sort(times.begin(), times.end());
  const double first = times.front();
  const double last = times.back();
  const double window = debounce_s + kDebounceEpsilon;

  std::vector<double> out;
  out.reserve(times.size());
  out.push_back(first);
  for (std::size_t i = 1; i + 1 < times.size(); ++i) {
    if (times[i] - out.back() <= window) continue;
    if (last - times[i] <= window) continue;
    out.push_back(times[i]);
  }
  if (last > out.back()) out.push_back(last);
  return out;
}

LapBoundaries detect_lap_boundaries(const std::vector<Event>& events,
                                    const RaceContext& ctx,
                                    const AnalysisConfig& cfg,
                                    std::vector<DataWarning>& warnings,
                                    const Logger& log) {
  const double end_time = require_end_time(events);

  RacePlan plan;
  plan.lengths = length_count(ctx.distance, cfg.pool_length);
  plan.walls = plan.lengths > 0 ? plan.lengths - 1 : 0;

  const auto turns = turn_events(events);
  const auto& strategy = strategy_for(ctx.stroke, distance_class_of(ctx.stroke, plan));
  log.debug("%s %d: %zu turn events, %zu walls expected, strategy %s",
            to_string(ctx.stroke), ctx.distance, turns.size(), plan.walls, strategy.name);

  BoundaryWalk walk = strategy.fn(turns, plan);
  if (walk.used_fallback) {
    log.warn("medley walk did not match %zu walls; using the first %zu turn events",
             plan.walls, walk.times.size());
  }

  std::vector<double> raw{0.0};
  for (double t : walk.times) {
    if (t > 0.0 && t < end_time) raw.push_back(t);
  }
  raw.push_back(end_time);

  LapBoundaries out;
  out.times = debounce_boundaries(std::move(raw), cfg.debounce_s);
  out.used_fallback = walk.used_fallback;
  out.expected_turns = plan.walls;
  out.detected_turns = out.times.size() >= 2 ? out.times.size() - 2 : 0;

  switch (walk.pair_rule) {
    case PairRule::None:
      break;
    case PairRule::AllLaps:
      for (std::size_t i = 0; i < out.lap_count(); ++i) out.pair_laps.insert(i);
      break;
    case PairRule::Listed:
      for (std::size_t lap : walk.pair_laps) {
        if (lap < out.lap_count()) out.pair_laps.insert(lap);
      }
      break;
  }

  if (out.detected_turns < out.expected_turns) {
    const std::string msg = "detected " + std::to_string(out.detected_turns) + " of " +
                            std::to_string(out.expected_turns) + " turns; " +
                            std::to_string(out.lap_count()) + " laps computed";
    log.warn("%s", msg.c_str());
    warnings.push_back({WarningKind::InsufficientTurnEvents, msg});
  }
  return out;
}

} // namespace swa
