#pragma once
#include <cstddef>
#include <set>
#include <vector>
#include <swa/config.hpp>
#include <swa/errors.hpp>
#include <swa/event.hpp>
#include <swa/log.hpp>

namespace swa {

// Lap boundary times for one race: [0.0, wall, wall, ..., end].
struct LapBoundaries {
  std::vector<double> times;
  std::set<std::size_t> pair_laps;  // 0-based laps expected to end in a turn_start/turn_end pair
  bool used_fallback = false;       // IM walk failed, first-N turn events used instead
  std::size_t expected_turns = 0;   // walls the stroke/distance pattern requires
  std::size_t detected_turns = 0;   // intermediate boundaries after debounce

  std::size_t lap_count() const { return times.size() < 2 ? 0 : times.size() - 1; }
  bool pair_eligible(std::size_t lap) const { return pair_laps.count(lap) != 0; }
};

// Adjacent turn_start -> turn_end occurrences on the time-sorted turn stream.
struct TurnPair {
  double start = 0.0;
  double end = 0.0;
  double duration() const { return end - start; }
};

// Pass 1 collects and time-sorts turn events, pass 2 pairs each turn_start with an
// immediately following turn_end. Unpaired events are skipped.
std::vector<TurnPair> match_turn_pairs(const std::vector<Event>& events);

// Number of pool lengths in the race (distance / pool_length, rounded).
std::size_t length_count(int distance, double pool_length);

// Walls between lengths: length_count - 1, or 0 for a single length.
std::size_t expected_turn_count(const RaceContext& ctx, const AnalysisConfig& cfg);

// Stroke swum on a given 0-based length of a medley (fly, back, breast, free).
Stroke medley_stroke(std::size_t length, std::size_t lengths_per_stroke);

// Sorts and drops every boundary within debounce_s of the previous kept one,
// inclusive up to 1e-9 of rounding. The first (0.0) and last (end) entries always
// survive, so an interior boundary within debounce_s of the end is the one dropped.
std::vector<double> debounce_boundaries(std::vector<double> times, double debounce_s);

// Maps turn events to lap boundaries for the race's stroke and distance.
// Throws RaceDataError(MissingEvent, End) when there is no end event.
// A turn count below the pattern's requirement adds an InsufficientTurnEvents warning.
LapBoundaries detect_lap_boundaries(const std::vector<Event>& events,
                                    const RaceContext& ctx,
                                    const AnalysisConfig& cfg,
                                    std::vector<DataWarning>& warnings,
                                    const Logger& log = Logger::silent());

} // namespace swa
