#pragma once
#include <vector>
#include <swa/aggregate.hpp>
#include <swa/config.hpp>
#include <swa/errors.hpp>
#include <swa/event.hpp>
#include <swa/laps.hpp>
#include <swa/log.hpp>
#include <swa/metrics.hpp>
#include <swa/summary.hpp>

namespace swa {

// Everything one report run derives from a captured race.
struct RaceAnalysis {
  RaceContext context;
  LapBoundaries boundaries;
  std::vector<LapStat> laps;
  OverallStats overall;
  RaceSummary summary;
  std::vector<DataWarning> warnings;
};

// validate -> boundaries -> lap stats -> averages -> summary.
// Throws RaceDataError on a missing start/end event; nothing is returned in that case.
// manual may be null.
RaceAnalysis analyze_race(const std::vector<Event>& events,
                          const RaceContext& context,
                          const ManualMeasurements* manual,
                          const AnalysisConfig& cfg,
                          const Logger& log = Logger::silent());

} // namespace swa
