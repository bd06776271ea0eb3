#include <swa/analysis.hpp>
#include <swa/validate.hpp>

namespace swa {

RaceAnalysis analyze_race(const std::vector<Event>& events,
                          const RaceContext& context,
                          const ManualMeasurements* manual,
                          const AnalysisConfig& cfg,
                          const Logger& log) {
  RaceAnalysis out;
  out.context = context;

  const ValidatedEvents race = validate_events(events, out.warnings);
  log.info("analyzing %s: %zu events, %.2f s",
           describe(context).c_str(), race.events.size(), race.end_time);

  out.boundaries = detect_lap_boundaries(race.events, context, cfg, out.warnings, log);
  out.laps = compute_lap_stats(race.events, out.boundaries, manual, cfg, out.warnings, log);
  out.overall = compute_overall_stats(out.laps);
  out.summary = summarize_race(race);

  for (const auto& w : out.warnings) {
    if (w.kind == WarningKind::DuplicateEvent) log.warn("%s", w.message.c_str());
  }
  log.info("%zu laps computed, %zu warnings", out.laps.size(), out.warnings.size());
  return out;
}

} // namespace swa
