#include <cstdio>
#include <string>

#include <swa/analysis.hpp>
#include <swa/io.hpp>
#include <swa/viewer/app.hpp>

using namespace swa;

// swim_viewer <events.csv> "<race details>" [manual.csv]
int main(int argc, char** argv) {
  if (argc < 3) {
    std::fprintf(stderr, "usage: %s <events.csv> \"Men's 100 Butterfly\" [manual.csv]\n", argv[0]);
    return 2;
  }

  const Logger log = Logger::to_stderr(LogLevel::Info);
  auto ctx = parse_race_details(argv[2]);
  if (!ctx) {
    log.error("invalid race details '%s'", argv[2]);
    return 2;
  }
  const auto events = load_events_csv(argv[1], log);
  if (!events) {
    log.error("cannot open events file '%s'", argv[1]);
    return 1;
  }
  std::optional<ManualMeasurements> manual;
  if (argc > 3) {
    manual = load_manual_csv(argv[3], log);
    if (!manual) {
      log.error("cannot open manual measurements file '%s'", argv[3]);
      return 1;
    }
  }

  RaceAnalysis analysis;
  try {
    analysis = analyze_race(*events, *ctx, manual ? &*manual : nullptr, AnalysisConfig{}, log);
  } catch (const RaceDataError& e) {
    log.error("%s (in '%s')", e.what(), argv[1]);
    return 1;
  }

  ViewerApp app(analysis);
  return app.run();
}
