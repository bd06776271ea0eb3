#pragma once
#include <ostream>
#include <string>
#include <swa/analysis.hpp>

namespace swa {

// Seconds as "%.2f", or "--" when absent.
std::string fmt_value(const std::optional<double>& v);

// Human-readable report: swimmer, race, race metrics, per-lap table, averages, warnings.
std::string summary_string(const RaceAnalysis& a);

// One row per lap; empty cells for absent fields. Values rounded to 2 decimals.
void write_lap_stats_csv(std::ostream& out, const std::vector<LapStat>& laps);

// Whole analysis as JSON (context, boundaries, laps, averages, warnings).
void write_report_json(std::ostream& out, const RaceAnalysis& a);

} // namespace swa
