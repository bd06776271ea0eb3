#include <swa/aggregate.hpp>

namespace swa {

std::optional<double> OverallStats::get(const std::string& name) const {
  for (const auto& [key, value] : entries) {
    if (key == name) return value;
  }
  return std::nullopt;
}

OverallStats compute_overall_stats(const std::vector<LapStat>& laps) {
  const auto& names = lap_stat_field_names();
  std::vector<double> sums(names.size(), 0.0);
  std::vector<int> counts(names.size(), 0);

  for (const auto& lap : laps) {
    const auto fields = lap.fields();
    for (std::size_t f = 0; f < fields.size(); ++f) {
      if (!fields[f].second) continue;
      sums[f] += *fields[f].second;
      ++counts[f];
    }
  }

  OverallStats out;
  for (std::size_t f = 0; f < names.size(); ++f) {
    if (counts[f] == 0) continue;
    out.entries.emplace_back(std::string("Average ") + names[f], sums[f] / counts[f]);
  }
  return out;
}

} // namespace swa
