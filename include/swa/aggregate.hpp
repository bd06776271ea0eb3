#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <swa/metrics.hpp>

namespace swa {

// "Average <field>" -> mean, in lap-field order.
struct OverallStats {
  std::vector<std::pair<std::string, double>> entries;

  std::optional<double> get(const std::string& name) const;
  bool empty() const { return entries.empty(); }
  std::size_t size() const { return entries.size(); }
};

// Mean of each field over exactly the laps where it is present.
// Fields absent from every lap produce no entry.
OverallStats compute_overall_stats(const std::vector<LapStat>& laps);

} // namespace swa
