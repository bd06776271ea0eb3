#include <swa/config.hpp>
#include <fstream>
#include <swa/csv.hpp>

namespace swa {

static bool apply_entry(AnalysisConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "log_level") {
    auto lvl = log_level_from_string(value);
    if (!lvl) return false;
    cfg.log_level = *lvl;
    return true;
  }

  double v = 0.0;
  if (!csv::to_double(value, v)) return false;
  if (key == "pool_length") {
    if (v <= 0.0) return false;
    cfg.pool_length = v;
  } else if (key == "hand_touch_allowance") {
    if (v < 0.0) return false;
    cfg.hand_touch_allowance = v;
  } else if (key == "debounce_s") {
    if (v < 0.0) return false;
    cfg.debounce_s = v;
  } else {
    return false;
  }
  return true;
}

AnalysisConfig config_from_csv_stream(std::istream& in, const Logger& log) {
  AnalysisConfig cfg;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && cols.size() >= 2 && cols[0] == "key" && cols[1] == "value") {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || !apply_entry(cfg, cols[0], cols[1])) {
      log.warn("config line %d skipped: '%s'", line_no, raw.c_str());
    }
  }
  return cfg;
}

std::optional<AnalysisConfig> load_config_csv(const std::string& path, const Logger& log) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_csv_stream(f, log);
}

} // namespace swa
