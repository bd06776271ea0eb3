#include <swa/io.hpp>
#include <fstream>
#include <swa/csv.hpp>

namespace swa {

static std::optional<Event> parse_event_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  const auto type = event_type_from_string(cols[0]);
  if (!type) return std::nullopt;
  double t = 0.0;
  if (!csv::to_double(cols[1], t) || t < 0.0) return std::nullopt;
  return Event{*type, t};
}

static std::optional<ManualLap> parse_manual_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  ManualLap m;
  if (!csv::to_double(cols[0], m.breakout_time)) return std::nullopt;
  if (!csv::to_double(cols[1], m.breakout_distance)) return std::nullopt;
  if (cols.size() >= 3 && !cols[2].empty()) {
    double f = 0.0;
    if (!csv::to_double(cols[2], f)) return std::nullopt;
    m.fifteen_time = f;
  }
  return m;
}

// Shared line loop: skips comments, one header row and rows the parser rejects.
template <class Row, class Parse>
static std::vector<Row> read_rows(std::istream& in, const char* header_first, Parse parse,
                                  const Logger& log, const char* what) {
  std::vector<Row> out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && !cols.empty() && cols[0] == header_first) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse(cols); row.has_value()) {
      out.push_back(*row);
    } else {
      log.warn("%s line %d skipped: '%s'", what, line_no, raw.c_str());
    }
  }
  return out;
}

std::vector<Event> events_from_csv_stream(std::istream& in, const Logger& log) {
  return read_rows<Event>(in, "type", parse_event_row, log, "events");
}

std::optional<std::vector<Event>> load_events_csv(const std::string& path, const Logger& log) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return events_from_csv_stream(f, log);
}

ManualMeasurements manual_from_csv_stream(std::istream& in, const Logger& log) {
  return read_rows<ManualLap>(in, "breakout_time", parse_manual_row, log, "manual");
}

std::optional<ManualMeasurements> load_manual_csv(const std::string& path, const Logger& log) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return manual_from_csv_stream(f, log);
}

} // namespace swa
