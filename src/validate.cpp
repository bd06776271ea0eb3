#include <swa/validate.hpp>
#include <cmath>
#include <string>

namespace swa {

static std::optional<double> first_time_of(const std::vector<Event>& sorted,
                                           EventType type,
                                           std::vector<DataWarning>& warnings) {
  std::optional<double> t;
  int count = 0;
  for (const auto& e : sorted) {
    if (e.type != type) continue;
    if (!t) t = e.time;
    ++count;
  }
  if (count > 1) {
    warnings.push_back({WarningKind::DuplicateEvent,
                        std::string(to_string(type)) + " recorded " + std::to_string(count) +
                        " times; using the first"});
  }
  return t;
}

double require_end_time(const std::vector<Event>& events) {
  const auto end = find_first(events, EventType::End);
  if (!end) {
    throw RaceDataError(ErrorKind::MissingEvent, EventType::End,
                        "missing 'end' event: cannot compute the final lap");
  }
  return end->time;
}

ValidatedEvents validate_events(const std::vector<Event>& events,
                                std::vector<DataWarning>& warnings) {
  for (const auto& e : events) {
    if (!(e.time >= 0.0) || !std::isfinite(e.time)) {
      throw RaceDataError(ErrorKind::InvalidEvent, e.type,
                          std::string("invalid time for '") + to_string(e.type) + "' event");
    }
  }

  ValidatedEvents out;
  out.events = sorted_by_time(events);

  const auto start = first_time_of(out.events, EventType::Start, warnings);
  if (!start) {
    throw RaceDataError(ErrorKind::MissingEvent, EventType::Start, "missing 'start' event");
  }
  const auto end = first_time_of(out.events, EventType::End, warnings);
  if (!end) {
    throw RaceDataError(ErrorKind::MissingEvent, EventType::End,
                        "missing 'end' event: cannot compute the final lap");
  }
  if (*end <= *start) {
    throw RaceDataError(ErrorKind::InvalidEvent, EventType::End,
                        "'end' event does not come after 'start'");
  }

  out.start_time = *start;
  out.end_time = *end;
  out.water_entry_time = first_time_of(out.events, EventType::WaterEntry, warnings);
  return out;
}

} // namespace swa
