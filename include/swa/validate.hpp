#pragma once
#include <optional>
#include <vector>
#include <swa/errors.hpp>
#include <swa/event.hpp>

namespace swa {

// A time-ordered event stream with its anchor events resolved.
struct ValidatedEvents {
  std::vector<Event> events;        // stable-sorted by time
  double start_time = 0.0;
  double end_time = 0.0;
  std::optional<double> water_entry_time;
};

// Throws RaceDataError when start or end is missing or a timestamp is negative.
// Repeated start / end / water_entry events keep the first and add a DuplicateEvent warning.
ValidatedEvents validate_events(const std::vector<Event>& events,
                                std::vector<DataWarning>& warnings);

// End time of the stream; throws RaceDataError(MissingEvent, End) when absent.
double require_end_time(const std::vector<Event>& events);

} // namespace swa
