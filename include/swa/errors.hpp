#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <swa/event.hpp>

namespace swa {

enum class ErrorKind {
  MissingEvent, // no start / end event in the stream
  InvalidEvent  // e.g. negative timestamp
};

// Fatal: the race cannot be segmented. Thrown before any lap is computed.
class RaceDataError : public std::runtime_error {
public:
  RaceDataError(ErrorKind kind, EventType event, const std::string& what)
    : std::runtime_error(what), kind_(kind), event_(event) {}

  ErrorKind kind() const noexcept { return kind_; }
  EventType event() const noexcept { return event_; }

private:
  ErrorKind kind_;
  EventType event_;
};

enum class WarningKind {
  InsufficientTurnEvents,
  MismatchedManualData,
  DuplicateEvent
};

// Non-fatal data-quality finding attached to an analysis.
struct DataWarning {
  WarningKind kind;
  std::string message;
};

const char* to_string(WarningKind k);

inline bool has_warning(const std::vector<DataWarning>& ws, WarningKind k) {
  for (const auto& w : ws) {
    if (w.kind == k) return true;
  }
  return false;
}

} // namespace swa
