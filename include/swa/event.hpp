#pragma once
#include <optional>
#include <string>
#include <vector>

namespace swa {

enum class EventType {
  Start,
  WaterEntry,
  Stroke,
  TurnStart,
  TurnEnd,
  Breakout,
  End
};

struct Event {
  EventType type = EventType::Stroke;
  double time = 0.0; // seconds since start
};

enum class Stroke { Freestyle, Backstroke, Breaststroke, Butterfly, IM };
enum class Gender { Men, Women };

struct RaceContext {
  Stroke stroke = Stroke::Freestyle;
  int distance = 0;          // yards or meters, matches pool_length units
  Gender gender = Gender::Men;
  std::string session;       // e.g. "prelims"
  std::string swimmer;
  bool relay = false;
};

// Names as written by the capture layer ("turn_start", "water_entry", ...).
const char* to_string(EventType t);
const char* to_string(Stroke s);
const char* to_string(Gender g);

// Case-insensitive; nullopt for unknown names.
std::optional<EventType> event_type_from_string(const std::string& s);
std::optional<Stroke> stroke_from_string(const std::string& s);
std::optional<Gender> gender_from_string(const std::string& s);

inline bool is_turn(EventType t) {
  return t == EventType::TurnStart || t == EventType::TurnEnd;
}

// Standard race distances; anything else is rejected by parse_race_details.
bool is_standard_distance(int distance);

// Parses "Men's 50 Freestyle" / "Women's 200 IM". Session, swimmer and relay
// are left at their defaults.
std::optional<RaceContext> parse_race_details(const std::string& details);

// "Men's 200 IM"
std::string describe(const RaceContext& ctx);

// Time-ordered copy of the events (stable for equal times).
std::vector<Event> sorted_by_time(const std::vector<Event>& events);

// First event of the given type, if any.
std::optional<Event> find_first(const std::vector<Event>& events, EventType type);

// Events of one type, in input order.
std::vector<Event> events_of_type(const std::vector<Event>& events, EventType type);

// Time-sorted turn_start / turn_end events.
std::vector<Event> turn_events(const std::vector<Event>& events);

} // namespace swa
