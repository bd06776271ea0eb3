#include <swa/event.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace swa {

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

const char* to_string(EventType t) {
  switch (t) {
    case EventType::Start:      return "start";
    case EventType::WaterEntry: return "water_entry";
    case EventType::Stroke:     return "stroke";
    case EventType::TurnStart:  return "turn_start";
    case EventType::TurnEnd:    return "turn_end";
    case EventType::Breakout:   return "breakout";
    case EventType::End:        return "end";
  }
  return "unknown";
}

const char* to_string(Stroke s) {
  switch (s) {
    case Stroke::Freestyle:    return "freestyle";
    case Stroke::Backstroke:   return "backstroke";
    case Stroke::Breaststroke: return "breaststroke";
    case Stroke::Butterfly:    return "butterfly";
    case Stroke::IM:           return "im";
  }
  return "unknown";
}

const char* to_string(Gender g) {
  return g == Gender::Women ? "women" : "men";
}

std::optional<EventType> event_type_from_string(const std::string& s) {
  static const EventType kAll[] = {
    EventType::Start, EventType::WaterEntry, EventType::Stroke, EventType::TurnStart,
    EventType::TurnEnd, EventType::Breakout, EventType::End
  };
  const auto key = lower(s);
  for (auto t : kAll) {
    if (key == to_string(t)) return t;
  }
  return std::nullopt;
}

std::optional<Stroke> stroke_from_string(const std::string& s) {
  const auto key = lower(s);
  if (key == "freestyle" || key == "free")  return Stroke::Freestyle;
  if (key == "backstroke" || key == "back") return Stroke::Backstroke;
  if (key == "breaststroke" || key == "breast") return Stroke::Breaststroke;
  if (key == "butterfly" || key == "fly")   return Stroke::Butterfly;
  if (key == "im")                          return Stroke::IM;
  return std::nullopt;
}

std::optional<Gender> gender_from_string(const std::string& s) {
  auto key = lower(s);
  // "men's" -> "men"
  if (key.size() > 2 && key.compare(key.size() - 2, 2, "'s") == 0) key.resize(key.size() - 2);
  if (key == "men")   return Gender::Men;
  if (key == "women") return Gender::Women;
  return std::nullopt;
}

bool is_standard_distance(int distance) {
  static const int kDistances[] = {50, 100, 200, 400, 500, 1000, 1650};
  return std::find(std::begin(kDistances), std::end(kDistances), distance) != std::end(kDistances);
}

std::optional<RaceContext> parse_race_details(const std::string& details) {
  std::istringstream in(details);
  std::vector<std::string> parts;
  for (std::string w; in >> w;) parts.push_back(w);
  if (parts.size() < 3) return std::nullopt;

  const auto gender = gender_from_string(parts[0]);
  if (!gender) return std::nullopt;

  int distance = 0;
  try {
    std::size_t idx = 0;
    distance = std::stoi(parts[1], &idx);
    if (idx != parts[1].size()) return std::nullopt;
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (!is_standard_distance(distance)) return std::nullopt;

  // Stroke may span several words ("Individual Medley" is not accepted, "IM" is).
  std::string stroke_name = parts[2];
  for (std::size_t i = 3; i < parts.size(); ++i) stroke_name += " " + parts[i];
  const auto stroke = stroke_from_string(stroke_name);
  if (!stroke) return std::nullopt;

  RaceContext ctx;
  ctx.gender = *gender;
  ctx.distance = distance;
  ctx.stroke = *stroke;
  return ctx;
}

std::string describe(const RaceContext& ctx) {
  static const char* kStrokeTitle[] = {"Freestyle", "Backstroke", "Breaststroke", "Butterfly", "IM"};
  std::string out = ctx.gender == Gender::Women ? "Women's " : "Men's ";
  out += std::to_string(ctx.distance);
  out += " ";
  out += kStrokeTitle[static_cast<int>(ctx.stroke)];
  if (ctx.relay) out += " Relay";
  return out;
}

std::vector<Event> sorted_by_time(const std::vector<Event>& events) {
  std::vector<Event> out = events;
  std::stable_sort(out.begin(), out.end(),
                   [](const Event& a, const Event& b){ return a.time < b.time; });
  return out;
}

std::optional<Event> find_first(const std::vector<Event>& events, EventType type) {
  auto it = std::find_if(events.begin(), events.end(),
                         [&](const Event& e){ return e.type == type; });
  if (it == events.end()) return std::nullopt;
  return *it;
}

std::vector<Event> events_of_type(const std::vector<Event>& events, EventType type) {
  std::vector<Event> out;
  for (const auto& e : events) {
    if (e.type == type) out.push_back(e);
  }
  return out;
}

std::vector<Event> turn_events(const std::vector<Event>& events) {
  std::vector<Event> out;
  for (const auto& e : events) {
    if (is_turn(e.type)) out.push_back(e);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Event& a, const Event& b){ return a.time < b.time; });
  return out;
}

} // namespace swa
