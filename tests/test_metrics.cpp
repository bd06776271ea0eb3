#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <swa/laps.hpp>
#include <swa/metrics.hpp>

using Catch::Approx;
using namespace swa;

static RaceContext race(Stroke s, int distance) {
  RaceContext ctx;
  ctx.stroke = s;
  ctx.distance = distance;
  return ctx;
}

static std::vector<LapStat> stats_for(const std::vector<Event>& ev,
                                      const RaceContext& ctx,
                                      const ManualMeasurements* manual,
                                      std::vector<DataWarning>& warnings,
                                      const AnalysisConfig& cfg = AnalysisConfig{}) {
  auto b = detect_lap_boundaries(ev, ctx, cfg, warnings);
  return compute_lap_stats(ev, b, manual, cfg, warnings);
}

TEST_CASE("freestyle 75: lap times and no turn time") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.3},
    {EventType::TurnEnd, 25.1},
    {EventType::TurnEnd, 50.3},
    {EventType::End, 75.6},
  };
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 75), nullptr, warnings);
  REQUIRE(laps.size() == 3);
  REQUIRE(laps[0].lap == 1);
  REQUIRE(laps[0].lap_time == Approx(25.1));
  REQUIRE(laps[1].lap_time == Approx(25.2));
  REQUIRE(laps[2].lap_time == Approx(25.3));
  for (const auto& l : laps) {
    REQUIRE_FALSE(l.turn_time.has_value());
    REQUIRE_FALSE(l.stroke_to_wall.has_value());
    REQUIRE_FALSE(l.underwater_speed.has_value());
    REQUIRE(l.stroke_count == 0);
    REQUIRE(l.strokes_per_second == Approx(0.0));
  }
}

TEST_CASE("freestyle never reports turn_time even with turn pairs recorded") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 24.5},
    {EventType::TurnEnd, 25.0},
    {EventType::End, 51.0},
  };
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 50), nullptr, warnings);
  REQUIRE(laps.size() == 2);
  for (const auto& l : laps) REQUIRE_FALSE(l.turn_time.has_value());
}

TEST_CASE("butterfly 50: first lap carries the turn time") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 28.0},
    {EventType::TurnEnd, 29.5},
    {EventType::End, 55.0},
  };
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Butterfly, 50), nullptr, warnings);
  REQUIRE(laps.size() == 2);
  REQUIRE(laps[0].lap == 1);
  REQUIRE(laps[0].turn_time.has_value());
  REQUIRE(*laps[0].turn_time == Approx(1.5));
  REQUIRE_FALSE(laps[1].turn_time.has_value());
}

TEST_CASE("breaststroke 100: every walled lap has a turn time") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 30.1}, {EventType::TurnEnd, 31.0},
    {EventType::TurnStart, 62.4}, {EventType::TurnEnd, 63.2},
    {EventType::TurnStart, 95.0}, {EventType::TurnEnd, 95.9},
    {EventType::End, 127.3},
  };
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Breaststroke, 100), nullptr, warnings);
  REQUIRE(laps.size() == 4);
  REQUIRE(*laps[0].turn_time == Approx(0.9));
  REQUIRE(*laps[1].turn_time == Approx(0.8));
  REQUIRE(*laps[2].turn_time == Approx(0.9));
  REQUIRE_FALSE(laps[3].turn_time.has_value());
}

TEST_CASE("stroke count, stroke rate and stroke-to-wall") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.5},
    {EventType::Stroke, 4.0},
    {EventType::Stroke, 5.0},
    {EventType::Stroke, 6.0},
    {EventType::Stroke, 9.0},
    {EventType::TurnEnd, 10.0},
    {EventType::Stroke, 14.0},
    {EventType::Stroke, 18.0},
    {EventType::End, 20.0},
  };
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 50), nullptr, warnings);
  REQUIRE(laps.size() == 2);

  // lap 1: 4 strokes from 4.0 to the wall at 10.0
  REQUIRE(laps[0].stroke_count == 4);
  REQUIRE(laps[0].strokes_per_second == Approx(4.0 / 6.0));
  REQUIRE(laps[0].stroke_to_wall.has_value());
  REQUIRE(*laps[0].stroke_to_wall == Approx(1.0));

  // lap 2: no turn after the last stroke, so the finish is the wall
  REQUIRE(laps[1].stroke_count == 2);
  REQUIRE(laps[1].strokes_per_second == Approx(2.0 / 6.0));
  REQUIRE(*laps[1].stroke_to_wall == Approx(2.0));
}

TEST_CASE("manual measurements: underwater and overwater figures") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.2},
    {EventType::End, 14.0},
  };
  ManualMeasurements manual{{1.0, 5.0, 6.0}};
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 25), &manual, warnings);
  REQUIRE(laps.size() == 1);
  const auto& l = laps[0];
  REQUIRE(*l.breakout_time_rel == Approx(0.8));
  REQUIRE(*l.breakout_distance == Approx(5.0));
  REQUIRE(*l.underwater_speed == Approx(6.25));
  REQUIRE(*l.breakout_to_fifteen == Approx(5.0));
  REQUIRE(*l.fifteen_to_turn == Approx(8.0));
  // no strokes: overwater runs from breakout to the end of the lap
  REQUIRE(*l.overwater_speed == Approx((25.0 - 5.0 - 0.5) / 13.0));
  // stroke rate measured from the breakout
  REQUIRE(l.strokes_per_second == Approx(0.0));
  REQUIRE(warnings.empty());
}

TEST_CASE("manual measurements: overwater ends at the last stroke after breakout") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.5},
    {EventType::Stroke, 3.0},
    {EventType::Stroke, 4.0},
    {EventType::Stroke, 11.0},
    {EventType::TurnEnd, 12.0},
    {EventType::Stroke, 16.0},
    {EventType::End, 24.0},
  };
  ManualMeasurements manual{{2.5, 6.0, std::nullopt}, {14.5, 4.0, 17.0}};
  AnalysisConfig cfg;
  cfg.hand_touch_allowance = 1.0;
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 50), &manual, warnings, cfg);
  REQUIRE(laps.size() == 2);

  REQUIRE(*laps[0].breakout_time_rel == Approx(2.0));
  REQUIRE(*laps[0].overwater_speed == Approx((25.0 - 6.0 - 1.0) / (11.0 - 2.5)));
  REQUIRE(laps[0].strokes_per_second == Approx(3.0 / (12.0 - 2.5)));
  REQUIRE_FALSE(laps[0].breakout_to_fifteen.has_value());
  REQUIRE_FALSE(laps[0].fifteen_to_turn.has_value());

  // later laps measure underwater time from the previous wall
  REQUIRE(*laps[1].breakout_time_rel == Approx(2.5));
  REQUIRE(*laps[1].underwater_speed == Approx(4.0 / 2.5));
  REQUIRE(*laps[1].overwater_speed == Approx((25.0 - 4.0 - 1.0) / (16.0 - 14.5)));
  REQUIRE(*laps[1].breakout_to_fifteen == Approx(2.5));
  REQUIRE(*laps[1].fifteen_to_turn == Approx(7.0));
}

TEST_CASE("manual rows shorter than the lap count only cover their laps") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.4},
    {EventType::TurnEnd, 25.0},
    {EventType::TurnEnd, 51.0},
    {EventType::End, 77.0},
  };
  ManualMeasurements manual{{1.4, 5.0, 6.0}};
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 75), &manual, warnings);
  REQUIRE(laps.size() == 3);
  REQUIRE(laps[0].underwater_speed.has_value());
  REQUIRE_FALSE(laps[1].underwater_speed.has_value());
  REQUIRE_FALSE(laps[2].breakout_time_rel.has_value());
  REQUIRE(has_warning(warnings, WarningKind::MismatchedManualData));
}

TEST_CASE("non-positive underwater or overwater time yields zero speed") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 1.0},
    {EventType::End, 10.0},
  };
  ManualMeasurements manual{{1.0, 5.0, std::nullopt}, {0.0, 0.0, std::nullopt}};
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, race(Stroke::Freestyle, 25), &manual, warnings);
  REQUIRE(laps.size() == 1);
  REQUIRE(*laps[0].breakout_time_rel == Approx(0.0));
  REQUIRE(*laps[0].underwater_speed == Approx(0.0));

  ManualMeasurements late{{12.0, 5.0, std::nullopt}};
  auto laps2 = stats_for(ev, race(Stroke::Freestyle, 25), &late, warnings);
  REQUIRE(*laps2[0].overwater_speed == Approx(0.0));
  REQUIRE(laps2[0].strokes_per_second == Approx(0.0));
}

TEST_CASE("200 IM: fly, breast and crossover laps carry turn times") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 13.0}, {EventType::TurnEnd, 13.8},
    {EventType::TurnStart, 28.0}, {EventType::TurnEnd, 28.9},
    {EventType::TurnEnd, 44.0},
    {EventType::TurnStart, 59.5}, {EventType::TurnEnd, 60.5},
    {EventType::TurnStart, 78.0}, {EventType::TurnEnd, 78.9},
    {EventType::TurnStart, 96.0}, {EventType::TurnEnd, 96.8},
    {EventType::TurnEnd, 110.0},
    {EventType::End, 124.0},
  };
  RaceContext ctx;
  ctx.stroke = Stroke::IM;
  ctx.distance = 200;
  std::vector<DataWarning> warnings;
  auto laps = stats_for(ev, ctx, nullptr, warnings);
  REQUIRE(laps.size() == 8);

  REQUIRE(*laps[0].turn_time == Approx(0.8));
  REQUIRE(*laps[1].turn_time == Approx(0.9));
  REQUIRE_FALSE(laps[2].turn_time.has_value());   // back -> back
  REQUIRE(*laps[3].turn_time == Approx(1.0));     // crossover
  REQUIRE(*laps[4].turn_time == Approx(0.9));
  REQUIRE(*laps[5].turn_time == Approx(0.8));
  REQUIRE_FALSE(laps[6].turn_time.has_value());
  REQUIRE_FALSE(laps[7].turn_time.has_value());
}

TEST_CASE("fields() omits absent values and keeps a fixed order") {
  LapStat s;
  s.lap = 2;
  s.lap_time = 30.0;
  s.stroke_count = 12;
  s.turn_time = 1.1;
  auto f = s.fields();
  REQUIRE(f.size() == lap_stat_field_names().size());
  REQUIRE(std::string(f[0].first) == "lap_time");
  REQUIRE(f[1].second.has_value());
  REQUIRE_FALSE(f[2].second.has_value());
  REQUIRE(*f[3].second == Approx(12.0));
}

TEST_CASE("round2 rounds half away from zero to two decimals") {
  REQUIRE(round2(6.254) == Approx(6.25));
  REQUIRE(round2(1.005001) == Approx(1.01));
  REQUIRE(round2(-0.126) == Approx(-0.13));
}
