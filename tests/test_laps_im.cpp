#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <set>
#include <vector>

#include <swa/laps.hpp>
#include <swa/metrics.hpp>

using Catch::Approx;
using namespace swa;

static RaceContext im(int distance) {
  RaceContext ctx;
  ctx.stroke = Stroke::IM;
  ctx.distance = distance;
  return ctx;
}

// 200 IM as captured: two-hand walls record start+end, back/free walls a single turn_end.
static std::vector<Event> im200_events() {
  return {
    {EventType::Start, 0.0},
    {EventType::WaterEntry, 0.8},
    {EventType::TurnStart, 13.0}, {EventType::TurnEnd, 13.8},   // fly -> fly
    {EventType::TurnStart, 28.0}, {EventType::TurnEnd, 28.9},   // fly -> back
    {EventType::TurnEnd, 44.0},                                  // back -> back
    {EventType::TurnStart, 59.5}, {EventType::TurnEnd, 60.5},   // back -> breast
    {EventType::TurnStart, 78.0}, {EventType::TurnEnd, 78.9},   // breast -> breast
    {EventType::TurnStart, 96.0}, {EventType::TurnEnd, 96.8},   // breast -> free
    {EventType::TurnEnd, 110.0},                                 // free -> free
    {EventType::End, 124.0},
  };
}

TEST_CASE("medley_stroke follows fly, back, breast, free") {
  REQUIRE(medley_stroke(0, 2) == Stroke::Butterfly);
  REQUIRE(medley_stroke(1, 2) == Stroke::Butterfly);
  REQUIRE(medley_stroke(2, 2) == Stroke::Backstroke);
  REQUIRE(medley_stroke(5, 2) == Stroke::Breaststroke);
  REQUIRE(medley_stroke(7, 2) == Stroke::Freestyle);
  REQUIRE(medley_stroke(15, 4) == Stroke::Freestyle);
}

TEST_CASE("200 IM walk: two-hand walls use turn_start, crossover uses turn_end") {
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(im200_events(), im(200), AnalysisConfig{}, warnings);

  const std::vector<double> want{0.0, 13.0, 28.0, 44.0, 60.5, 78.0, 96.0, 110.0, 124.0};
  REQUIRE(b.times.size() == want.size());
  for (std::size_t i = 0; i < want.size(); ++i) REQUIRE(b.times[i] == Approx(want[i]));

  REQUIRE(b.lap_count() == 8);
  REQUIRE_FALSE(b.used_fallback);
  REQUIRE(b.pair_laps == std::set<std::size_t>{0, 1, 3, 4, 5});
  REQUIRE(warnings.empty());
}

TEST_CASE("200 IM crossover also accepts a lone turn_end") {
  auto ev = im200_events();
  // drop the back -> breast turn_start
  ev.erase(ev.begin() + 7);
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(200), AnalysisConfig{}, warnings);
  REQUIRE_FALSE(b.used_fallback);
  REQUIRE(b.times[4] == Approx(60.5));
}

TEST_CASE("200 IM with 5 turn events falls back to chronological turns") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 13.0}, {EventType::TurnEnd, 13.8},
    {EventType::TurnStart, 28.0}, {EventType::TurnEnd, 28.9},
    {EventType::TurnEnd, 44.0},
    {EventType::End, 124.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(200), AnalysisConfig{}, warnings);

  REQUIRE(b.used_fallback);
  REQUIRE(b.lap_count() == 6);
  const std::vector<double> want{0.0, 13.0, 13.8, 28.0, 28.9, 44.0, 124.0};
  REQUIRE(b.times.size() == want.size());
  for (std::size_t i = 0; i < want.size(); ++i) REQUIRE(b.times[i] == Approx(want[i]));
  REQUIRE(b.expected_turns == 7);
  REQUIRE(has_warning(warnings, WarningKind::InsufficientTurnEvents));
}

TEST_CASE("200 IM walk mismatch with enough events uses the first 7 turns") {
  // One alternating press per wall: the sub-types no longer match the walls.
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 13.0},
    {EventType::TurnEnd, 28.0},
    {EventType::TurnStart, 44.0},
    {EventType::TurnEnd, 60.0},
    {EventType::TurnStart, 78.0},
    {EventType::TurnEnd, 96.0},
    {EventType::TurnStart, 110.0},
    {EventType::End, 124.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(200), AnalysisConfig{}, warnings);
  REQUIRE(b.used_fallback);
  REQUIRE(b.lap_count() == 8);
  REQUIRE(b.times[1] == Approx(13.0));
  REQUIRE(b.times[7] == Approx(110.0));
  REQUIRE_FALSE(has_warning(warnings, WarningKind::InsufficientTurnEvents));
  // eligibility still follows the medley order
  REQUIRE(b.pair_eligible(0));
  REQUIRE_FALSE(b.pair_eligible(2));
  REQUIRE(b.pair_eligible(3));
  REQUIRE_FALSE(b.pair_eligible(6));
}

TEST_CASE("400 IM walk yields 15 walls") {
  std::vector<Event> ev{{EventType::Start, 0.0}};
  double t = 0.0;
  for (std::size_t wall = 0; wall < 15; ++wall) {
    t += 16.0;
    const Stroke here = medley_stroke(wall, 4);
    const Stroke next = medley_stroke(wall + 1, 4);
    const bool two_hand = here == Stroke::Butterfly || here == Stroke::Breaststroke ||
                          (here == Stroke::Backstroke && next == Stroke::Breaststroke);
    if (two_hand) {
      ev.push_back({EventType::TurnStart, t});
      ev.push_back({EventType::TurnEnd, t + 0.9});
    } else {
      ev.push_back({EventType::TurnEnd, t});
    }
  }
  ev.push_back({EventType::End, t + 16.0});

  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(400), AnalysisConfig{}, warnings);
  REQUIRE_FALSE(b.used_fallback);
  REQUIRE(b.lap_count() == 16);
  REQUIRE(b.pair_laps == std::set<std::size_t>{0, 1, 2, 3, 7, 8, 9, 10, 11});
  // crossover wall (index 7) is bounded by its turn_end
  REQUIRE(b.times[8] == Approx(16.0 * 8 + 0.9));
  REQUIRE(warnings.empty());
}

TEST_CASE("100 IM uses one length per stroke") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 12.0}, {EventType::TurnEnd, 12.8},
    {EventType::TurnStart, 27.0}, {EventType::TurnEnd, 28.0},
    {EventType::TurnStart, 45.0}, {EventType::TurnEnd, 45.9},
    {EventType::End, 58.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(100), AnalysisConfig{}, warnings);
  REQUIRE_FALSE(b.used_fallback);
  const std::vector<double> want{0.0, 12.0, 28.0, 45.0, 58.0};
  REQUIRE(b.times.size() == want.size());
  for (std::size_t i = 0; i < want.size(); ++i) REQUIRE(b.times[i] == Approx(want[i]));
  REQUIRE(b.pair_laps == std::set<std::size_t>{0, 1, 2});
}

TEST_CASE("long-course 200 IM (50-unit pool) walks one length per stroke") {
  AnalysisConfig cfg;
  cfg.pool_length = 50.0;
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 28.0}, {EventType::TurnEnd, 28.8},
    {EventType::TurnStart, 62.0}, {EventType::TurnEnd, 63.0},
    {EventType::TurnStart, 100.0}, {EventType::TurnEnd, 100.9},
    {EventType::End, 130.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(200), cfg, warnings);
  REQUIRE_FALSE(b.used_fallback);
  REQUIRE(b.expected_turns == 3);
  REQUIRE(b.lap_count() == 4);
  REQUIRE(b.times[2] == Approx(63.0));
}

TEST_CASE("IM distance without whole lengths per stroke takes the first-n path") {
  // 150 units = 6 lengths, cannot split into four equal strokes
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnEnd, 14.0},
    {EventType::TurnStart, 30.0},
    {EventType::TurnEnd, 31.0},
    {EventType::TurnEnd, 47.0},
    {EventType::TurnEnd, 63.0},
    {EventType::TurnEnd, 79.0},
    {EventType::TurnEnd, 93.0},
    {EventType::End, 108.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(150), AnalysisConfig{}, warnings);
  REQUIRE(b.used_fallback);
  REQUIRE(b.expected_turns == 5);
  REQUIRE(b.lap_count() == 6);
  REQUIRE(b.times[5] == Approx(63.0));
  REQUIRE(warnings.empty());
  // fly, back->breast, breast walls; the freestyle tail carries no pair
  REQUIRE(b.pair_laps == std::set<std::size_t>{0, 1, 2});
}

TEST_CASE("50 IM has no lap eligible for a turn pair") {
  std::vector<Event> ev{
    {EventType::Start, 0.0},
    {EventType::TurnStart, 13.0}, {EventType::TurnEnd, 13.8},
    {EventType::TurnStart, 27.0}, {EventType::TurnEnd, 27.5},
    {EventType::End, 28.0},
  };
  std::vector<DataWarning> warnings;
  auto b = detect_lap_boundaries(ev, im(50), AnalysisConfig{}, warnings);
  REQUIRE(b.lap_count() == 2);
  REQUIRE(b.pair_laps.empty());
  REQUIRE_FALSE(b.pair_eligible(1));

  auto laps = compute_lap_stats(ev, b, nullptr, AnalysisConfig{}, warnings);
  REQUIRE(laps.size() == 2);
  REQUIRE(laps[1].lap_time == Approx(15.0));
  REQUIRE_FALSE(laps[0].turn_time.has_value());
  REQUIRE_FALSE(laps[1].turn_time.has_value());
}
