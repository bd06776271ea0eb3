#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

#include <swa/viewer/app.hpp>
#include <swa/report.hpp>

namespace swa {

namespace {

static const char* page_title(ViewerPage p) {
  switch (p) {
    case ViewerPage::Summary:      return "Summary";
    case ViewerPage::LapTimes:     return "Lap Times";
    case ViewerPage::StrokeCounts: return "Stroke Count per Lap";
    case ViewerPage::Tempo:        return "Stroke Intervals (Tempo)";
    default: return "?";
  }
}

// m:ss.cc, or ss.cc under a minute
static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%05.2f", minutes, rem);
  else             std::snprintf(out, (size_t)cap, "%.2f", rem);
}

static std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) out.push_back(line);
  return out;
}

// --- layout ---
static constexpr int kHeaderH  = 64;
static constexpr int kMargin   = 48;
static constexpr int kLineH    = 20;

static const Color kBackground{18, 32, 48, 255};
static const Color kPanel{24, 44, 64, 230};
static const Color kText{220, 230, 240, 255};
static const Color kDim{150, 170, 190, 255};
static const Color kBar{52, 152, 219, 255};
static const Color kBarBest{46, 204, 113, 255};
static const Color kLine{241, 196, 15, 255};

} // namespace

ViewerApp::ViewerApp(const RaceAnalysis& analysis) : analysis_(analysis) {}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "Swim Analyzer - Report");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  const int count = static_cast<int>(ViewerPage::Count);
  if (IsKeyPressed(KEY_RIGHT) || IsKeyPressed(KEY_TAB)) {
    page_ = static_cast<ViewerPage>((static_cast<int>(page_) + 1) % count);
  }
  if (IsKeyPressed(KEY_LEFT)) {
    page_ = static_cast<ViewerPage>((static_cast<int>(page_) + count - 1) % count);
  }
  if (IsKeyPressed(KEY_ONE))   page_ = ViewerPage::Summary;
  if (IsKeyPressed(KEY_TWO))   page_ = ViewerPage::LapTimes;
  if (IsKeyPressed(KEY_THREE)) page_ = ViewerPage::StrokeCounts;
  if (IsKeyPressed(KEY_FOUR))  page_ = ViewerPage::Tempo;

  if (page_ == ViewerPage::Summary) {
    const float wheel = GetMouseWheelMove();
    if (IsKeyDown(KEY_DOWN) || wheel < 0.0f) scroll_ += 1;
    if (IsKeyDown(KEY_UP)   || wheel > 0.0f) scroll_ = std::max(0, scroll_ - 1);
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(kBackground);

  switch (page_) {
    case ViewerPage::Summary:
      draw_summary_();
      break;
    case ViewerPage::LapTimes: {
      std::vector<double> v;
      for (const auto& lap : analysis_.laps) v.push_back(lap.lap_time);
      draw_bars_("Lap", v, "s");
      break;
    }
    case ViewerPage::StrokeCounts: {
      std::vector<double> v;
      for (const auto& lap : analysis_.laps) v.push_back(static_cast<double>(lap.stroke_count));
      draw_bars_("Lap", v, "");
      break;
    }
    case ViewerPage::Tempo:
      draw_tempo_();
      break;
    default:
      break;
  }

  draw_header_();
  EndDrawing();
}

void ViewerApp::draw_header_() {
  char total[32];
  fmt_time(analysis_.summary.total_time, total, sizeof(total));
  const std::string race = describe(analysis_.context);

  DrawRectangle(0, 0, GetScreenWidth(), kHeaderH, kPanel);
  DrawText(TextFormat("%s  %s  total=%s  laps=%d  [%d/%d] %s",
                      analysis_.context.swimmer.empty() ? "-" : analysis_.context.swimmer.c_str(),
                      race.c_str(),
                      total,
                      (int)analysis_.laps.size(),
                      static_cast<int>(page_) + 1,
                      static_cast<int>(ViewerPage::Count),
                      page_title(page_)),
           20, 12, 20, kText);
  DrawText("Left/Right or Tab: Page | 1..4: Jump | Up/Down or Wheel: Scroll summary | Esc: Quit",
           20, 40, 14, kDim);
}

void ViewerApp::draw_summary_() {
  const auto lines = split_lines(summary_string(analysis_));
  const int rows = (GetScreenHeight() - kHeaderH - 2 * kLineH) / kLineH;
  scroll_ = std::min(scroll_, std::max(0, (int)lines.size() - rows));

  int y = kHeaderH + kLineH;
  for (int i = scroll_; i < (int)lines.size() && i < scroll_ + rows; ++i) {
    DrawText(lines[i].c_str(), kMargin, y, 16, kText);
    y += kLineH;
  }
}

void ViewerApp::draw_bars_(const char* label, const std::vector<double>& values, const char* unit) {
  const int x0 = kMargin;
  const int y0 = kHeaderH + kMargin;
  const int w  = GetScreenWidth() - 2 * kMargin;
  const int h  = GetScreenHeight() - kHeaderH - 2 * kMargin - kLineH;
  DrawLine(x0, y0 + h, x0 + w, y0 + h, kDim);

  if (values.empty()) {
    DrawText("no laps", x0, y0, 20, kDim);
    return;
  }

  const double vmax = *std::max_element(values.begin(), values.end());
  const double vmin = *std::min_element(values.begin(), values.end());
  const float slot = float(w) / float(values.size());
  const float bar_w = std::max(2.0f, slot * 0.7f);

  for (std::size_t i = 0; i < values.size(); ++i) {
    const float frac = vmax > 0.0 ? float(values[i] / vmax) : 0.0f;
    const float bh = frac * float(h - kLineH);
    const float bx = x0 + slot * float(i) + (slot - bar_w) * 0.5f;
    const float by = float(y0 + h) - bh;
    DrawRectangleV({bx, by}, {bar_w, bh}, values[i] == vmin ? kBarBest : kBar);
    DrawText(TextFormat("%.2f%s", values[i], unit), (int)bx, (int)by - 18, 14, kText);
    DrawText(TextFormat("%s %d", label, (int)i + 1), (int)bx, y0 + h + 6, 14, kDim);
  }
}

void ViewerApp::draw_tempo_() {
  const auto& iv = analysis_.summary.stroke_intervals;
  const int x0 = kMargin;
  const int y0 = kHeaderH + kMargin;
  const int w  = GetScreenWidth() - 2 * kMargin;
  const int h  = GetScreenHeight() - kHeaderH - 2 * kMargin - kLineH;
  DrawLine(x0, y0 + h, x0 + w, y0 + h, kDim);
  DrawLine(x0, y0, x0, y0 + h, kDim);

  if (iv.size() < 2) {
    DrawText("not enough strokes recorded", x0 + 10, y0, 20, kDim);
    return;
  }

  const double vmax = *std::max_element(iv.begin(), iv.end());
  auto to_screen = [&](std::size_t i, double v) {
    const float x = x0 + float(w) * float(i) / float(iv.size() - 1);
    const float y = float(y0 + h) - (vmax > 0.0 ? float(v / vmax) : 0.0f) * float(h);
    return Vector2{x, y};
  };

  for (std::size_t i = 1; i < iv.size(); ++i) {
    DrawLineEx(to_screen(i - 1, iv[i - 1]), to_screen(i, iv[i]), 2.0f, kLine);
  }
  for (std::size_t i = 0; i < iv.size(); ++i) {
    DrawCircleV(to_screen(i, iv[i]), 3.0f, kLine);
  }

  DrawText(TextFormat("max %.2fs", vmax), x0 + 6, y0, 14, kDim);
  if (analysis_.summary.avg_stroke_interval) {
    DrawText(TextFormat("avg %.2fs over %d intervals",
                        *analysis_.summary.avg_stroke_interval, (int)iv.size()),
             x0 + 6, y0 + h + 6, 14, kDim);
  }
}

} // namespace swa
