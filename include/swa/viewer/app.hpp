#pragma once
#include <swa/analysis.hpp>

namespace swa {

enum class ViewerPage : int {
  Summary = 0,
  LapTimes = 1,
  StrokeCounts = 2,
  Tempo = 3,
  Count
};

// RAII window that pages through one analyzed race.
class ViewerApp {
public:
  explicit ViewerApp(const RaceAnalysis& analysis);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void render_frame_();
  void draw_header_();
  void draw_summary_();
  void draw_bars_(const char* label, const std::vector<double>& values, const char* unit);
  void draw_tempo_();

  const RaceAnalysis& analysis_;
  ViewerPage page_{ViewerPage::Summary};
  int scroll_{0}; // summary page, lines
};

} // namespace swa
