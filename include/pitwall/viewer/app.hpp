#pragma once
#include <cstdint>
#include <memory>
#include <pitwall/feed_runner.hpp>
#include <pitwall/log.hpp>

namespace pitwall {

// RAII application that renders the latest pit-wall snapshot.
class ViewerApp {
public:
  explicit ViewerApp(FeedRunner& feed);
  ~ViewerApp();
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_track_(const PitWallSnapshot& s);
  void draw_hud_(const PitWallSnapshot& s);
  void draw_strategy_(const PitWallSnapshot& s, int x, int y, int w);
  void draw_fuel_(const PitWallSnapshot& s, int x, int y, int w);
  void draw_tires_(const PitWallSnapshot& s, int x, int y, int w);
  void draw_driver_(const PitWallSnapshot& s, int x, int y, int w);
  void draw_log_(int x, int y, int w, int h);

  FeedRunner& feed_;
  std::shared_ptr<log::MemorySink> log_sink_;
  PitWallSnapshot last_snap_{};
  std::uint64_t cursor_{0};
};

} // namespace pitwall
