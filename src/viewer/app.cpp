#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

#include <pitwall/viewer/app.hpp>

namespace pitwall {

namespace {

const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  if (w == 8.0)  return "8x";
  if (w == 16.0) return "16x";
  return "custom";
}

// Time formatting helpers
void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s <= 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

void fmt_opt(const std::optional<double>& v, const char* f, char* out, int cap) {
  if (v) std::snprintf(out, (size_t)cap, f, *v);
  else   std::snprintf(out, (size_t)cap, "%s", "--");
}

const Color kText    = Color{220, 220, 230, 255};
const Color kDim     = Color{110, 110, 120, 255};   // InsufficientData
const Color kPanel   = Color{24, 24, 28, 220};
const Color kGreen   = Color{ 80, 220, 120, 255};
const Color kAmber   = Color{240, 180,  60, 255};
const Color kRed     = Color{231,  76,  60, 255};
const Color kBlue    = Color{ 52, 152, 219, 255};

Color priorityColor(Priority p) {
  switch (p) {
    case Priority::Critical: return kRed;
    case Priority::High:     return kAmber;
    case Priority::Medium:   return kBlue;
    case Priority::Low:      return kGreen;
  }
  return kText;
}

Color tempColor(double t, const TireWindow& w) {
  if (t > w.overheat) return kRed;
  if (t > w.optimal_max) return kAmber;
  if (t < w.optimal_min) return kBlue;
  return kGreen;
}

Color levelColor(log::Level lv) {
  switch (lv) {
    case log::Level::Trace:
    case log::Level::Debug: return kDim;
    case log::Level::Info:  return kText;
    case log::Level::Warn:  return kAmber;
    case log::Level::Error: return kRed;
  }
  return kText;
}

void panel(int x, int y, int w, int h, const char* title, bool ok) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, Color{0, 0, 0, 80});
  DrawRectangle(x, y, w, h, kPanel);
  DrawText(title, x + 8, y + 6, 18, ok ? kText : kDim);
  if (!ok) DrawText("insufficient data", x + w - 150, y + 8, 14, kDim);
  DrawLine(x, y + 28, x + w, y + 28, Color{60, 60, 70, 255});
}

// --- Layout ---
constexpr int kHUD_LINE1_Y = 20;
constexpr int kHUD_LINE2_Y = 46;
constexpr int kPANEL_Y     = 84;
constexpr int kROW_H       = 20;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(FeedRunner& feed)
  : feed_(feed), log_sink_(std::make_shared<log::MemorySink>(12)) {
  log::Logger::instance().add_sink(log_sink_);
}

ViewerApp::~ViewerApp() {
  log::Logger::instance().remove_sink(log_sink_);
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "pitwall");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) {
    double cur = feed_.time_scale.load();
    feed_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   feed_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_TWO))   feed_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_THREE)) feed_.time_scale.store(4.0);
  if (IsKeyPressed(KEY_FOUR))  feed_.time_scale.store(8.0);
  if (IsKeyPressed(KEY_FIVE))  feed_.time_scale.store(16.0);

  if (IsKeyPressed(KEY_P)) feed_.request_pit();
  if (IsKeyPressed(KEY_R)) feed_.request_reset();
}

void ViewerApp::pump_snapshots_() {
  (void)feed_.buffer().try_consume_latest(cursor_, last_snap_);
}

void ViewerApp::render_frame_() {
  const PitWallSnapshot& s = last_snap_;

  BeginDrawing();
  ClearBackground(Color{18, 20, 24, 255});

  const int col_w = 400;
  draw_strategy_(s, 20, kPANEL_Y, 2 * col_w + 20);
  draw_fuel_(s, 20, kPANEL_Y + 150, col_w);
  draw_tires_(s, 40 + col_w, kPANEL_Y + 150, col_w);
  draw_driver_(s, 20, kPANEL_Y + 420, col_w);
  draw_log_(40 + col_w, kPANEL_Y + 420, col_w, 260);
  draw_track_(s);
  draw_hud_(s);
  EndDrawing();
}

void ViewerApp::draw_track_(const PitWallSnapshot& s) {
  // Track map, scaled to fit the right column.
  const float cx = GetScreenWidth() - 210.0f;
  const float cy = kPANEL_Y + 230.0f;
  const float r_px = 160.0f;
  DrawRing({cx, cy}, r_px - 8.0f, r_px + 8.0f, 0.0f, 360.0f, 96, Color{40, 40, 46, 255});
  // Sector marks at thirds.
  for (int k = 0; k < 3; ++k) {
    const float a = float(k) / 3.0f * 2.0f * PI;
    DrawLineEx({cx + (r_px - 12.0f) * std::cos(a), cy - (r_px - 12.0f) * std::sin(a)},
               {cx + (r_px + 12.0f) * std::cos(a), cy - (r_px + 12.0f) * std::sin(a)},
               3.0f, k == 0 ? Color{240, 240, 240, 255} : kDim);
  }
  if (s.track_radius_m > 0.0) {
    const float px = cx + float(s.x / s.track_radius_m) * r_px;
    const float py = cy - float(s.y / s.track_radius_m) * r_px;
    DrawCircleV({px, py}, 7.0f, kRed);
  }
  DrawText(TextFormat("S%d  %.0f km/h", s.latest.sector, s.latest.speed),
           int(cx) - 60, int(cy) - 10, 20, kText);
}

void ViewerApp::draw_hud_(const PitWallSnapshot& s) {
  const double warp = feed_.time_scale.load();
  char best[32], mean[32];
  fmt_time(s.summary.best_lap_time.value_or(-1.0), best, sizeof(best));
  fmt_time(s.summary.mean_lap_time.value_or(-1.0), mean, sizeof(mean));

  DrawText(TextFormat("session=%s  lap=%d  sim=%.1fs  warp=%s  samples=%d  rejected=%d  stops=%d",
                      s.summary.id.c_str(),
                      s.analysis.current_lap,
                      s.sim_time,
                      warpLabel(warp),
                      (int)s.summary.samples_held,
                      (int)s.summary.samples_rejected,
                      s.summary.pit_stops),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});
  DrawText(TextFormat("laps done=%d  best=%s  mean=%s   |  Space: Pause | 1..5: 1x 2x 4x 8x 16x | P: Pit | R: Reset",
                      s.summary.laps_completed, best, mean),
           20, kHUD_LINE2_Y, 16, Color{190, 205, 190, 255});
}

void ViewerApp::draw_strategy_(const PitWallSnapshot& s, int x, int y, int w) {
  const auto& rec = s.analysis.strategy;
  const Color pc = priorityColor(rec.priority);
  DrawRectangle(x - 6, y - 6, w + 12, 132, Color{0, 0, 0, 80});
  DrawRectangle(x, y, w, 120, kPanel);
  DrawRectangle(x, y, 8, 120, pc);

  DrawText(TextFormat("%s", to_string(rec.action)), x + 20, y + 10, 36, pc);
  DrawText(TextFormat("[%s]", to_string(rec.priority)), x + 20, y + 52, 18, pc);
  DrawText(rec.reason.c_str(), x + 20, y + 78, 18, kText);

  const auto& pw = rec.supporting.pit_window;
  char win[64];
  if (pw.optimal_lap) {
    std::snprintf(win, sizeof(win), "window %d-%d (opt %d)", *pw.window_start, *pw.window_end, *pw.optimal_lap);
  } else {
    std::snprintf(win, sizeof(win), "%s", "no pit window");
  }
  const int rx = x + w - 300;
  DrawText(win, rx, y + 12, 16, kText);
  DrawText(TextFormat("undercut %s  overcut %s", pw.undercut ? "yes" : "no", pw.overcut ? "yes" : "no"),
           rx, y + 34, 16, kText);
  char ga[32], gb[32];
  fmt_opt(s.analysis.gap_ahead, "%.1fs", ga, sizeof(ga));
  fmt_opt(s.analysis.gap_behind, "%.1fs", gb, sizeof(gb));
  DrawText(TextFormat("ahead %s  behind %s  at risk %d", ga, gb, pw.positions_at_risk), rx, y + 56, 16, kText);
  if (rec.fuel_to_add_l > 0.0) {
    DrawText(TextFormat("add %.1f l", rec.fuel_to_add_l), rx, y + 78, 16, kAmber);
  }
}

void ViewerApp::draw_fuel_(const PitWallSnapshot& s, int x, int y, int w) {
  const auto& f = s.analysis.fuel;
  const bool ok = f.status == DataStatus::Ok;
  panel(x, y, w, 250, "Fuel", ok);
  const Color c = ok ? kText : kDim;
  char per[32], rem[32], cons[32];
  fmt_opt(f.per_lap_consumption, "%.2f l/lap", per, sizeof(per));
  fmt_opt(f.remaining_laps, "%.1f laps", rem, sizeof(rem));
  fmt_opt(f.consumption_consistency, "%.0f", cons, sizeof(cons));

  int ry = y + 38;
  DrawText(TextFormat("level      %.1f l", f.current_level), x + 12, ry, 18, kText); ry += kROW_H + 4;
  DrawText(TextFormat("per lap    %s (%d laps)", per, f.laps_sampled), x + 12, ry, 18, c); ry += kROW_H + 4;
  DrawText(TextFormat("range      %s", rem), x + 12, ry, 18, c); ry += kROW_H + 4;
  if (f.laps_to_go) DrawText(TextFormat("to go      %d laps", *f.laps_to_go), x + 12, ry, 18, kText);
  else              DrawText("to go      --", x + 12, ry, 18, kDim);
  ry += kROW_H + 4;
  if (ok && f.can_finish) {
    DrawText(*f.can_finish ? "can finish" : TextFormat("short: save %.0f%%", f.required_savings_pct),
             x + 12, ry, 18, *f.can_finish ? kGreen : kRed);
  } else {
    DrawText("can finish --", x + 12, ry, 18, kDim);
  }
  ry += kROW_H + 4;
  DrawText(TextFormat("consistency %s", cons), x + 12, ry, 18, c);

  // Tank gauge
  const double tank = feed_.session()->config().tank_capacity_l;
  const float frac = float(std::clamp(f.current_level / tank, 0.0, 1.0));
  DrawRectangle(x + w - 40, y + 40, 20, 190, Color{40, 40, 46, 255});
  DrawRectangle(x + w - 40, y + 40 + int(190 * (1.0f - frac)), 20, int(190 * frac), ok ? kGreen : kDim);
}

void ViewerApp::draw_tires_(const PitWallSnapshot& s, int x, int y, int w) {
  const auto& t = s.analysis.tires;
  const bool ok = t.status == DataStatus::Ok;
  panel(x, y, w, 250, "Tires", ok);
  const auto& win = feed_.session()->config().tire_window;

  // Corner boxes: FL FR / RL RR
  const int bw = 90, bh = 56;
  for (std::size_t c = 0; c < kCorners; ++c) {
    const int bx = x + 12 + int(c % 2) * (bw + 10);
    const int by = y + 38 + int(c / 2) * (bh + 10);
    const Color fill = ok ? tempColor(t.corner_temps[c], win) : kDim;
    DrawRectangle(bx, by, bw, bh, Color{fill.r, fill.g, fill.b, 60});
    DrawRectangleLines(bx, by, bw, bh, fill);
    DrawText(corner_name(static_cast<Corner>(c)), bx + 6, by + 4, 14, kText);
    DrawText(TextFormat("%.0fC", t.corner_temps[c]), bx + 6, by + 20, 18, fill);
    DrawText(TextFormat("%.0f%%", t.wear[c] * 100.0), bx + 50, by + 38, 14, kText);
  }

  const Color c = ok ? kText : kDim;
  int ry = y + 38;
  const int tx = x + 220;
  DrawText(TextFormat("avg %.1fC %s", t.avg_temp, to_string(t.temp_trend)), tx, ry, 16, c); ry += kROW_H;
  DrawText(t.in_optimal_window ? "in window" : "out of window", tx, ry, 16,
           ok ? (t.in_optimal_window ? kGreen : kAmber) : kDim); ry += kROW_H;
  if (t.is_overheating) { DrawText("OVERHEATING", tx, ry, 16, kRed); ry += kROW_H; }
  DrawText(TextFormat("age %d laps", t.laps_on_tires), tx, ry, 16, c); ry += kROW_H;
  DrawText(TextFormat("grip %.1f%%", t.grip_remaining_pct), tx, ry, 16, c); ry += kROW_H;
  DrawText(TextFormat("deg %.2f%%/lap", t.degradation_rate_per_lap), tx, ry, 16, c); ry += kROW_H;
  if (t.recommended_change_lap) {
    DrawText(TextFormat("change by lap %d", *t.recommended_change_lap), tx, ry, 16, kAmber);
    ry += kROW_H;
  }
  char crit[32];
  fmt_opt(t.laps_until_critical, "%.1f", crit, sizeof(crit));
  DrawText(TextFormat("critical in %s", crit), tx, ry, 16, t.laps_until_critical ? kText : kDim);
  if (t.degradation_rising) DrawText("wear rising", x + 12, y + 180, 16, kAmber);
}

void ViewerApp::draw_driver_(const PitWallSnapshot& s, int x, int y, int w) {
  const auto& d = s.analysis.driver;
  const bool ok = d.status == DataStatus::Ok;
  panel(x, y, w, 260, "Driver", ok);

  struct Row { const char* name; std::optional<double> v; };
  const Row rows[] = {
    {"consistency", d.consistency},
    {"smoothness",  ok ? std::optional<double>(d.smoothness) : std::nullopt},
    {"aggression",  ok ? std::optional<double>(d.aggression) : std::nullopt},
    {"precision",   d.precision},
    {"fuel eff.",   d.fuel_efficiency},
    {"tire mgmt",   d.tire_management},
  };
  int ry = y + 38;
  for (const auto& r : rows) {
    DrawText(r.name, x + 12, ry, 16, r.v ? kText : kDim);
    DrawRectangle(x + 130, ry + 2, 200, 12, Color{40, 40, 46, 255});
    if (r.v) DrawRectangle(x + 130, ry + 2, int(2.0 * std::clamp(*r.v, 0.0, 100.0)), 12, kBlue);
    DrawText(r.v ? TextFormat("%.0f", *r.v) : "--", x + 340, ry, 16, r.v ? kText : kDim);
    ry += kROW_H + 4;
  }
  DrawText(TextFormat("overall %.0f", d.overall_score), x + 12, ry + 6, 22, ok ? kGreen : kDim);
}

void ViewerApp::draw_log_(int x, int y, int w, int h) {
  panel(x, y, w, h, "Log", true);
  int ry = y + 36;
  for (const auto& r : log_sink_->snapshot()) {
    DrawText(TextFormat("%s %s", r.tag.c_str(), r.msg.c_str()), x + 8, ry, 12, levelColor(r.level));
    ry += 16;
    if (ry > y + h - 16) break;
  }
}

} // namespace pitwall
