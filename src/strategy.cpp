#include <pitwall/strategy.hpp>
#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>

namespace pitwall {

const char* to_string(Action a) {
  switch (a) {
    case Action::PitNow:      return "pit_now";
    case Action::PitNextLap:  return "pit_next_lap";
    case Action::StayOut:     return "stay_out";
    case Action::FuelSave:    return "fuel_save";
    case Action::ManageTires: return "manage_tires";
    case Action::Push:        return "push";
  }
  return "unknown";
}

const char* to_string(Priority p) {
  switch (p) {
    case Priority::Critical: return "critical";
    case Priority::High:     return "high";
    case Priority::Medium:   return "medium";
    case Priority::Low:      return "low";
  }
  return "unknown";
}

static std::string fmt(const char* f, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 1, 2)))
#endif
  ;

static std::string fmt(const char* f, ...) {
  char buf[192];
  va_list ap;
  va_start(ap, f);
  std::vsnprintf(buf, sizeof(buf), f, ap);
  va_end(ap);
  return buf;
}

static bool fuel_usable(const FuelState& f) {
  return f.status == DataStatus::Ok && f.remaining_laps.has_value();
}

// Fuel triggers only matter when the tank will not reach the flag.
static bool fuel_short(const FuelState& f) {
  return fuel_usable(f) && f.can_finish.has_value() && !*f.can_finish;
}

static bool tires_usable(const TireState& t) { return t.status == DataStatus::Ok; }

// Ratios with a near-zero burn or wear rate run far past any int.
static int floor_to_int(double v) {
  return static_cast<int>(std::floor(std::clamp(v, -1e6, 1e6)));
}

// Laps we can still run before fuel or grip forces a stop.
static int feasible_laps(const StrategyInputs& in) {
  int laps = floor_to_int(*in.fuel.remaining_laps) - 1;
  if (tires_usable(in.tires) && in.tires.degradation_rate_per_lap > 0.0) {
    const double to_floor = (in.tires.grip_remaining_pct - 30.0) / in.tires.degradation_rate_per_lap;
    laps = std::min(laps, floor_to_int(to_floor));
  }
  return laps;
}

static StrategyRecommendation make(Action a, Priority p, std::string reason) {
  StrategyRecommendation r;
  r.action = a;
  r.priority = p;
  r.reason = std::move(reason);
  return r;
}

PitWindow compute_pit_window(const StrategyInputs& in, const SessionConfig& cfg) {
  const auto& st = cfg.strategy;
  PitWindow pw;
  pw.time_lost_in_pit_s = cfg.avg_pit_time_s;

  if (fuel_short(in.fuel)) {
    pw.fuel_pit_lap = in.current_lap + floor_to_int(*in.fuel.remaining_laps) - st.fuel_buffer_laps;
  }
  if (tires_usable(in.tires)) pw.tire_pit_lap = in.tires.recommended_change_lap;

  if (pw.fuel_pit_lap && pw.tire_pit_lap) pw.optimal_lap = std::min(*pw.fuel_pit_lap, *pw.tire_pit_lap);
  else if (pw.fuel_pit_lap) pw.optimal_lap = pw.fuel_pit_lap;
  else if (pw.tire_pit_lap) pw.optimal_lap = pw.tire_pit_lap;
  if (pw.optimal_lap) {
    pw.window_start = *pw.optimal_lap - st.window_before;
    pw.window_end = *pw.optimal_lap + st.window_after;
  }

  if (in.gap_ahead && tires_usable(in.tires)) {
    const double gap = *in.gap_ahead;
    pw.undercut = gap > 0.0 && gap < cfg.avg_pit_time_s + st.undercut_margin_s
                  && in.tires.laps_on_tires > st.undercut_min_tire_age;
  }
  if (in.gap_ahead && fuel_usable(in.fuel)) {
    const double gain = (*in.fuel.remaining_laps - 1.0) * st.pace_advantage_s;
    pw.overcut = gain > *in.gap_ahead && feasible_laps(in) >= st.overcut_min_laps;
  }
  if (in.gap_behind && *in.gap_behind > 0.0 && cfg.avg_pit_time_s > 0.0) {
    pw.positions_at_risk = floor_to_int(*in.gap_behind / cfg.avg_pit_time_s);
  }
  return pw;
}

StrategyRecommendation recommend(const StrategyInputs& in, const SessionConfig& cfg) {
  const PitWindow pw = compute_pit_window(in, cfg);
  const auto& fuel = in.fuel;
  const auto& tires = in.tires;
  const bool short_fuel = fuel_short(fuel);
  const bool tires_ok = tires_usable(tires);
  const int lap = in.current_lap;

  auto decide = [&]() -> StrategyRecommendation {
    // 1. pit now
    if (short_fuel && *fuel.remaining_laps < 2.0) {
      return make(Action::PitNow, Priority::Critical,
                  fmt("fuel for %.1f laps, 2 needed", *fuel.remaining_laps));
    }
    if (short_fuel && pw.fuel_pit_lap && *pw.fuel_pit_lap <= lap + 1) {
      return make(Action::PitNow, Priority::Critical,
                  fmt("fuel for %.1f laps, %d to go: last safe stop is lap %d",
                      *fuel.remaining_laps, *fuel.laps_to_go, *pw.fuel_pit_lap));
    }
    if (tires_ok && tires.grip_remaining_pct < 30.0) {
      return make(Action::PitNow, Priority::Critical,
                  fmt("grip %.0f%%, below 30%%", tires.grip_remaining_pct));
    }
    if (pw.undercut) {
      return make(Action::PitNow, Priority::Critical,
                  fmt("undercut: %.1fs to car ahead < %.0fs pit loss + %.0fs, tires %d laps old",
                      *in.gap_ahead, cfg.avg_pit_time_s, cfg.strategy.undercut_margin_s,
                      tires.laps_on_tires));
    }

    // 2. pit next lap
    if (pw.window_start && *pw.window_start <= lap && lap <= *pw.window_end) {
      return make(Action::PitNextLap, Priority::High,
                  fmt("lap %d inside pit window %d-%d (optimal lap %d)",
                      lap, *pw.window_start, *pw.window_end, *pw.optimal_lap));
    }
    if (short_fuel && *fuel.remaining_laps < 5.0) {
      return make(Action::PitNextLap, Priority::High,
                  fmt("fuel for %.1f laps, %d to go", *fuel.remaining_laps, *fuel.laps_to_go));
    }
    if (tires_ok && tires.grip_remaining_pct < 50.0) {
      return make(Action::PitNextLap, Priority::High,
                  fmt("grip %.0f%%, below 50%%", tires.grip_remaining_pct));
    }

    // 3. save fuel
    if (short_fuel && fuel.required_savings_pct > 5.0) {
      return make(Action::FuelSave, Priority::Medium,
                  fmt("save %.0f%% fuel: %.1f laps of fuel, %d to go",
                      fuel.required_savings_pct, *fuel.remaining_laps, *fuel.laps_to_go));
    }

    // 4. manage tires
    if (tires_ok && tires.is_overheating) {
      const auto hot = std::max_element(tires.corner_temps.begin(), tires.corner_temps.end());
      const auto corner = static_cast<Corner>(hot - tires.corner_temps.begin());
      return make(Action::ManageTires, Priority::Medium,
                  fmt("%s tire at %.0fC, over %.0fC", corner_name(corner), *hot,
                      cfg.tire_window.overheat));
    }
    if (tires_ok && tires.degradation_rising) {
      return make(Action::ManageTires, Priority::Medium,
                  fmt("tire wear rising sharply, grip %.0f%% after %d laps",
                      tires.grip_remaining_pct, tires.laps_on_tires));
    }

    // 5. stay out
    if (pw.overcut) {
      return make(Action::StayOut, Priority::Low,
                  fmt("overcut: %.1fs gain over %.1f laps beats %.1fs gap ahead",
                      (*fuel.remaining_laps - 1.0) * cfg.strategy.pace_advantage_s,
                      *fuel.remaining_laps - 1.0, *in.gap_ahead));
    }

    // 6. push
    if (fuel_usable(fuel) && tires_ok) {
      return make(Action::Push, Priority::Low,
                  fmt("fuel for %.1f laps, grip %.0f%%", *fuel.remaining_laps,
                      tires.grip_remaining_pct));
    }
    if (tires_ok) {
      return make(Action::Push, Priority::Low,
                  fmt("grip %.0f%%, fuel data insufficient", tires.grip_remaining_pct));
    }
    if (fuel_usable(fuel)) {
      return make(Action::Push, Priority::Low,
                  fmt("fuel for %.1f laps, tire data insufficient", *fuel.remaining_laps));
    }
    return make(Action::Push, Priority::Low, "insufficient data, no threats detected");
  };

  StrategyRecommendation rec = decide();
  if ((rec.action == Action::PitNow || rec.action == Action::PitNextLap) && fuel_usable(fuel)) {
    rec.fuel_to_add_l = fuel.recommended_fuel_add_l;
  }
  if (fuel.status == DataStatus::Ok) rec.supporting.fuel = fuel;
  if (tires_ok) rec.supporting.tires = tires;
  rec.supporting.gap_ahead = in.gap_ahead;
  rec.supporting.gap_behind = in.gap_behind;
  rec.supporting.pit_window = pw;
  return rec;
}

} // namespace pitwall
