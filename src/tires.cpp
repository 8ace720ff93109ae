#include <pitwall/tires.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <pitwall/stats.hpp>

namespace pitwall {

const char* to_string(TempTrend t) {
  switch (t) {
    case TempTrend::Stable:  return "stable";
    case TempTrend::Rising:  return "rising";
    case TempTrend::Falling: return "falling";
  }
  return "unknown";
}

double degradation_rate_per_lap(double avg_temp, int laps_on_tires,
                                const TireWindow& w, const TireTunables& t) {
  const double over = std::max(0.0, avg_temp - w.optimal_max);
  const double temp_mult = 1.0 + over / t.temp_scale;
  const double age_mult = 1.0 + std::max(0, laps_on_tires) * t.age_factor;
  return t.base_rate_pct * temp_mult * age_mult;
}

double grip_remaining_pct(int laps_on_tires, double rate_per_lap) {
  return std::max(0.0, 100.0 - std::max(0, laps_on_tires) * rate_per_lap);
}

std::optional<int> recommended_change_lap(double grip_pct, int current_lap) {
  if (grip_pct < 40.0) return current_lap + 1;
  if (grip_pct < 60.0) return current_lap + 3;
  return std::nullopt;
}

struct BufferedStint {
  std::size_t start_index{0};
  TireStint stint;
};

static BufferedStint tire_stint(const HistoryBuffer& buf, const TireTunables& t) {
  BufferedStint st;
  st.stint.start_lap = buf.front().lap;
  const auto changes = tire_change_events(buf, t.change_wear_drop);
  if (!changes.empty()) {
    st.start_index = changes.back().index;
    st.stint.start_lap = changes.back().lap;
    st.stint.changed = true;
  }
  return st;
}

// Per-lap wear deltas per corner for completed laps inside the stint.
static std::vector<CornerValues> wear_deltas(const HistoryBuffer& buf, const BufferedStint& st) {
  std::vector<CornerValues> out;
  for (const auto& ls : lap_summaries(buf)) {
    if (ls.first_index < st.start_index) continue;
    const auto& a = buf[ls.first_index].tire_wear;
    const auto& b = buf[ls.end_index].tire_wear;
    CornerValues d{};
    for (std::size_t c = 0; c < kCorners; ++c) d[c] = b[c] - a[c];
    out.push_back(d);
  }
  return out;
}

static TempTrend temp_trend(const HistoryBuffer& buf, double delta_c) {
  std::vector<double> starts;
  for (const auto b : buf.lap_boundaries()) starts.push_back(mean_of(buf[b.first_index].tire_temp));
  if (starts.size() < 3) return TempTrend::Stable;
  const double first = starts[starts.size() - 3];
  const double last = starts.back();
  if (last > first + delta_c) return TempTrend::Rising;
  if (last < first - delta_c) return TempTrend::Falling;
  return TempTrend::Stable;
}

TireState analyze_tires(const HistoryBuffer& buf, const SessionConfig& cfg,
                        const std::optional<TireStint>& stint) {
  TireState ts;
  if (buf.empty()) return ts;
  const auto& tw = cfg.tire_window;
  const auto& tt = cfg.tires;
  const auto& last = buf.back();

  const auto recent = buf.window(std::chrono::milliseconds(tt.temp_window_ms));
  for (const auto& s : recent) {
    for (std::size_t c = 0; c < kCorners; ++c) ts.corner_temps[c] += s.tire_temp[c];
  }
  for (auto& v : ts.corner_temps) v /= static_cast<double>(recent.size());
  ts.avg_temp = mean_of(ts.corner_temps);
  ts.in_optimal_window = tw.optimal_min <= ts.avg_temp && ts.avg_temp <= tw.optimal_max;
  ts.is_overheating = std::any_of(ts.corner_temps.begin(), ts.corner_temps.end(),
                                  [&](double v){ return v > tw.overheat; });

  BufferedStint st = tire_stint(buf, tt);
  if (stint) st.stint = *stint;
  ts.laps_on_tires = last.lap - st.stint.start_lap
                   + (st.stint.changed ? 0 : tt.initial_tire_age_laps);
  ts.degradation_rate_per_lap = degradation_rate_per_lap(ts.avg_temp, ts.laps_on_tires, tw, tt);
  ts.grip_remaining_pct = grip_remaining_pct(ts.laps_on_tires, ts.degradation_rate_per_lap);
  ts.recommended_change_lap = recommended_change_lap(ts.grip_remaining_pct, last.lap);

  ts.wear = last.tire_wear;
  const auto deltas = wear_deltas(buf, st);
  if (!deltas.empty()) {
    CornerValues rate{};
    bool any = false;
    for (std::size_t c = 0; c < kCorners; ++c) {
      std::vector<double> pos;
      for (const auto& d : deltas) if (d[c] > 0.0) pos.push_back(d[c]);
      rate[c] = mean(pos).value_or(0.0);
      any = any || rate[c] > 0.0;
    }
    if (any) {
      ts.wear_rate_per_lap = rate;
      double lim = std::numeric_limits<double>::infinity();
      for (std::size_t c = 0; c < kCorners; ++c) {
        if (rate[c] <= 0.0) continue;
        lim = std::min(lim, std::max(0.0, tt.usable_wear - ts.wear[c]) / rate[c]);
      }
      ts.laps_until_critical = lim;
    }

    if (deltas.size() >= 3) {
      std::vector<double> earlier;
      for (std::size_t i = 0; i + 1 < deltas.size(); ++i) earlier.push_back(mean_of(deltas[i]));
      const double latest = mean_of(deltas.back());
      const auto base = median(earlier);
      ts.degradation_rising = base && *base > 0.0 && latest > tt.rising_factor * *base;
    }
  }

  ts.temp_trend = temp_trend(buf, tt.trend_delta_c);
  ts.status = DataStatus::Ok;
  return ts;
}

} // namespace pitwall
