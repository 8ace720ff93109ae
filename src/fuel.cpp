#include <pitwall/fuel.hpp>
#include <algorithm>
#include <cmath>
#include <pitwall/stats.hpp>

namespace pitwall {

// Cap for lap counts derived from ratios of measured values.
static constexpr double kMaxLaps = 1e6;

ConsumptionEstimate estimate_consumption(const HistoryBuffer& buf,
                                         double refuel_threshold_l,
                                         const FuelTunables& t) {
  ConsumptionEstimate est;
  const auto laps = lap_summaries(buf);
  if (laps.empty()) return est;

  // Laps that started before the last refuel are a different fuel load.
  std::size_t stint_start = 0;
  const auto refuels = refuel_events(buf, refuel_threshold_l);
  if (!refuels.empty()) stint_start = refuels.back().index;

  std::vector<double> deltas;
  for (const auto& ls : laps) {
    if (ls.first_index < stint_start) continue;
    if (ls.fuel_used > 0.0) deltas.push_back(ls.fuel_used);
  }
  const std::size_t k = static_cast<std::size_t>(std::max(1, t.window_laps));
  if (deltas.size() > k) deltas.erase(deltas.begin(), deltas.end() - static_cast<std::ptrdiff_t>(k));

  est.deltas = deltas;
  if (deltas.size() < static_cast<std::size_t>(std::max(1, t.min_laps))) return est;
  est.per_lap = median(deltas);
  return est;
}

std::optional<int> laps_to_go(const HistoryBuffer& buf,
                              const SessionConfig& cfg,
                              std::int64_t session_start_ms) {
  if (buf.empty()) return std::nullopt;
  const auto& last = buf.back();
  if (cfg.race.mode == RaceMode::Laps) {
    return std::max(0, cfg.race.laps - last.lap);
  }

  std::vector<double> times;
  for (const auto& ls : lap_summaries(buf)) {
    if (ls.lap_time > 0.0) times.push_back(ls.lap_time);
  }
  const auto avg_lap = mean(times);
  if (!avg_lap || *avg_lap <= 0.0) return std::nullopt;

  const double elapsed_s = static_cast<double>(last.timestamp_ms - session_start_ms) / 1000.0;
  const double left_s = cfg.race.seconds - elapsed_s;
  if (left_s <= 0.0) return 0;
  return static_cast<int>(std::min(std::ceil(left_s / *avg_lap), kMaxLaps));
}

FuelState fuel_state_from(double current_level,
                          std::optional<double> per_lap,
                          std::optional<int> to_go,
                          const SessionConfig& cfg) {
  FuelState fs;
  fs.current_level = current_level;
  fs.laps_to_go = to_go;
  if (!per_lap || *per_lap <= 0.0) return fs;

  fs.status = DataStatus::Ok;
  fs.per_lap_consumption = *per_lap;
  const double remaining = current_level / *per_lap;
  fs.remaining_laps = remaining;

  if (!to_go) return fs;
  const double need = static_cast<double>(*to_go);
  fs.can_finish = remaining >= need;
  if (!*fs.can_finish) {
    fs.required_savings_pct = clamp_pct((need - remaining) / need * 100.0);
    const double short_l = need * *per_lap - current_level;
    fs.recommended_fuel_add_l =
      std::min(short_l * (1.0 + cfg.fuel.fuel_add_margin), cfg.tank_capacity_l);
  }
  return fs;
}

FuelState analyze_fuel(const HistoryBuffer& buf,
                       const SessionConfig& cfg,
                       std::optional<int> to_go) {
  if (buf.empty()) return FuelState{};

  const auto est = estimate_consumption(buf, cfg.refuel_threshold_l, cfg.fuel);
  FuelState fs = fuel_state_from(buf.back().fuel_level, est.per_lap, to_go, cfg);
  fs.laps_sampled = static_cast<int>(est.deltas.size());
  if (est.per_lap) {
    const auto m = mean(est.deltas);
    const auto sd = stddev(est.deltas);
    if (m && sd && *m > 0.0) fs.consumption_consistency = clamp_pct(100.0 - *sd / *m * 100.0);
  }
  return fs;
}

} // namespace pitwall
