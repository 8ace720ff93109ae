#include <pitwall/driver.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <pitwall/stats.hpp>

namespace pitwall {

double overall_score(const DriverPerformance& p, const ScoreWeights& w) {
  double num = 0.0;
  double den = 0.0;
  auto add = [&](double score, double weight) {
    if (weight <= 0.0) return;
    num += clamp_pct(score) * weight;
    den += weight;
  };
  if (p.consistency) add(*p.consistency, w.consistency);
  add(p.smoothness, w.smoothness);
  if (p.precision) add(*p.precision, w.precision);
  if (p.fuel_efficiency) add(*p.fuel_efficiency, w.fuel_efficiency);
  if (p.tire_management) add(*p.tire_management, w.tire_management);
  return den > 0.0 ? clamp_pct(num / den) : 0.0;
}

DriverPerformance analyze_driver(const HistoryBuffer& buf,
                                 const DriverTunables& t,
                                 const FuelState& fuel,
                                 const TireState& tires) {
  DriverPerformance p;
  const std::size_t n = buf.size();
  if (n < t.min_samples || n < 2) return p;

  for (const auto& ls : lap_summaries(buf)) {
    if (ls.lap_time > 0.0) p.lap_times.push_back(ls.lap_time);
  }
  if (p.lap_times.size() >= 2) {
    const double m = *mean(p.lap_times);
    const double sd = *stddev(p.lap_times);
    p.consistency = clamp_pct(100.0 - sd / m * 100.0);
  }

  double steer = 0.0;
  double inputs = 0.0;
  double peak_g = 0.0;
  for (std::size_t i = 1; i < n; ++i) {
    const auto& a = buf[i - 1];
    const auto& b = buf[i];
    steer += std::fabs(b.steering - a.steering);
    inputs += std::fabs(b.throttle - a.throttle) + std::fabs(b.brake - a.brake);
  }
  for (std::size_t i = 0; i < n; ++i) {
    peak_g = std::max(peak_g, std::hypot(buf[i].g_lat, buf[i].g_long));
  }
  const double steps = static_cast<double>(n - 1);
  p.smoothness = clamp_pct(100.0 - (steer / steps) * t.smoothness_scale);

  const double input_term = clamp_pct((inputs / steps) * t.aggression_input_scale);
  if (peak_g > 0.0) {
    const double g_term = clamp_pct(peak_g / t.g_reference * 100.0);
    p.aggression = (1.0 - t.aggression_g_weight) * input_term + t.aggression_g_weight * g_term;
  } else {
    p.aggression = input_term;
  }

  // Track-position spread per sector; sectors with < 2 samples are skipped.
  std::map<int, std::vector<double>> by_sector;
  for (std::size_t i = 0; i < n; ++i) {
    const auto& s = buf[i];
    if (s.sector > 0 && s.track_pos >= 0.0 && s.track_pos <= 1.0) by_sector[s.sector].push_back(s.track_pos);
  }
  std::vector<double> per_sector;
  for (const auto& [sector, pos] : by_sector) {
    if (pos.size() < 2) continue;
    per_sector.push_back(1.0 - *stddev(pos));
  }
  if (const auto m = mean(per_sector)) p.precision = clamp_pct(*m * 100.0);

  p.fuel_efficiency = fuel.consumption_consistency;
  if (tires.wear_rate_per_lap) {
    p.tire_management = clamp_pct(100.0 - mean_of(*tires.wear_rate_per_lap) * t.tire_mgmt_scale);
  }

  p.overall_score = overall_score(p, t.weights);
  p.status = DataStatus::Ok;
  return p;
}

} // namespace pitwall
