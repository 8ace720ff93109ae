#include <pitwall/synth.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace pitwall {

static constexpr double kTwoPi = 2.0 * std::numbers::pi;
// Per-corner offsets: fronts run hotter and wear faster.
static constexpr CornerValues kTempOffset{3.0, 4.0, -2.0, -1.0};
static constexpr CornerValues kWearMult{1.10, 1.15, 0.90, 0.95};

double nominal_lap_time_s(const SynthParams& p) {
  if (p.track_length_m <= 0.0 || p.base_speed_kmh <= 0.0) return 0.0;
  return p.track_length_m / (p.base_speed_kmh / 3.6);
}

SynthCar::SynthCar(const SynthParams& p) : p_(p), rng_(p.seed) {
  if (p_.track_length_m <= 0.0) p_.track_length_m = 5500.0;
  fuel_l_ = std::min(p_.start_fuel_l, p_.tank_capacity_l);
  temp_.fill(p_.ambient_temp_c);
  gap_ahead_ = p_.gap_ahead_s;
  gap_behind_ = p_.gap_behind_s;
}

double SynthCar::noise_(double amp) {
  std::uniform_real_distribution<double> d(-amp, amp);
  return d(rng_);
}

void SynthCar::step(double dt_s) {
  if (dt_s <= 0.0) return;
  const double L = p_.track_length_m;
  const double frac = dist_m_ / L;

  // Three straights and three braking zones per lap.
  const double phase = std::sin(kTwoPi * 3.0 * frac);
  const double slope = std::cos(kTwoPi * 3.0 * frac);
  speed_kmh_ = std::max(60.0, p_.base_speed_kmh + 80.0 * phase + noise_(3.0));
  throttle_ = std::clamp(0.65 + 0.35 * slope + noise_(0.03), 0.0, 1.0);
  brake_ = slope < -0.4 ? std::clamp(-slope * 0.8 + noise_(0.03), 0.0, 1.0) : 0.0;
  steering_ = std::clamp(0.4 * std::sin(kTwoPi * 5.0 * frac) + noise_(0.02), -1.0, 1.0);
  g_lat_ = steering_ * 3.0;
  g_long_ = (throttle_ - brake_) * 1.5;

  const double ds = speed_kmh_ / 3.6 * dt_s;
  dist_m_ += ds;
  sim_time_ += dt_s;

  const double burn = p_.fuel_per_lap_l * (ds / L) * (0.8 + 0.4 * throttle_) / 1.06;
  fuel_l_ = std::max(0.0, fuel_l_ - burn);

  for (std::size_t c = 0; c < kCorners; ++c) {
    const double load = 10.0 * std::fabs(steering_) + 15.0 * wear_[c];
    const double target = p_.target_temp_c + kTempOffset[c] + load;
    temp_[c] += (target - temp_[c]) * std::min(1.0, dt_s / 8.0);
    const double heat = 1.0 + std::max(0.0, temp_[c] - 95.0) / 50.0;
    wear_[c] = std::min(1.0, wear_[c] + p_.wear_per_lap * kWearMult[c] * heat * (ds / L));
  }

  gap_ahead_ = std::max(0.1, gap_ahead_ + (0.5 * std::sin(sim_time_ * 0.1) - 0.1) * dt_s * 0.05);
  gap_behind_ = std::max(0.1, gap_behind_ + (0.3 * std::sin(sim_time_ * 0.15)) * dt_s * 0.05);

  while (dist_m_ >= L) {
    dist_m_ -= L;
    finish_lap_();
  }
}

void SynthCar::finish_lap_() {
  const bool pit = pit_pending_ || (p_.pit_on_lap > 0 && lap_ == p_.pit_on_lap);
  if (pit) {
    pit_pending_ = false;
    ++pit_stops_;
    sim_time_ += p_.pit_loss_s;
    fuel_l_ = std::min(p_.tank_capacity_l, std::max(fuel_l_, p_.start_fuel_l));
    wear_.fill(0.0);
    temp_.fill(p_.ambient_temp_c + 10.0);
    // Rejoin behind the car we were chasing.
    gap_behind_ = std::max(0.5, gap_behind_ + p_.pit_loss_s * 0.1);
    gap_ahead_ = std::max(0.5, gap_ahead_ + p_.pit_loss_s * 0.2);
  }
  last_lap_time_ = sim_time_ - lap_start_;
  lap_start_ = sim_time_;
  ++lap_;
}

TelemetrySample SynthCar::sample() const {
  TelemetrySample s;
  s.timestamp_ms = static_cast<std::int64_t>(std::llround(sim_time_ * 1000.0));
  s.lap = lap_;
  const double frac = lap_fraction();
  s.sector = std::min(3, static_cast<int>(frac * 3.0) + 1);
  s.speed = speed_kmh_;
  s.throttle = throttle_;
  s.brake = brake_;
  s.steering = steering_;
  s.fuel_level = fuel_l_;
  s.tire_temp = temp_;
  s.tire_wear = wear_;
  s.lap_time = last_lap_time_;
  s.gap_ahead = gap_ahead_;
  s.gap_behind = gap_behind_;
  s.track_pos = frac;
  s.g_lat = g_lat_;
  s.g_long = g_long_;
  return s;
}

double SynthCar::radius_m() const { return p_.track_length_m / kTwoPi; }

void SynthCar::sample_pose(double& x, double& y, double& heading_rad) const {
  const double t = lap_fraction() * kTwoPi;
  x = radius_m() * std::cos(t);
  y = radius_m() * std::sin(t);
  heading_rad = t + std::numbers::pi / 2.0;
}

} // namespace pitwall
