#pragma once
#include <cstdint>
#include <random>
#include <pitwall/telemetry.hpp>

namespace pitwall {

// Demo-only car model. It is not a physics model; it produces telemetry with
// the right shape (fuel burn, tire heat and wear, noisy inputs, gaps, pit stops)
// to drive a session without a real simulator.
struct SynthParams {
  double track_length_m = 5500.0;
  double base_speed_kmh = 190.0;
  double fuel_per_lap_l = 2.4;
  double start_fuel_l = 60.0;
  double tank_capacity_l = 100.0;
  double wear_per_lap = 0.012;      // mean fraction per lap at optimal temp
  double ambient_temp_c = 60.0;
  double target_temp_c = 90.0;
  double pit_loss_s = 25.0;         // stationary + lane time added to the clock
  int pit_on_lap = 0;               // scripted stop at the end of this lap, 0 = none
  double gap_ahead_s = 6.0;
  double gap_behind_s = 3.0;
  std::uint32_t seed = 7;
};

// Lap time at base speed, without a pit stop.
double nominal_lap_time_s(const SynthParams& p);

class SynthCar {
public:
  explicit SynthCar(const SynthParams& p = {});

  // Fixed-step advance; dt <= 0 is ignored.
  void step(double dt_s);

  // Pit (refuel to start level, new tires) when the current lap ends.
  void request_pit() { pit_pending_ = true; }

  TelemetrySample sample() const;

  double sim_time() const { return sim_time_; }
  int lap() const { return lap_; }
  double lap_fraction() const { return dist_m_ / p_.track_length_m; }
  int pit_stops() const { return pit_stops_; }
  const SynthParams& params() const { return p_; }

  // Position on a circle with the track's circumference (meters).
  double radius_m() const;
  void sample_pose(double& x, double& y, double& heading_rad) const;

private:
  void finish_lap_();
  double noise_(double amp);

  SynthParams p_;
  std::mt19937 rng_;

  double sim_time_ = 0.0;
  double lap_start_ = 0.0;
  double dist_m_ = 0.0;
  int lap_ = 1;
  double last_lap_time_ = 0.0;
  bool pit_pending_ = false;
  int pit_stops_ = 0;

  double speed_kmh_ = 0.0;
  double throttle_ = 0.0;
  double brake_ = 0.0;
  double steering_ = 0.0;
  double fuel_l_ = 0.0;
  CornerValues temp_{};
  CornerValues wear_{};
  double gap_ahead_ = 0.0;
  double gap_behind_ = 0.0;
  double g_lat_ = 0.0;
  double g_long_ = 0.0;
};

} // namespace pitwall
