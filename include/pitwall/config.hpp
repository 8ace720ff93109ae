#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

// All constants below are uncalibrated heuristics carried over from
// hand-tuning against sim data; treat them as tunables, not physics.

enum class RaceMode { Laps, Time };

struct RaceLength {
  RaceMode mode{RaceMode::Laps};
  int laps{0};            // Laps mode
  double seconds{0.0};    // Time mode
};

struct TireWindow {
  double optimal_min{85.0};
  double optimal_max{95.0};
  double overheat{105.0};  // any corner above this = overheating
};

struct FuelTunables {
  int window_laps{10};         // K most recent completed laps fed to the median
  int min_laps{2};             // below this, consumption is InsufficientData
  double fuel_add_margin{0.10};
};

struct TireTunables {
  std::int64_t temp_window_ms{2000};
  double base_rate_pct{0.5};       // grip % lost per lap on a new set in window
  double temp_scale{50.0};         // °C above optimal_max that doubles the rate
  double age_factor{0.01};         // +1% rate per lap on the set
  double change_wear_drop{0.10};   // mean wear drop that marks a tire change
  int initial_tire_age_laps{0};
  double usable_wear{0.95};
  double rising_factor{1.5};
  double trend_delta_c{5.0};
};

struct ScoreWeights {
  double consistency{0.25};
  double smoothness{0.20};
  double precision{0.20};
  double fuel_efficiency{0.15};
  double tire_management{0.20};
};

struct DriverTunables {
  std::size_t min_samples{10};
  double smoothness_scale{500.0};
  double aggression_input_scale{500.0};
  double g_reference{3.0};
  double aggression_g_weight{0.3};
  double tire_mgmt_scale{2000.0};
  ScoreWeights weights{};
};

struct StrategyTunables {
  double undercut_margin_s{3.0};
  int undercut_min_tire_age{10};
  double pace_advantage_s{0.5};    // per-lap gain assumed when staying out
  int overcut_min_laps{3};
  int fuel_buffer_laps{2};
  int window_before{3};
  int window_after{5};
};

struct SessionConfig {
  RaceLength race{};
  double tank_capacity_l{100.0};
  double avg_pit_time_s{45.0};
  TireWindow tire_window{};
  double refuel_threshold_l{5.0};

  // History bounds; max_span_ms == 0 disables the time bound. The defaults
  // hold 25 minutes at 60 Hz, enough for window_laps + 1 laps of ~2 minutes.
  std::size_t max_samples{90000};
  std::int64_t max_span_ms{1500000};

  FuelTunables fuel{};
  TireTunables tires{};
  DriverTunables driver{};
  StrategyTunables strategy{};
};

// Returns every violated rule; empty means the config is usable.
std::vector<std::string> validate(const SessionConfig& cfg);

// Widens the history bounds (never narrows them) so a feed at sample_hz keeps
// fuel.window_laps + 2 laps of lap_time_s each.
void ensure_history_covers(SessionConfig& cfg, double lap_time_s, double sample_hz);

// YAML loading (yaml-cpp). Missing keys keep defaults. Returns nullopt on a
// malformed document or a config that fails validate().
std::optional<SessionConfig> session_config_from_yaml(const std::string& text);
std::optional<SessionConfig> load_session_config_yaml(const std::string& path);

// Car classes: optimal tire window and base degradation per class.
struct CarClass {
  std::string key;          // e.g., "GT3"
  double optimal_min;
  double optimal_max;
  double overheat;
  double base_rate_pct;
};

const std::vector<CarClass>& car_class_catalog();
std::optional<CarClass> car_class_by_key(const std::string& key);
std::optional<CarClass> car_class_by_key_in(const std::vector<CarClass>& cat, const std::string& key);

// Accepts an optional header row; ignores '#' lines and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<CarClass> car_class_catalog_from_csv_stream(std::istream& in);
std::optional<std::vector<CarClass>> load_car_class_catalog_csv(const std::string& path);

inline void apply_car_class(SessionConfig& cfg, const CarClass& cc) {
  cfg.tire_window = TireWindow{cc.optimal_min, cc.optimal_max, cc.overheat};
  cfg.tires.base_rate_pct = cc.base_rate_pct;
}

} // namespace pitwall
