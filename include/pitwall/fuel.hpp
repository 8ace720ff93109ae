#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/history.hpp>
#include <pitwall/status.hpp>

namespace pitwall {

struct FuelState {
  DataStatus status{DataStatus::InsufficientData};
  double current_level{};                   // last sample, if any
  std::optional<double> per_lap_consumption;
  std::optional<double> remaining_laps;
  std::optional<int> laps_to_go;
  std::optional<bool> can_finish;           // needs consumption and laps_to_go
  double required_savings_pct{};            // 0 unless can_finish == false
  double recommended_fuel_add_l{};
  std::optional<double> consumption_consistency;  // 0..100
  int laps_sampled{};                       // laps behind the median
};

struct ConsumptionEstimate {
  std::optional<double> per_lap;   // median of positive deltas
  std::vector<double> deltas;      // what the median saw, oldest first
};

// Median per-lap use over the last window_laps completed laps since the most
// recent refuel. Fewer than min_laps usable laps gives an empty per_lap.
ConsumptionEstimate estimate_consumption(const HistoryBuffer& buf,
                                         double refuel_threshold_l,
                                         const FuelTunables& t);

// Laps left in the race from the newest sample. Time races need a completed
// lap to convert the remaining time; otherwise nullopt.
std::optional<int> laps_to_go(const HistoryBuffer& buf,
                              const SessionConfig& cfg,
                              std::int64_t session_start_ms);

// Range/shortfall figures from already-known inputs.
FuelState fuel_state_from(double current_level,
                          std::optional<double> per_lap,
                          std::optional<int> laps_to_go,
                          const SessionConfig& cfg);

FuelState analyze_fuel(const HistoryBuffer& buf,
                       const SessionConfig& cfg,
                       std::optional<int> laps_to_go);

} // namespace pitwall
