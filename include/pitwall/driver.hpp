#pragma once
#include <optional>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/fuel.hpp>
#include <pitwall/history.hpp>
#include <pitwall/status.hpp>
#include <pitwall/tires.hpp>

namespace pitwall {

// Scores are 0..100. A component that cannot be computed from the history is
// left empty rather than reported as 0.
struct DriverPerformance {
  DataStatus status{DataStatus::InsufficientData};
  std::optional<double> consistency;
  double smoothness{};
  double aggression{};
  std::optional<double> precision;
  std::optional<double> fuel_efficiency;
  std::optional<double> tire_management;
  double overall_score{};
  std::vector<double> lap_times;   // completed laps, oldest first
};

// Weighted mean over the components that are present, weights renormalised.
double overall_score(const DriverPerformance& p, const ScoreWeights& w);

DriverPerformance analyze_driver(const HistoryBuffer& buf,
                                 const DriverTunables& t,
                                 const FuelState& fuel,
                                 const TireState& tires);

} // namespace pitwall
