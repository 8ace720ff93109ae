#pragma once
#include <optional>
#include <string>
#include <pitwall/config.hpp>
#include <pitwall/fuel.hpp>
#include <pitwall/tires.hpp>

namespace pitwall {

// Closed sets; consumers switch over them without a default case.
enum class Action { PitNow, PitNextLap, StayOut, FuelSave, ManageTires, Push };
enum class Priority { Critical, High, Medium, Low };

const char* to_string(Action a);
const char* to_string(Priority p);

struct StrategyInputs {
  int current_lap{};
  FuelState fuel{};
  TireState tires{};
  std::optional<double> gap_ahead;
  std::optional<double> gap_behind;
};

struct PitWindow {
  std::optional<int> fuel_pit_lap;   // only when the fuel will not last
  std::optional<int> tire_pit_lap;
  std::optional<int> optimal_lap;
  std::optional<int> window_start;
  std::optional<int> window_end;
  bool undercut{false};
  bool overcut{false};
  double time_lost_in_pit_s{};
  int positions_at_risk{};
};

struct SupportingData {
  std::optional<FuelState> fuel;
  std::optional<TireState> tires;
  std::optional<double> gap_ahead;
  std::optional<double> gap_behind;
  PitWindow pit_window{};
};

struct StrategyRecommendation {
  Action action{Action::Push};
  Priority priority{Priority::Low};
  std::string reason;
  double fuel_to_add_l{};   // set for pit actions when the fuel data allows
  SupportingData supporting{};
};

PitWindow compute_pit_window(const StrategyInputs& in, const SessionConfig& cfg);

// Stateless: the same inputs always give the same recommendation. Categories
// whose inputs are InsufficientData are skipped; Push is the fallback.
StrategyRecommendation recommend(const StrategyInputs& in, const SessionConfig& cfg);

} // namespace pitwall
