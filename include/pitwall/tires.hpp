#pragma once
#include <optional>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/history.hpp>
#include <pitwall/status.hpp>
#include <pitwall/telemetry.hpp>

namespace pitwall {

enum class TempTrend { Stable, Rising, Falling };
const char* to_string(TempTrend t);

// Degradation here is a bounded heuristic (see TireTunables), not a tire model.
struct TireState {
  DataStatus status{DataStatus::InsufficientData};
  CornerValues corner_temps{};       // mean over the recent temp window
  double avg_temp{};
  bool in_optimal_window{false};
  bool is_overheating{false};
  int laps_on_tires{};
  double degradation_rate_per_lap{}; // grip % per lap
  double grip_remaining_pct{100.0};
  std::optional<int> recommended_change_lap;

  CornerValues wear{};               // newest sample
  std::optional<CornerValues> wear_rate_per_lap;  // measured, fraction per lap
  std::optional<double> laps_until_critical;
  TempTrend temp_trend{TempTrend::Stable};
  bool degradation_rising{false};
};

// base * (1 + max(0, avg_temp - optimal_max) / temp_scale) * (1 + laps * age_factor)
double degradation_rate_per_lap(double avg_temp, int laps_on_tires,
                                const TireWindow& w, const TireTunables& t);

// 100 - laps * rate, floored at 0.
double grip_remaining_pct(int laps_on_tires, double rate_per_lap);

// <40% grip: next lap; <60%: within 3 laps; otherwise none.
std::optional<int> recommended_change_lap(double grip_pct, int current_lap);

// Where the current set went on. A Session tracks this as samples arrive, so
// evicting old samples does not shorten the stint.
struct TireStint {
  int start_lap{0};
  bool changed{false};   // a tire change was seen, as opposed to the first lap
};

// Without a tracked stint the oldest buffered sample (or the latest change in
// the buffer) is taken as the start of the set.
TireState analyze_tires(const HistoryBuffer& buf, const SessionConfig& cfg,
                        const std::optional<TireStint>& stint = std::nullopt);

} // namespace pitwall
