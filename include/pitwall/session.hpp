#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/driver.hpp>
#include <pitwall/fuel.hpp>
#include <pitwall/history.hpp>
#include <pitwall/status.hpp>
#include <pitwall/strategy.hpp>
#include <pitwall/tires.hpp>

namespace pitwall {

struct SessionSummary {
  std::string id;
  int current_lap{};
  int laps_completed{};
  int pit_stops{};                      // refuels seen since the session opened
  std::optional<double> mean_lap_time;
  std::optional<double> best_lap_time;
  std::optional<double> median_fuel_per_lap;
  std::size_t samples_held{};
  std::uint64_t samples_rejected{};
  bool closed{false};
};

// Everything the pit wall shows, computed under one read lock so the parts
// agree with each other.
struct SessionAnalysis {
  int current_lap{};
  std::size_t samples{};
  std::optional<double> gap_ahead;
  std::optional<double> gap_behind;
  FuelState fuel{};
  TireState tires{};
  DriverPerformance driver{};
  StrategyRecommendation strategy{};
};

// One logical race session. ingest() takes the write lock; queries take a
// shared lock and are pure functions of the buffer and config.
class Session {
public:
  // cfg must already pass validate(); SessionManager::open checks it.
  Session(std::string id, const SessionConfig& cfg);
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& id() const { return id_; }
  const SessionConfig& config() const { return cfg_; }

  // Ok, OutOfOrderSample, InvalidSample or SessionClosed.
  Errc ingest(const TelemetrySample& s);

  FuelState fuel() const;
  TireState tires() const;
  DriverPerformance driver() const;
  StrategyRecommendation recommend() const;
  SessionAnalysis analyze() const;
  SessionSummary summary() const;
  std::vector<LapSummary> laps() const;

  std::size_t size() const;
  std::uint64_t rejected() const;

  // Drops the history and its storage; later ingest() returns SessionClosed.
  void close();
  bool closed() const;

private:
  std::optional<int> laps_to_go_() const;
  FuelState fuel_() const;
  TireState tires_() const;
  StrategyInputs strategy_inputs_(const FuelState& f, const TireState& t) const;

  const std::string id_;
  const SessionConfig cfg_;

  mutable std::shared_mutex m_;
  HistoryBuffer buf_;
  std::optional<std::int64_t> start_ms_;
  std::optional<TireStint> stint_;   // set by the first accepted sample
  int refuels_{0};
  std::uint64_t rejected_{0};
  bool closed_{false};
};

// Session-keyed registry; no analysis state is shared between sessions.
class SessionManager {
public:
  // InvalidConfiguration or DuplicateSession leave the registry untouched.
  Errc open(const std::string& id, const SessionConfig& cfg);
  // Closes and forgets the session; UnknownSession if absent.
  Errc close(const std::string& id);
  std::shared_ptr<Session> find(const std::string& id) const;
  Errc ingest(const std::string& id, const TelemetrySample& s);
  std::vector<std::string> ids() const;
  std::size_t size() const;

private:
  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace pitwall
