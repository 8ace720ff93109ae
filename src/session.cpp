#include <pitwall/session.hpp>
#include <algorithm>
#include <utility>
#include <pitwall/log.hpp>
#include <pitwall/stats.hpp>

namespace pitwall {

static constexpr const char* kTag = "session";

Session::Session(std::string id, const SessionConfig& cfg)
  : id_(std::move(id)), cfg_(cfg), buf_(cfg.max_samples, cfg.max_span_ms) {}

Errc Session::ingest(const TelemetrySample& s) {
  std::unique_lock lk(m_);
  if (closed_) return Errc::SessionClosed;

  const bool had_prev = !buf_.empty();
  TelemetrySample prev{};
  if (had_prev) prev = buf_.back();

  const Errc rc = buf_.append(s);
  if (rc != Errc::Ok) {
    ++rejected_;
    if (had_prev) {
      PITWALL_LOGW(kTag, "[%s] rejected sample (%s): t=%lld lap=%d, last t=%lld lap=%d",
                   id_.c_str(), to_string(rc),
                   static_cast<long long>(s.timestamp_ms), s.lap,
                   static_cast<long long>(prev.timestamp_ms), prev.lap);
    } else {
      PITWALL_LOGW(kTag, "[%s] rejected sample (%s): t=%lld lap=%d",
                   id_.c_str(), to_string(rc), static_cast<long long>(s.timestamp_ms), s.lap);
    }
    return rc;
  }

  if (!start_ms_) start_ms_ = s.timestamp_ms;
  if (!stint_) stint_ = TireStint{s.lap, false};
  if (had_prev) {
    const double added = s.fuel_level - prev.fuel_level;
    if (added >= cfg_.refuel_threshold_l) {
      ++refuels_;
      PITWALL_LOGI(kTag, "[%s] refuel on lap %d: +%.1f l", id_.c_str(), s.lap, added);
    }
    if (mean_of(prev.tire_wear) - mean_of(s.tire_wear) >= cfg_.tires.change_wear_drop) {
      stint_ = TireStint{s.lap, true};
      PITWALL_LOGI(kTag, "[%s] tire change on lap %d", id_.c_str(), s.lap);
    }
  }
  return Errc::Ok;
}

std::optional<int> Session::laps_to_go_() const {
  return laps_to_go(buf_, cfg_, start_ms_.value_or(0));
}

FuelState Session::fuel_() const { return analyze_fuel(buf_, cfg_, laps_to_go_()); }
TireState Session::tires_() const { return analyze_tires(buf_, cfg_, stint_); }

StrategyInputs Session::strategy_inputs_(const FuelState& f, const TireState& t) const {
  StrategyInputs in;
  in.fuel = f;
  in.tires = t;
  if (!buf_.empty()) {
    const auto& last = buf_.back();
    in.current_lap = last.lap;
    in.gap_ahead = last.gap_ahead;
    in.gap_behind = last.gap_behind;
  }
  return in;
}

FuelState Session::fuel() const {
  std::shared_lock lk(m_);
  return fuel_();
}

TireState Session::tires() const {
  std::shared_lock lk(m_);
  return tires_();
}

DriverPerformance Session::driver() const {
  std::shared_lock lk(m_);
  return analyze_driver(buf_, cfg_.driver, fuel_(), tires_());
}

StrategyRecommendation Session::recommend() const {
  std::shared_lock lk(m_);
  return pitwall::recommend(strategy_inputs_(fuel_(), tires_()), cfg_);
}

SessionAnalysis Session::analyze() const {
  std::shared_lock lk(m_);
  SessionAnalysis a;
  a.samples = buf_.size();
  a.fuel = fuel_();
  a.tires = tires_();
  a.driver = analyze_driver(buf_, cfg_.driver, a.fuel, a.tires);
  const auto in = strategy_inputs_(a.fuel, a.tires);
  a.current_lap = in.current_lap;
  a.gap_ahead = in.gap_ahead;
  a.gap_behind = in.gap_behind;
  a.strategy = pitwall::recommend(in, cfg_);
  return a;
}

SessionSummary Session::summary() const {
  std::shared_lock lk(m_);
  SessionSummary s;
  s.id = id_;
  s.closed = closed_;
  s.samples_held = buf_.size();
  s.samples_rejected = rejected_;
  if (buf_.empty()) return s;

  s.current_lap = buf_.back().lap;
  const auto laps = lap_summaries(buf_);
  s.laps_completed = static_cast<int>(laps.size());
  s.pit_stops = refuels_;

  std::vector<double> times;
  for (const auto& ls : laps) if (ls.lap_time > 0.0) times.push_back(ls.lap_time);
  s.mean_lap_time = mean(times);
  if (!times.empty()) s.best_lap_time = *std::min_element(times.begin(), times.end());
  s.median_fuel_per_lap = estimate_consumption(buf_, cfg_.refuel_threshold_l, cfg_.fuel).per_lap;
  return s;
}

std::vector<LapSummary> Session::laps() const {
  std::shared_lock lk(m_);
  return lap_summaries(buf_);
}

std::size_t Session::size() const {
  std::shared_lock lk(m_);
  return buf_.size();
}

std::uint64_t Session::rejected() const {
  std::shared_lock lk(m_);
  return rejected_;
}

void Session::close() {
  std::unique_lock lk(m_);
  if (closed_) return;
  closed_ = true;
  buf_.release();
}

bool Session::closed() const {
  std::shared_lock lk(m_);
  return closed_;
}

// ---- SessionManager ----

Errc SessionManager::open(const std::string& id, const SessionConfig& cfg) {
  const auto problems = validate(cfg);
  if (!problems.empty()) {
    PITWALL_LOGE(kTag, "[%s] invalid configuration: %s", id.c_str(), problems.front().c_str());
    return Errc::InvalidConfiguration;
  }
  std::lock_guard lk(m_);
  if (sessions_.count(id)) return Errc::DuplicateSession;
  sessions_.emplace(id, std::make_shared<Session>(id, cfg));
  PITWALL_LOGI(kTag, "[%s] opened", id.c_str());
  return Errc::Ok;
}

Errc SessionManager::close(const std::string& id) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard lk(m_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return Errc::UnknownSession;
    s = std::move(it->second);
    sessions_.erase(it);
  }
  // Callers still holding the pointer see a closed, empty session.
  s->close();
  PITWALL_LOGI(kTag, "[%s] closed", id.c_str());
  return Errc::Ok;
}

std::shared_ptr<Session> SessionManager::find(const std::string& id) const {
  std::lock_guard lk(m_);
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

Errc SessionManager::ingest(const std::string& id, const TelemetrySample& s) {
  auto sess = find(id);
  if (!sess) return Errc::UnknownSession;
  return sess->ingest(s);
}

std::vector<std::string> SessionManager::ids() const {
  std::lock_guard lk(m_);
  std::vector<std::string> out;
  out.reserve(sessions_.size());
  for (const auto& [id, s] : sessions_) out.push_back(id);
  return out;
}

std::size_t SessionManager::size() const {
  std::lock_guard lk(m_);
  return sessions_.size();
}

} // namespace pitwall
