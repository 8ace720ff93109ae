#include <pitwall/feed_runner.hpp>
#include <chrono>
#include <string>
#include <pitwall/log.hpp>

namespace pitwall {

static constexpr const char* kTag = "feed";
static constexpr double kBaseDt = 1.0 / 60.0;   // wall cadence of the feed thread
static constexpr std::uint64_t kPublishEvery = 6; // ~10 Hz analysis snapshots

// The feed samples at the thread cadence, so the history has to hold a full
// fuel window of laps at that rate.
static SessionConfig sized_for_feed(SessionConfig cfg, const SynthParams& params) {
  ensure_history_covers(cfg, nominal_lap_time_s(params), 1.0 / kBaseDt);
  return cfg;
}

FeedRunner::FeedRunner(const SessionConfig& cfg, const SynthParams& params)
  : cfg_(sized_for_feed(cfg, params)), params_(params), car_(params),
    session_(std::make_shared<Session>("synth-0", cfg_)) {}

std::shared_ptr<Session> FeedRunner::session() const {
  std::lock_guard<std::mutex> lk(session_m_);
  return session_;
}

void FeedRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&FeedRunner::thread_main_, this);
}

void FeedRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void FeedRunner::reset_() {
  car_ = SynthCar(params_);
  auto next = std::make_shared<Session>("synth-" + std::to_string(++generation_), cfg_);
  std::shared_ptr<Session> old;
  {
    std::lock_guard<std::mutex> lk(session_m_);
    old = std::move(session_);
    session_ = next;
  }
  old->close();
  PITWALL_LOGI(kTag, "reset: now feeding %s", next->id().c_str());
}

void FeedRunner::step_once(double dt_s) {
  if (pending_reset_.exchange(false, std::memory_order_acq_rel)) reset_();
  if (pending_pit_.exchange(false, std::memory_order_acq_rel)) {
    car_.request_pit();
    PITWALL_LOGI(kTag, "pit requested for end of lap %d", car_.lap());
  }
  if (dt_s <= 0.0) return;
  car_.step(dt_s);
  const auto rc = session()->ingest(car_.sample());
  if (rc != Errc::Ok) PITWALL_LOGD(kTag, "ingest: %s", to_string(rc));
}

void FeedRunner::publish_(std::uint64_t tick) {
  const auto sess = session();
  PitWallSnapshot s;
  s.tick = tick;
  s.sim_time = car_.sim_time();
  car_.sample_pose(s.x, s.y, s.heading_rad);
  s.lap_fraction = car_.lap_fraction();
  s.track_radius_m = car_.radius_m();
  s.latest = car_.sample();
  s.analysis = sess->analyze();
  s.summary = sess->summary();
  buffer_.publish(std::move(s));
}

void FeedRunner::thread_main_() {
  using clock = std::chrono::steady_clock;
  const auto tick_ns = std::chrono::nanoseconds(static_cast<long long>(kBaseDt * 1e9));
  auto next = clock::now();
  std::uint64_t tick = 0;

  while (running_.load(std::memory_order_relaxed)) {
    const double warp = time_scale.load(std::memory_order_relaxed);
    step_once(kBaseDt * (warp < 0.0 ? 0.0 : warp));
    ++tick;

    // Heartbeats keep flowing while paused.
    if (tick % kPublishEvery == 0) publish_(tick);

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace pitwall
