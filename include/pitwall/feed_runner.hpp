#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <pitwall/config.hpp>
#include <pitwall/session.hpp>
#include <pitwall/snap_buffer.hpp>
#include <pitwall/synth.hpp>

namespace pitwall {

// What the UI thread draws; one per published tick.
struct PitWallSnapshot {
  std::uint64_t tick = 0;
  double sim_time = 0.0;
  double x = 0.0;
  double y = 0.0;
  double heading_rad = 0.0;
  double lap_fraction = 0.0;
  double track_radius_m = 0.0;
  TelemetrySample latest{};
  SessionAnalysis analysis{};
  SessionSummary summary{};
};

using SnapshotBuffer = LatestBuffer<PitWallSnapshot>;

// Owns the feed thread: steps a SynthCar, ingests every sample into its
// Session and publishes analysis snapshots at a lower rate.
class FeedRunner {
public:
  FeedRunner(const SessionConfig& cfg, const SynthParams& params);
  ~FeedRunner() { stop(); }
  FeedRunner(const FeedRunner&) = delete;
  FeedRunner& operator=(const FeedRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Safe to call from the UI thread; applied on the next tick.
  void request_pit() { pending_pit_.store(true, std::memory_order_release); }
  void request_reset() { pending_reset_.store(true, std::memory_order_release); }

  // The session currently fed; replaced on reset.
  std::shared_ptr<Session> session() const;

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }

  std::atomic<double> time_scale{1.0}; // 0.0 = paused

  // Synchronous stepping for tests and headless use; not while the thread runs.
  void step_once(double dt_s);

private:
  void thread_main_();
  void reset_();
  void publish_(std::uint64_t tick);

  SessionConfig cfg_;
  SynthParams params_;
  SynthCar car_;

  mutable std::mutex session_m_;
  std::shared_ptr<Session> session_;
  std::uint64_t generation_ = 0;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<bool> pending_pit_{false};
  std::atomic<bool> pending_reset_{false};

  SnapshotBuffer buffer_;
};

} // namespace pitwall
