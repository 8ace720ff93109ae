#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <pitwall/feed_runner.hpp>

using namespace pitwall;

static SessionConfig feed_cfg() {
  SessionConfig cfg;
  cfg.race.laps = 20;
  return cfg;
}

TEST_CASE("LatestBuffer hands out only the newest value") {
  LatestBuffer<int> buf;
  std::uint64_t cursor = 0;
  int out = -1;
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  buf.publish(1);
  buf.publish(2);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 2);
  REQUIRE(cursor == 2);
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));
}

TEST_CASE("FeedRunner sizes history for its sample rate") {
  const SynthParams p;
  FeedRunner feed(feed_cfg(), p);
  const auto& cfg = feed.session()->config();
  const double lap_s = nominal_lap_time_s(p);
  REQUIRE(lap_s > 100.0);
  REQUIRE(static_cast<double>(cfg.max_samples) >= 12 * lap_s * 60.0);
  REQUIRE(static_cast<double>(cfg.max_span_ms) >= 12 * lap_s * 1000.0);
}

TEST_CASE("FeedRunner steps the car into its session") {
  SynthParams p;
  p.fuel_per_lap_l = 10.0; // a stop then adds more than the refuel threshold
  FeedRunner feed(feed_cfg(), p);
  for (int i = 0; i < 600; ++i) feed.step_once(0.1);

  auto sess = feed.session();
  REQUIRE(sess->size() == 600);
  REQUIRE(sess->rejected() == 0);
  REQUIRE(sess->summary().current_lap >= 1);

  SECTION("pit request reaches the car") {
    feed.request_pit();
    const int stops = sess->summary().pit_stops;
    for (int i = 0; i < 2000; ++i) feed.step_once(0.1);
    REQUIRE(sess->summary().pit_stops == stops + 1);
  }

  SECTION("reset starts a fresh session") {
    feed.request_reset();
    feed.step_once(0.1);
    auto next = feed.session();
    REQUIRE(next != sess);
    REQUIRE(next->id() == "synth-1");
    REQUIRE(next->size() == 1);
    REQUIRE(sess->closed());
  }
}

TEST_CASE("FeedRunner thread publishes snapshots") {
  FeedRunner feed(feed_cfg(), SynthParams{});
  feed.time_scale.store(4.0);
  feed.start();
  REQUIRE(feed.running());

  std::uint64_t cursor = 0;
  PitWallSnapshot snap;
  bool got = false;
  for (int i = 0; i < 200 && !got; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    got = feed.buffer().try_consume_latest(cursor, snap);
  }
  feed.stop();

  REQUIRE(got);
  REQUIRE(snap.tick > 0);
  REQUIRE(snap.summary.id == "synth-0");
  REQUIRE(snap.track_radius_m > 0.0);
  REQUIRE_FALSE(feed.running());
}
