#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include <pitwall/history.hpp>
#include "feed_helpers.hpp"

using namespace pitwall;
using Catch::Approx;

static TelemetrySample at(std::int64_t ts, int lap, double fuel = 50.0) {
  TelemetrySample s;
  s.timestamp_ms = ts;
  s.lap = lap;
  s.fuel_level = fuel;
  return s;
}

TEST_CASE("HistoryBuffer rejects samples that go backwards") {
  HistoryBuffer buf;
  REQUIRE(buf.append(at(1000, 1)) == Errc::Ok);
  REQUIRE(buf.append(at(2000, 1)) == Errc::Ok);

  SECTION("earlier timestamp") {
    REQUIRE(buf.append(at(1500, 1)) == Errc::OutOfOrderSample);
    REQUIRE(buf.size() == 2);
    REQUIRE(buf.back().timestamp_ms == 2000);
    REQUIRE(buf.total_accepted() == 2);
  }

  SECTION("lower lap") {
    REQUIRE(buf.append(at(3000, 0)) == Errc::OutOfOrderSample);
    REQUIRE(buf.size() == 2);
  }

  SECTION("equal timestamp is accepted") {
    REQUIRE(buf.append(at(2000, 1)) == Errc::Ok);
    REQUIRE(buf.size() == 3);
  }
}

TEST_CASE("HistoryBuffer rejects insane samples") {
  HistoryBuffer buf;
  auto s = at(0, 1);
  s.throttle = 1.5;
  REQUIRE(buf.append(s) == Errc::InvalidSample);

  s = at(0, 1);
  s.speed = std::nan("");
  REQUIRE(buf.append(s) == Errc::InvalidSample);

  s = at(0, 1);
  s.fuel_level = -1.0;
  REQUIRE(buf.append(s) == Errc::InvalidSample);

  s = at(0, 1);
  s.tire_wear[RR] = 1.2;
  REQUIRE(buf.append(s) == Errc::InvalidSample);

  REQUIRE(buf.empty());
}

TEST_CASE("HistoryBuffer evicts oldest first") {
  SECTION("by count") {
    HistoryBuffer buf(5);
    for (int i = 0; i < 8; ++i) REQUIRE(buf.append(at(i * 1000, 1)) == Errc::Ok);
    REQUIRE(buf.size() == 5);
    REQUIRE(buf.front().timestamp_ms == 3000);
    REQUIRE(buf.back().timestamp_ms == 7000);
    REQUIRE(buf.total_evicted() == 3);
  }

  SECTION("by time span") {
    HistoryBuffer buf(100, 2500);
    for (int i = 0; i <= 5; ++i) REQUIRE(buf.append(at(i * 1000, 1)) == Errc::Ok);
    REQUIRE(buf.size() == 3);
    REQUIRE(buf.front().timestamp_ms == 3000);
  }
}

TEST_CASE("HistoryBuffer windows return the newest samples oldest first") {
  HistoryBuffer buf;
  for (int i = 0; i < 10; ++i) REQUIRE(buf.append(at(i * 1000, 1)) == Errc::Ok);

  auto w = buf.window(std::size_t{3});
  REQUIRE(w.size() == 3);
  REQUIRE(w.front().timestamp_ms == 7000);
  REQUIRE(w.back().timestamp_ms == 9000);

  REQUIRE(buf.window(std::size_t{50}).size() == 10);

  auto d = buf.window(std::chrono::milliseconds(3000));
  REQUIRE(d.size() == 4);
  REQUIRE(d.front().timestamp_ms == 6000);
}

TEST_CASE("lap_boundaries is lazy and restartable") {
  HistoryBuffer buf;
  const int laps[] = {1, 1, 2, 2, 2, 3};
  for (int i = 0; i < 6; ++i) REQUIRE(buf.append(at(i * 100, laps[i])) == Errc::Ok);

  auto collect = [&] {
    std::vector<LapBoundary> v;
    for (const auto b : buf.lap_boundaries()) v.push_back(b);
    return v;
  };
  const auto first = collect();
  REQUIRE(first.size() == 3);
  REQUIRE(first[0].lap == 1);
  REQUIRE(first[0].first_index == 0);
  REQUIRE(first[1].lap == 2);
  REQUIRE(first[1].first_index == 2);
  REQUIRE(first[2].lap == 3);
  REQUIRE(first[2].first_index == 5);

  const auto again = collect();
  REQUIRE(again.size() == first.size());
  REQUIRE(again[2].first_index == 5);

  HistoryBuffer empty;
  REQUIRE(empty.lap_boundaries().begin() == empty.lap_boundaries().end());
}

TEST_CASE("lap_summaries covers completed laps only") {
  HistoryBuffer buf;
  LapFeeder feed(buf);
  feed.lap_using(2.0);
  feed.lap_using(2.5);
  feed.lap_using(3.0);

  SECTION("the running lap is not a summary") {
    REQUIRE(lap_summaries(buf).size() == 2);
  }

  SECTION("a later lap start completes it") {
    feed.close_lap();
    const auto laps = lap_summaries(buf);
    REQUIRE(laps.size() == 3);
    REQUIRE(laps[0].lap_number == 1);
    REQUIRE(laps[0].fuel_used == Approx(2.0));
    REQUIRE(laps[1].fuel_used == Approx(2.5));
    REQUIRE(laps[2].fuel_used == Approx(3.0));
    REQUIRE(laps[0].lap_time == Approx(10.0));
    REQUIRE(laps[0].avg_speed == Approx(200.0));
    REQUIRE(laps[0].max_speed == Approx(200.0));
  }

  SECTION("simulator lap time wins over the sample clock") {
    feed.proto.lap_time = 95.5;
    feed.close_lap();
    REQUIRE(lap_summaries(buf).back().lap_time == Approx(95.5));
  }
}

TEST_CASE("lap_summaries skips a lap cut by eviction") {
  HistoryBuffer buf(15);
  LapFeeder feed(buf);
  feed.laps_using(2, 2.0);
  feed.close_lap();   // 21 samples, 6 evicted from lap 1

  REQUIRE(buf.front_lap_partial());
  const auto laps = lap_summaries(buf);
  REQUIRE(laps.size() == 1);
  REQUIRE(laps[0].lap_number == 2);
}

TEST_CASE("refuel and tire change scans") {
  HistoryBuffer buf;
  REQUIRE(buf.append(at(0, 1, 10.0)) == Errc::Ok);
  REQUIRE(buf.append(at(1000, 1, 9.5)) == Errc::Ok);
  REQUIRE(buf.append(at(2000, 2, 40.0)) == Errc::Ok);
  REQUIRE(buf.append(at(3000, 2, 41.0)) == Errc::Ok);   // below threshold

  const auto refuels = refuel_events(buf, 5.0);
  REQUIRE(refuels.size() == 1);
  REQUIRE(refuels[0].index == 2);
  REQUIRE(refuels[0].lap == 2);
  REQUIRE(refuels[0].added_l == Approx(30.5));

  HistoryBuffer tb;
  auto s = at(0, 1);
  s.tire_wear.fill(0.4);
  REQUIRE(tb.append(s) == Errc::Ok);
  s.timestamp_ms = 1000;
  s.tire_wear.fill(0.41);
  REQUIRE(tb.append(s) == Errc::Ok);
  s.timestamp_ms = 2000;
  s.tire_wear.fill(0.0);
  REQUIRE(tb.append(s) == Errc::Ok);

  const auto changes = tire_change_events(tb, 0.10);
  REQUIRE(changes.size() == 1);
  REQUIRE(changes[0].index == 2);
}

TEST_CASE("release drops the history") {
  HistoryBuffer buf;
  for (int i = 0; i < 4; ++i) REQUIRE(buf.append(at(i, 1)) == Errc::Ok);
  buf.release();
  REQUIRE(buf.empty());
  REQUIRE(buf.append(at(0, 0)) == Errc::Ok);
}
