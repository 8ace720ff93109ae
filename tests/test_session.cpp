#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <pitwall/log.hpp>
#include <pitwall/session.hpp>
#include <pitwall/synth.hpp>
#include "feed_helpers.hpp"

using namespace pitwall;
using Catch::Approx;

static SessionConfig race_cfg(int laps = 30) {
  SessionConfig cfg;
  cfg.race.laps = laps;
  return cfg;
}

TEST_CASE("SessionManager open and close") {
  SessionManager mgr;

  SECTION("invalid configuration is refused") {
    auto cfg = race_cfg();
    cfg.tank_capacity_l = 0.0;
    REQUIRE(mgr.open("a", cfg) == Errc::InvalidConfiguration);
    REQUIRE(mgr.find("a") == nullptr);

    cfg = race_cfg(0);
    REQUIRE(mgr.open("a", cfg) == Errc::InvalidConfiguration);
  }

  SECTION("ids are unique") {
    REQUIRE(mgr.open("a", race_cfg()) == Errc::Ok);
    REQUIRE(mgr.open("a", race_cfg()) == Errc::DuplicateSession);
    REQUIRE(mgr.open("b", race_cfg()) == Errc::Ok);
    REQUIRE(mgr.ids() == std::vector<std::string>{"a", "b"});
  }

  SECTION("unknown sessions") {
    REQUIRE(mgr.ingest("nope", TelemetrySample{}) == Errc::UnknownSession);
    REQUIRE(mgr.close("nope") == Errc::UnknownSession);
  }

  SECTION("close releases the history") {
    REQUIRE(mgr.open("a", race_cfg()) == Errc::Ok);
    auto held = mgr.find("a");
    LapFeeder feed(*held);
    feed.laps_using(2, 2.0);
    REQUIRE(held->size() == 20);

    REQUIRE(mgr.close("a") == Errc::Ok);
    REQUIRE(mgr.find("a") == nullptr);
    REQUIRE(mgr.size() == 0);
    REQUIRE(held->closed());
    REQUIRE(held->size() == 0);
    REQUIRE(held->ingest(feed.at(0.0)) == Errc::SessionClosed);
    REQUIRE(mgr.ingest("a", feed.at(0.0)) == Errc::UnknownSession);
  }
}

TEST_CASE("sessions do not share history") {
  SessionManager mgr;
  REQUIRE(mgr.open("a", race_cfg()) == Errc::Ok);
  REQUIRE(mgr.open("b", race_cfg()) == Errc::Ok);

  LapFeeder feed(*mgr.find("a"));
  feed.laps_using(3, 2.0);
  feed.close_lap();

  REQUIRE(mgr.find("a")->size() == 31);
  REQUIRE(mgr.find("b")->size() == 0);
  REQUIRE(mgr.find("a")->fuel().status == DataStatus::Ok);
  REQUIRE(mgr.find("b")->fuel().status == DataStatus::InsufficientData);
}

TEST_CASE("rejected samples are counted and logged") {
  auto sink = std::make_shared<log::MemorySink>();
  log::Logger::instance().add_sink(sink);

  Session s("log-test", race_cfg());
  TelemetrySample a;
  a.timestamp_ms = 5000;
  a.lap = 2;
  REQUIRE(s.ingest(a) == Errc::Ok);

  TelemetrySample late = a;
  late.timestamp_ms = 4000;
  REQUIRE(s.ingest(late) == Errc::OutOfOrderSample);
  REQUIRE(s.size() == 1);
  REQUIRE(s.rejected() == 1);
  REQUIRE(s.summary().samples_rejected == 1);
  REQUIRE(sink->count(log::Level::Warn) == 1);

  log::Logger::instance().remove_sink(sink);
}

TEST_CASE("session queries are idempotent") {
  Session s("idem", race_cfg());
  LapFeeder feed(s);
  feed.laps_using(6, 2.2, 0.01);
  feed.close_lap();

  const auto f1 = s.fuel();
  const auto f2 = s.fuel();
  REQUIRE(f1.per_lap_consumption == f2.per_lap_consumption);
  REQUIRE(f1.remaining_laps == f2.remaining_laps);
  REQUIRE(f1.laps_to_go == f2.laps_to_go);
  REQUIRE(*f1.laps_to_go == 23);

  const auto t1 = s.tires();
  const auto t2 = s.tires();
  REQUIRE(t1.grip_remaining_pct == t2.grip_remaining_pct);
  REQUIRE(t1.corner_temps == t2.corner_temps);

  const auto d1 = s.driver();
  const auto d2 = s.driver();
  REQUIRE(d1.overall_score == d2.overall_score);
  REQUIRE(d1.lap_times == d2.lap_times);

  REQUIRE(s.recommend().reason == s.recommend().reason);
}

TEST_CASE("analyze agrees with the single queries") {
  Session s("combo", race_cfg(10));
  LapFeeder feed(s);
  feed.fuel = 12.0;
  feed.laps_using(4, 2.4);
  feed.close_lap();   // lap 5, 2.4 l left, 5 to go

  const auto a = s.analyze();
  REQUIRE(a.current_lap == 5);
  REQUIRE(a.samples == 41);
  REQUIRE(a.fuel.remaining_laps == s.fuel().remaining_laps);
  REQUIRE(a.strategy.action == s.recommend().action);
  REQUIRE(a.strategy.action == Action::PitNow);
  REQUIRE(a.strategy.priority == Priority::Critical);
}

TEST_CASE("session summary") {
  Session s("sum", race_cfg());
  LapFeeder feed(s);
  feed.fuel = 10.0;
  feed.laps_using(2, 3.0);
  feed.fuel += 40.0;
  feed.dt_ms = 900;
  feed.laps_using(3, 2.0);
  feed.close_lap();

  const auto sum = s.summary();
  REQUIRE(sum.id == "sum");
  REQUIRE(sum.current_lap == 6);
  REQUIRE(sum.laps_completed == 5);
  REQUIRE(sum.pit_stops == 1);
  REQUIRE(*sum.best_lap_time == Approx(9.0));
  REQUIRE(*sum.median_fuel_per_lap == Approx(2.0));
  REQUIRE(sum.samples_held == 51);
  REQUIRE_FALSE(sum.closed);
  REQUIRE(s.laps().size() == 5);
}

TEST_CASE("a 60 Hz feed keeps a full fuel window") {
  Session s("hz", race_cfg());
  SynthCar car;
  int refused = 0;
  while (car.lap() < 13) {
    car.step(1.0 / 60.0);
    if (s.ingest(car.sample()) != Errc::Ok) ++refused;
  }
  REQUIRE(refused == 0);

  const auto fuel = s.fuel();
  REQUIRE(fuel.status == DataStatus::Ok);
  REQUIRE(fuel.laps_sampled == 10);
  REQUIRE(*fuel.per_lap_consumption == Approx(2.4).epsilon(0.15));
  REQUIRE(s.tires().laps_on_tires == 12);
  REQUIRE(s.summary().laps_completed == 12);
}

TEST_CASE("tire age survives eviction") {
  auto cfg = race_cfg();
  cfg.max_samples = 15;
  cfg.tires.initial_tire_age_laps = 5;
  Session s("evict", cfg);
  LapFeeder feed(s);

  SECTION("set from the start") {
    feed.laps_using(6, 2.0, 0.01);
    feed.close_lap();
    REQUIRE(s.size() == 15);
    REQUIRE(s.tires().laps_on_tires == 6 + 5);
  }

  SECTION("change pushed out of the buffer") {
    feed.laps_using(3, 2.0, 0.05);
    feed.wear = 0.0;
    feed.laps_using(3, 2.0, 0.05);
    feed.close_lap();
    REQUIRE(s.laps().front().lap_number > 4);
    REQUIRE(s.tires().laps_on_tires == 3);
  }
}

TEST_CASE("one writer and several readers") {
  auto cfg = race_cfg();
  cfg.max_samples = 500;
  Session s("mt", cfg);

  std::atomic<bool> done{false};
  std::atomic<int> reads{0};
  std::atomic<int> out_of_range{0};
  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      do {
        const auto a = s.analyze();
        if (a.driver.overall_score < 0.0 || a.driver.overall_score > 100.0) out_of_range.fetch_add(1);
        reads.fetch_add(1);
      } while (!done.load());
    });
  }

  LapFeeder feed(s);
  feed.laps_using(100, 0.5, 0.001);
  done.store(true);
  for (auto& t : readers) t.join();

  REQUIRE(s.size() == 500);
  REQUIRE(s.rejected() == 0);
  REQUIRE(reads.load() >= 3);
  REQUIRE(out_of_range.load() == 0);
}
