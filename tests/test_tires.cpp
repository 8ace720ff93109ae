#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <pitwall/tires.hpp>
#include "feed_helpers.hpp"

using namespace pitwall;
using Catch::Approx;

TEST_CASE("degradation and grip formulas") {
  const TireWindow w{};
  const TireTunables t{};

  SECTION("grip after 25 laps at 0.58 per lap") {
    REQUIRE(grip_remaining_pct(25, 0.58) == Approx(85.5));
  }

  SECTION("rate inside the window only ages") {
    REQUIRE(degradation_rate_per_lap(91.0, 25, w, t) == Approx(0.5 * 1.25));
    REQUIRE(degradation_rate_per_lap(91.0, 0, w, t) == Approx(0.5));
  }

  SECTION("rate above the window scales with temperature") {
    REQUIRE(degradation_rate_per_lap(105.0, 0, w, t) == Approx(0.5 * 1.2));
  }

  SECTION("grip is floored at zero") {
    REQUIRE(grip_remaining_pct(300, 0.5) == Approx(0.0));
    REQUIRE(grip_remaining_pct(0, 5.0) == Approx(100.0));
  }
}

TEST_CASE("recommended_change_lap thresholds") {
  REQUIRE(recommended_change_lap(39.0, 10) == 11);
  REQUIRE(recommended_change_lap(59.0, 10) == 13);
  REQUIRE_FALSE(recommended_change_lap(60.0, 10).has_value());
}

TEST_CASE("analyze_tires temperature state") {
  HistoryBuffer buf;
  SessionConfig cfg;

  SECTION("empty history") {
    REQUIRE(analyze_tires(buf, cfg).status == DataStatus::InsufficientData);
  }

  SECTION("91C is inside the default window") {
    LapFeeder feed(buf);
    feed.proto.tire_temp.fill(91.0);
    feed.lap_using(2.0);
    const auto ts = analyze_tires(buf, cfg);
    REQUIRE(ts.status == DataStatus::Ok);
    REQUIRE(ts.avg_temp == Approx(91.0));
    REQUIRE(ts.corner_temps[FR] == Approx(91.0));
    REQUIRE(ts.in_optimal_window);
    REQUIRE_FALSE(ts.is_overheating);
  }

  SECTION("one hot corner is overheating") {
    LapFeeder feed(buf);
    feed.proto.tire_temp = {106.0, 90.0, 90.0, 90.0};
    feed.lap_using(2.0);
    const auto ts = analyze_tires(buf, cfg);
    REQUIRE(ts.is_overheating);
    REQUIRE(ts.in_optimal_window);
  }

  SECTION("car class window") {
    LapFeeder feed(buf);
    feed.proto.tire_temp.fill(91.0);
    feed.lap_using(2.0);
    apply_car_class(cfg, *car_class_by_key("F1"));
    REQUIRE_FALSE(analyze_tires(buf, cfg).in_optimal_window);
  }
}

TEST_CASE("analyze_tires stint tracking") {
  HistoryBuffer buf;
  SessionConfig cfg;
  LapFeeder feed(buf);

  SECTION("age counts from the first lap seen") {
    feed.laps_using(5, 2.0, 0.01);
    feed.close_lap();
    const auto ts = analyze_tires(buf, cfg);
    REQUIRE(ts.laps_on_tires == 5);
    REQUIRE(ts.degradation_rate_per_lap == Approx(0.5 * 1.05));
    REQUIRE(ts.grip_remaining_pct == Approx(100.0 - 5 * 0.525));
    REQUIRE_FALSE(ts.recommended_change_lap.has_value());
  }

  SECTION("initial age is added when no change is seen") {
    cfg.tires.initial_tire_age_laps = 10;
    feed.laps_using(5, 2.0, 0.01);
    feed.close_lap();
    REQUIRE(analyze_tires(buf, cfg).laps_on_tires == 15);
  }

  SECTION("a wear drop starts a new stint") {
    feed.laps_using(3, 2.0, 0.05);
    feed.wear = 0.0;          // new set before lap 4
    feed.laps_using(2, 2.0, 0.05);
    feed.close_lap();         // lap 6
    const auto ts = analyze_tires(buf, cfg);
    REQUIRE(ts.laps_on_tires == 2);
    REQUIRE(ts.wear_rate_per_lap.has_value());
    REQUIRE((*ts.wear_rate_per_lap)[FL] == Approx(0.05));
    REQUIRE(ts.laps_until_critical.has_value());
    REQUIRE(*ts.laps_until_critical == Approx((0.95 - 0.10) / 0.05));
  }
}

TEST_CASE("analyze_tires wear trend") {
  HistoryBuffer buf;
  SessionConfig cfg;
  LapFeeder feed(buf);

  SECTION("steady wear is not rising") {
    feed.laps_using(4, 2.0, 0.01);
    feed.close_lap();
    REQUIRE_FALSE(analyze_tires(buf, cfg).degradation_rising);
  }

  SECTION("a lap well above the stint median is rising") {
    feed.laps_using(3, 2.0, 0.01);
    feed.lap_using(2.0, 0.03);
    feed.close_lap();
    REQUIRE(analyze_tires(buf, cfg).degradation_rising);
  }

  SECTION("no completed lap means no measured rate") {
    feed.lap_using(2.0, 0.01);
    const auto ts = analyze_tires(buf, cfg);
    REQUIRE(ts.status == DataStatus::Ok);
    REQUIRE_FALSE(ts.wear_rate_per_lap.has_value());
    REQUIRE_FALSE(ts.laps_until_critical.has_value());
  }
}

TEST_CASE("analyze_tires temperature trend") {
  HistoryBuffer buf;
  SessionConfig cfg;
  LapFeeder feed(buf);
  const double starts[] = {80.0, 85.0, 95.0};
  for (double t : starts) {
    feed.proto.tire_temp.fill(t);
    feed.lap_using(2.0);
  }
  REQUIRE(analyze_tires(buf, cfg).temp_trend == TempTrend::Rising);
  REQUIRE(std::string(to_string(TempTrend::Rising)) == "rising");
}
