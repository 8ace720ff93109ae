#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <pitwall/log.hpp>

using namespace pitwall;

namespace {
// Restores the global logger after each test.
struct LogGuard {
  std::shared_ptr<log::MemorySink> sink;
  log::Level prev;
  explicit LogGuard(std::size_t cap = 256)
    : sink(std::make_shared<log::MemorySink>(cap)), prev(log::Logger::instance().level()) {
    log::Logger::instance().add_sink(sink);
    log::Logger::instance().set_console_enabled(false);
  }
  ~LogGuard() {
    log::Logger::instance().remove_sink(sink);
    log::Logger::instance().set_console_enabled(true);
    log::Logger::instance().set_level(prev);
  }
};
}

TEST_CASE("logger formats records into sinks") {
  LogGuard g;
  PITWALL_LOGI("test", "lap %d fuel %.1f", 12, 8.5);
  const auto recs = g.sink->snapshot();
  REQUIRE(recs.size() == 1);
  REQUIRE(recs[0].level == log::Level::Info);
  REQUIRE(recs[0].tag == "test");
  REQUIRE(recs[0].msg == "lap 12 fuel 8.5");
}

TEST_CASE("logger drops records below the level") {
  LogGuard g;
  log::Logger::instance().set_level(log::Level::Warn);
  PITWALL_LOGD("test", "debug");
  PITWALL_LOGI("test", "info");
  PITWALL_LOGW("test", "warn");
  PITWALL_LOGE("test", "error");
  REQUIRE(g.sink->snapshot().size() == 2);
  REQUIRE(g.sink->count(log::Level::Warn) == 1);
  REQUIRE(g.sink->count(log::Level::Error) == 1);
  REQUIRE_FALSE(log::Logger::instance().enabled(log::Level::Info));
}

TEST_CASE("memory sink keeps the newest records") {
  LogGuard g(2);
  PITWALL_LOGI("test", "one");
  PITWALL_LOGI("test", "two");
  PITWALL_LOGI("test", "three");
  const auto recs = g.sink->snapshot();
  REQUIRE(recs.size() == 2);
  REQUIRE(recs[0].msg == "two");
  REQUIRE(recs[1].msg == "three");
  g.sink->clear();
  REQUIRE(g.sink->snapshot().empty());
}

TEST_CASE("level names") {
  REQUIRE(std::string(log::level_name(log::Level::Warn)) == "WARN");
  REQUIRE(std::string(log::level_name(log::Level::Error)) == "ERROR");
}
