#include <cstdio>
#include <pitwall/config.hpp>
#include <pitwall/feed_runner.hpp>
#include <pitwall/log.hpp>
#include <pitwall/viewer/app.hpp>

using namespace pitwall;

// Usage: pitwall_viewer [session.yaml]
int main(int argc, char** argv) {
  SessionConfig cfg;
  cfg.race.laps = 30;
  if (argc > 1) {
    auto loaded = load_session_config_yaml(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "cannot use session config %s\n", argv[1]);
      return 1;
    }
    cfg = *loaded;
  }

  SynthParams params;
  params.tank_capacity_l = cfg.tank_capacity_l;
  params.start_fuel_l = 40.0;
  params.pit_on_lap = 12;

  FeedRunner feed(cfg, params);
  feed.start();

  ViewerApp app(feed);
  const int code = app.run();

  feed.stop();
  return code;
}
