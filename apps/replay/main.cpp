#include <cstdio>
#include <optional>
#include <pitwall/config.hpp>
#include <pitwall/log.hpp>
#include <pitwall/report.hpp>
#include <pitwall/session.hpp>
#include <pitwall/telemetry_csv.hpp>

using namespace pitwall;

static constexpr const char* kTag = "replay";

// Usage: pitwall_replay <telemetry.csv> [session.yaml]
int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <telemetry.csv> [session.yaml]\n", argv[0]);
    return 2;
  }

  SessionConfig cfg;
  cfg.race.laps = 50;
  if (argc > 2) {
    auto loaded = load_session_config_yaml(argv[2]);
    if (!loaded) return 1;
    cfg = *loaded;
  }

  auto csv = load_telemetry_csv(argv[1]);
  if (!csv) {
    PITWALL_LOGE(kTag, "cannot open %s", argv[1]);
    return 1;
  }
  if (csv->skipped_rows > 0) {
    PITWALL_LOGW(kTag, "%zu unparsable rows skipped in %s", csv->skipped_rows, argv[1]);
  }

  SessionManager mgr;
  const std::string id = "replay";
  if (mgr.open(id, cfg) != Errc::Ok) return 1;
  auto session = mgr.find(id);

  std::optional<Action> last_action;
  for (const auto& s : csv->samples) {
    if (session->ingest(s) != Errc::Ok) continue;
    const auto rec = session->recommend();
    if (!last_action || *last_action != rec.action) {
      PITWALL_LOGI(kTag, "%s", format_recommendation(s.lap, rec).c_str());
      last_action = rec.action;
    }
  }

  std::fputs(format_report(session->summary(), session->analyze()).c_str(), stdout);
  return mgr.close(id) == Errc::Ok ? 0 : 1;
}
