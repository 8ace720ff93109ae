#include <pitwall/report.hpp>
#include <cstdio>

namespace pitwall {

static std::string opt(const std::optional<double>& v, const char* f) {
  if (!v) return "--";
  char buf[48];
  std::snprintf(buf, sizeof(buf), f, *v);
  return buf;
}

static std::string line(const char* f, const std::string& a) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), f, a.c_str());
  return buf;
}

std::string format_recommendation(int lap, const StrategyRecommendation& r) {
  char buf[256];
  std::snprintf(buf, sizeof(buf), "lap %d %s/%s: %s",
                lap, to_string(r.action), to_string(r.priority), r.reason.c_str());
  return buf;
}

std::string format_report(const SessionSummary& sum, const SessionAnalysis& a) {
  std::string out;
  char buf[160];

  std::snprintf(buf, sizeof(buf), "session %s: lap %d, %d laps completed, %d pit stops\n",
                sum.id.c_str(), sum.current_lap, sum.laps_completed, sum.pit_stops);
  out += buf;
  std::snprintf(buf, sizeof(buf), "samples held %zu, rejected %llu\n",
                sum.samples_held, static_cast<unsigned long long>(sum.samples_rejected));
  out += buf;
  out += line("lap time   best %s", opt(sum.best_lap_time, "%.3fs"));
  out += line("  mean %s\n", opt(sum.mean_lap_time, "%.3fs"));

  const auto& f = a.fuel;
  out += line("fuel       [%s]", to_string(f.status));
  std::snprintf(buf, sizeof(buf), " level %.1f l", f.current_level);
  out += buf;
  out += line("  per lap %s", opt(f.per_lap_consumption, "%.2f l"));
  out += line("  range %s laps", opt(f.remaining_laps, "%.1f"));
  if (f.can_finish) {
    std::snprintf(buf, sizeof(buf), "  %s", *f.can_finish ? "can finish" : "short");
    out += buf;
    if (!*f.can_finish) {
      std::snprintf(buf, sizeof(buf), " (save %.0f%%, add %.1f l)",
                    f.required_savings_pct, f.recommended_fuel_add_l);
      out += buf;
    }
  }
  out += "\n";

  const auto& t = a.tires;
  out += line("tires      [%s]", to_string(t.status));
  if (t.status == DataStatus::Ok) {
    std::snprintf(buf, sizeof(buf), " avg %.1fC (%s)%s%s  age %d laps  grip %.1f%%  deg %.2f%%/lap",
                  t.avg_temp, to_string(t.temp_trend),
                  t.in_optimal_window ? " in window" : " out of window",
                  t.is_overheating ? " OVERHEATING" : "",
                  t.laps_on_tires, t.grip_remaining_pct, t.degradation_rate_per_lap);
    out += buf;
    out += line("  critical in %s laps", opt(t.laps_until_critical, "%.1f"));
  }
  out += "\n";

  const auto& d = a.driver;
  out += line("driver     [%s]", to_string(d.status));
  if (d.status == DataStatus::Ok) {
    out += line(" consistency %s", opt(d.consistency, "%.0f"));
    std::snprintf(buf, sizeof(buf), "  smoothness %.0f  aggression %.0f", d.smoothness, d.aggression);
    out += buf;
    out += line("  precision %s", opt(d.precision, "%.0f"));
    out += line("  fuel %s", opt(d.fuel_efficiency, "%.0f"));
    out += line("  tires %s", opt(d.tire_management, "%.0f"));
    std::snprintf(buf, sizeof(buf), "  overall %.0f", d.overall_score);
    out += buf;
  }
  out += "\n";

  out += "strategy   " + format_recommendation(a.current_lap, a.strategy) + "\n";
  return out;
}

} // namespace pitwall
