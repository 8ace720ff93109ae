#include <pitwall/telemetry_csv.hpp>
#include <fstream>
#include <iterator>
#include "csv.hpp"

namespace pitwall {

static constexpr std::size_t kRequiredCols = 17;

static bool opt_double(const std::vector<std::string>& cols, std::size_t i, std::optional<double>& out) {
  if (i >= cols.size() || cols[i].empty()) return true;  // absent
  double v;
  if (!csv::to_double(cols[i], v)) return false;
  out = v;
  return true;
}

static bool opt_double(const std::vector<std::string>& cols, std::size_t i, double& out) {
  std::optional<double> v;
  if (!opt_double(cols, i, v)) return false;
  if (v) out = *v;
  return true;
}

static std::optional<TelemetrySample> parse_row(const std::vector<std::string>& cols) {
  if (cols.size() < kRequiredCols) return std::nullopt;
  TelemetrySample s;
  long long ts, lap, sector;
  if (!(csv::to_int64(cols[0], ts) && csv::to_int64(cols[1], lap) && csv::to_int64(cols[2], sector))) {
    return std::nullopt;
  }
  s.timestamp_ms = ts;
  s.lap = static_cast<int>(lap);
  s.sector = static_cast<int>(sector);

  double* req[] = {&s.speed, &s.throttle, &s.brake, &s.steering, &s.fuel_level,
                   &s.tire_temp[FL], &s.tire_temp[FR], &s.tire_temp[RL], &s.tire_temp[RR],
                   &s.tire_wear[FL], &s.tire_wear[FR], &s.tire_wear[RL], &s.tire_wear[RR],
                   &s.lap_time};
  for (std::size_t k = 0; k < std::size(req); ++k) {
    if (!csv::to_double(cols[3 + k], *req[k])) return std::nullopt;
  }

  if (!opt_double(cols, 17, s.gap_ahead)) return std::nullopt;
  if (!opt_double(cols, 18, s.gap_behind)) return std::nullopt;
  if (!opt_double(cols, 19, s.track_pos)) return std::nullopt;
  if (!opt_double(cols, 20, s.g_lat)) return std::nullopt;
  if (!opt_double(cols, 21, s.g_long)) return std::nullopt;
  return s;
}

TelemetryCsvResult telemetry_from_csv_stream(std::istream& in) {
  TelemetryCsvResult out;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = csv::split_line(raw);
    if (!header_consumed && cols[0] == "timestamp_ms") {
      header_consumed = true;
      continue;
    }
    if (auto s = parse_row(cols)) out.samples.push_back(*s);
    else ++out.skipped_rows;
  }
  return out;
}

std::optional<TelemetryCsvResult> load_telemetry_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return telemetry_from_csv_stream(f);
}

} // namespace pitwall
