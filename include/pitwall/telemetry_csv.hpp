#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/telemetry.hpp>

namespace pitwall {

// Column order:
// timestamp_ms,lap,sector,speed,throttle,brake,steering,fuel,
// t_fl,t_fr,t_rl,t_rr,w_fl,w_fr,w_rl,w_rr,lap_time,gap_ahead,gap_behind,
// track_pos,g_lat,g_long
// The first 17 columns are required; the rest may be missing or empty.
// Header optional, '#' and blank lines ignored, unparsable rows skipped.
struct TelemetryCsvResult {
  std::vector<TelemetrySample> samples;
  std::size_t skipped_rows{0};
};

TelemetryCsvResult telemetry_from_csv_stream(std::istream& in);
std::optional<TelemetryCsvResult> load_telemetry_csv(const std::string& path);

} // namespace pitwall
