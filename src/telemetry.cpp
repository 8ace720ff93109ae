#include <pitwall/telemetry.hpp>
#include <cmath>

namespace pitwall {

static bool in01(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

bool sample_is_sane(const TelemetrySample& s) {
  if (s.lap < 0 || s.sector < 0) return false;
  if (!std::isfinite(s.speed) || !std::isfinite(s.steering)) return false;
  if (!in01(s.throttle) || !in01(s.brake)) return false;
  if (!std::isfinite(s.fuel_level) || s.fuel_level < 0.0) return false;
  for (std::size_t c = 0; c < kCorners; ++c) {
    if (!std::isfinite(s.tire_temp[c])) return false;
    if (!in01(s.tire_wear[c])) return false;
  }
  if (!std::isfinite(s.lap_time) || s.lap_time < 0.0) return false;
  if (s.gap_ahead && !std::isfinite(*s.gap_ahead)) return false;
  if (s.gap_behind && !std::isfinite(*s.gap_behind)) return false;
  if (!std::isfinite(s.track_pos) || !std::isfinite(s.g_lat) || !std::isfinite(s.g_long)) return false;
  return true;
}

const char* corner_name(Corner c) {
  switch (c) {
    case FL: return "FL";
    case FR: return "FR";
    case RL: return "RL";
    case RR: return "RR";
  }
  return "?";
}

} // namespace pitwall
