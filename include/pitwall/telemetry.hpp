#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace pitwall {

// Corner order used by every per-tire array.
enum Corner : std::size_t { FL = 0, FR = 1, RL = 2, RR = 3 };
inline constexpr std::size_t kCorners = 4;

using CornerValues = std::array<double, kCorners>;

// One simulator tick of vehicle state.
struct TelemetrySample {
  std::int64_t timestamp_ms{};   // monotonic
  int lap{};                     // >= 0
  int sector{1};                 // 1..N
  double speed{};                // km/h
  double throttle{};             // 0..1
  double brake{};                // 0..1
  double steering{};             // -1 (left) .. +1 (right)
  double fuel_level{};           // liters, >= 0
  CornerValues tire_temp{};      // °C
  CornerValues tire_wear{};      // 0 = new, 1 = gone
  double lap_time{};             // last completed lap (s), 0 if none yet

  std::optional<double> gap_ahead;   // seconds
  std::optional<double> gap_behind;  // seconds

  // Optional extras; -1.0 track_pos means "not reported".
  double track_pos{-1.0};        // 0..1 around the lap
  double g_lat{};
  double g_long{};
};

// Field-level sanity (finite numbers, ranges). Ordering is checked by the buffer.
bool sample_is_sane(const TelemetrySample& s);

inline double mean_of(const CornerValues& v) {
  return (v[FL] + v[FR] + v[RL] + v[RR]) / static_cast<double>(kCorners);
}

const char* corner_name(Corner c);

} // namespace pitwall
