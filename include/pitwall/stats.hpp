#pragma once
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace pitwall {

inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

inline double clamp_pct(double x) {
  if (!std::isfinite(x)) return 0.0;
  return x < 0.0 ? 0.0 : (x > 100.0 ? 100.0 : x);
}

inline std::optional<double> mean(const std::vector<double>& v) {
  if (v.empty()) return std::nullopt;
  double sum = 0.0;
  for (double x : v) sum += x;
  return sum / static_cast<double>(v.size());
}

// Population standard deviation.
inline std::optional<double> stddev(const std::vector<double>& v) {
  const auto m = mean(v);
  if (!m) return std::nullopt;
  double acc = 0.0;
  for (double x : v) acc += (x - *m) * (x - *m);
  return std::sqrt(acc / static_cast<double>(v.size()));
}

inline std::optional<double> median(std::vector<double> v) {
  if (v.empty()) return std::nullopt;
  std::sort(v.begin(), v.end());
  const std::size_t n = v.size();
  return (n % 2 == 1) ? v[n / 2] : 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

} // namespace pitwall
