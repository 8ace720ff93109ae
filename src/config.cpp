#include <pitwall/config.hpp>
#include <pitwall/log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>
#include "csv.hpp"

namespace pitwall {

static constexpr const char* kTag = "config";

static bool finite_pos(double v) { return std::isfinite(v) && v > 0.0; }

template <class T>
static void read(const YAML::Node& node, const char* key, T& out) {
  if (!node) return;
  if (const YAML::Node v = node[key]) out = v.as<T>();
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static void read_race(const YAML::Node& n, RaceLength& race) {
  if (!n) return;
  if (const YAML::Node m = n["mode"]) {
    const auto mode = lower(m.as<std::string>());
    if (mode == "laps") race.mode = RaceMode::Laps;
    else if (mode == "time") race.mode = RaceMode::Time;
    else throw YAML::Exception(m.Mark(), "race.mode must be 'laps' or 'time'");
  }
  read(n, "laps", race.laps);
  read(n, "seconds", race.seconds);
}

static SessionConfig parse_root(const YAML::Node& root) {
  SessionConfig cfg;
  read_race(root["race"], cfg.race);
  read(root, "tank_capacity_l", cfg.tank_capacity_l);
  read(root, "avg_pit_time_s", cfg.avg_pit_time_s);
  read(root, "refuel_threshold_l", cfg.refuel_threshold_l);

  // A car class seeds the tire window; explicit tire_window keys override it.
  if (const YAML::Node cc = root["car_class"]) {
    const auto key = cc.as<std::string>();
    if (auto cls = car_class_by_key(key)) {
      apply_car_class(cfg, *cls);
    } else {
      PITWALL_LOGW(kTag, "unknown car_class '%s', keeping default tire window", key.c_str());
    }
  }
  if (const YAML::Node tw = root["tire_window"]) {
    read(tw, "optimal_min", cfg.tire_window.optimal_min);
    read(tw, "optimal_max", cfg.tire_window.optimal_max);
    read(tw, "overheat", cfg.tire_window.overheat);
  }
  if (const YAML::Node h = root["history"]) {
    read(h, "max_samples", cfg.max_samples);
    read(h, "max_span_ms", cfg.max_span_ms);
  }
  if (const YAML::Node f = root["fuel"]) {
    read(f, "window_laps", cfg.fuel.window_laps);
    read(f, "min_laps", cfg.fuel.min_laps);
    read(f, "fuel_add_margin", cfg.fuel.fuel_add_margin);
  }
  if (const YAML::Node t = root["tires"]) {
    read(t, "temp_window_ms", cfg.tires.temp_window_ms);
    read(t, "base_rate_pct", cfg.tires.base_rate_pct);
    read(t, "temp_scale", cfg.tires.temp_scale);
    read(t, "age_factor", cfg.tires.age_factor);
    read(t, "change_wear_drop", cfg.tires.change_wear_drop);
    read(t, "initial_tire_age_laps", cfg.tires.initial_tire_age_laps);
    read(t, "usable_wear", cfg.tires.usable_wear);
    read(t, "rising_factor", cfg.tires.rising_factor);
    read(t, "trend_delta_c", cfg.tires.trend_delta_c);
  }
  if (const YAML::Node d = root["driver"]) {
    read(d, "min_samples", cfg.driver.min_samples);
    read(d, "smoothness_scale", cfg.driver.smoothness_scale);
    read(d, "aggression_input_scale", cfg.driver.aggression_input_scale);
    read(d, "g_reference", cfg.driver.g_reference);
    read(d, "aggression_g_weight", cfg.driver.aggression_g_weight);
    read(d, "tire_mgmt_scale", cfg.driver.tire_mgmt_scale);
    if (const YAML::Node w = d["weights"]) {
      read(w, "consistency", cfg.driver.weights.consistency);
      read(w, "smoothness", cfg.driver.weights.smoothness);
      read(w, "precision", cfg.driver.weights.precision);
      read(w, "fuel_efficiency", cfg.driver.weights.fuel_efficiency);
      read(w, "tire_management", cfg.driver.weights.tire_management);
    }
  }
  if (const YAML::Node s = root["strategy"]) {
    read(s, "undercut_margin_s", cfg.strategy.undercut_margin_s);
    read(s, "undercut_min_tire_age", cfg.strategy.undercut_min_tire_age);
    read(s, "pace_advantage_s", cfg.strategy.pace_advantage_s);
    read(s, "overcut_min_laps", cfg.strategy.overcut_min_laps);
    read(s, "fuel_buffer_laps", cfg.strategy.fuel_buffer_laps);
    read(s, "window_before", cfg.strategy.window_before);
    read(s, "window_after", cfg.strategy.window_after);
  }
  return cfg;
}

static std::optional<SessionConfig> finish(SessionConfig cfg) {
  const auto problems = validate(cfg);
  if (!problems.empty()) {
    PITWALL_LOGE(kTag, "invalid session config: %s", problems.front().c_str());
    return std::nullopt;
  }
  return cfg;
}

std::vector<std::string> validate(const SessionConfig& cfg) {
  std::vector<std::string> out;
  if (cfg.race.mode == RaceMode::Laps && cfg.race.laps <= 0)
    out.emplace_back("race.laps must be > 0");
  if (cfg.race.mode == RaceMode::Time && !finite_pos(cfg.race.seconds))
    out.emplace_back("race.seconds must be > 0");
  if (!finite_pos(cfg.tank_capacity_l))
    out.emplace_back("tank_capacity_l must be > 0");
  if (!std::isfinite(cfg.avg_pit_time_s) || cfg.avg_pit_time_s < 0.0)
    out.emplace_back("avg_pit_time_s must be >= 0");
  if (!finite_pos(cfg.refuel_threshold_l))
    out.emplace_back("refuel_threshold_l must be > 0");

  const auto& tw = cfg.tire_window;
  if (!std::isfinite(tw.optimal_min) || !std::isfinite(tw.optimal_max) || !std::isfinite(tw.overheat))
    out.emplace_back("tire_window values must be finite");
  else if (tw.optimal_min > tw.optimal_max)
    out.emplace_back("tire_window.optimal_min must be <= optimal_max");
  else if (tw.overheat < tw.optimal_max)
    out.emplace_back("tire_window.overheat must be >= optimal_max");

  if (cfg.max_samples == 0) out.emplace_back("history.max_samples must be > 0");
  if (cfg.max_span_ms < 0) out.emplace_back("history.max_span_ms must be >= 0");

  if (cfg.fuel.min_laps < 1) out.emplace_back("fuel.min_laps must be >= 1");
  if (cfg.fuel.window_laps < cfg.fuel.min_laps)
    out.emplace_back("fuel.window_laps must be >= fuel.min_laps");
  if (cfg.fuel.fuel_add_margin < 0.0) out.emplace_back("fuel.fuel_add_margin must be >= 0");

  if (cfg.tires.temp_window_ms <= 0) out.emplace_back("tires.temp_window_ms must be > 0");
  if (cfg.tires.base_rate_pct < 0.0) out.emplace_back("tires.base_rate_pct must be >= 0");
  if (!finite_pos(cfg.tires.temp_scale)) out.emplace_back("tires.temp_scale must be > 0");
  if (cfg.tires.age_factor < 0.0) out.emplace_back("tires.age_factor must be >= 0");
  if (!finite_pos(cfg.tires.change_wear_drop)) out.emplace_back("tires.change_wear_drop must be > 0");
  if (cfg.tires.initial_tire_age_laps < 0) out.emplace_back("tires.initial_tire_age_laps must be >= 0");

  const auto& w = cfg.driver.weights;
  const double ws[] = {w.consistency, w.smoothness, w.precision, w.fuel_efficiency, w.tire_management};
  double wsum = 0.0;
  bool wneg = false;
  for (double x : ws) {
    if (!std::isfinite(x) || x < 0.0) wneg = true;
    else wsum += x;
  }
  if (wneg) out.emplace_back("driver.weights must be finite and >= 0");
  else if (wsum <= 0.0) out.emplace_back("driver.weights must not all be zero");
  if (!finite_pos(cfg.driver.g_reference)) out.emplace_back("driver.g_reference must be > 0");
  if (cfg.driver.aggression_g_weight < 0.0 || cfg.driver.aggression_g_weight > 1.0)
    out.emplace_back("driver.aggression_g_weight must be in [0,1]");

  if (cfg.strategy.fuel_buffer_laps < 0) out.emplace_back("strategy.fuel_buffer_laps must be >= 0");
  if (cfg.strategy.window_before < 0 || cfg.strategy.window_after < 0)
    out.emplace_back("strategy window margins must be >= 0");
  return out;
}

void ensure_history_covers(SessionConfig& cfg, double lap_time_s, double sample_hz) {
  if (!finite_pos(lap_time_s) || !finite_pos(sample_hz)) return;
  // Pit stops and slow laps stretch a lap; leave a quarter on top.
  const double span_s = (cfg.fuel.window_laps + 2) * lap_time_s * 1.25;
  const auto samples = static_cast<std::size_t>(std::ceil(span_s * sample_hz));
  cfg.max_samples = std::max(cfg.max_samples, samples);
  if (cfg.max_span_ms > 0) {
    cfg.max_span_ms = std::max(cfg.max_span_ms, static_cast<std::int64_t>(std::ceil(span_s * 1000.0)));
  }
}

std::optional<SessionConfig> session_config_from_yaml(const std::string& text) {
  try {
    const YAML::Node root = YAML::Load(text);
    if (root.IsNull()) return finish(SessionConfig{});
    if (!root.IsMap()) {
      PITWALL_LOGE(kTag, "session config must be a YAML mapping");
      return std::nullopt;
    }
    return finish(parse_root(root));
  } catch (const YAML::Exception& e) {
    PITWALL_LOGE(kTag, "yaml error: %s", e.what());
    return std::nullopt;
  }
}

std::optional<SessionConfig> load_session_config_yaml(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    PITWALL_LOGE(kTag, "cannot open %s", path.c_str());
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return session_config_from_yaml(ss.str());
}

// ---- Car class catalog ----

static std::optional<CarClass> parse_car_class_row(const std::vector<std::string>& cols) {
  if (cols.size() < 5) return std::nullopt;
  if (cols[0].empty()) return std::nullopt;
  double lo, hi, hot, base;
  if (!(csv::to_double(cols[1], lo) && csv::to_double(cols[2], hi) &&
        csv::to_double(cols[3], hot) && csv::to_double(cols[4], base))) return std::nullopt;
  if (lo > hi || hot < hi || base < 0.0) return std::nullopt;
  return CarClass{cols[0], lo, hi, hot, base};
}

const std::vector<CarClass>& car_class_catalog() {
  static const std::vector<CarClass> cat = {
    {"GT3",  85.0,  95.0, 105.0, 0.5},
    {"LMP2", 80.0,  95.0, 108.0, 0.6},
    {"F1",   95.0, 110.0, 120.0, 0.8},
  };
  return cat;
}

std::optional<CarClass> car_class_by_key(const std::string& key) {
  return car_class_by_key_in(car_class_catalog(), key);
}

std::optional<CarClass> car_class_by_key_in(const std::vector<CarClass>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const CarClass& c){ return c.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<CarClass> car_class_catalog_from_csv_stream(std::istream& in) {
  std::vector<CarClass> out;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = csv::split_line(raw);
    if (!header_consumed && (cols[0] == "key" || cols[0] == "Key")) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse_car_class_row(cols)) out.push_back(*row);
  }
  return out;
}

std::optional<std::vector<CarClass>> load_car_class_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return car_class_catalog_from_csv_stream(f);
}

} // namespace pitwall
