#include <rcr/config.hpp>
#include <fstream>
#include "csv_util.hpp"

namespace rcr {

namespace {

std::optional<SmoothingMode> to_smoothing(const std::string& s) {
  const std::string v = detail::lower(s);
  if (v == "per_frame" || v == "perframe" || v == "fixed") return SmoothingMode::PerFrame;
  if (v == "time_scaled" || v == "timescaled" || v == "exp") return SmoothingMode::TimeScaled;
  return std::nullopt;
}

// Applies one key/value pair; false if the key is unknown or the value invalid.
bool apply_entry(RideConfig& cfg, const std::string& key, const std::string& value) {
  auto set_double = [&](double& dst, double min_v) {
    auto v = detail::to_double(value);
    if (!v || *v < min_v) return false;
    dst = *v;
    return true;
  };
  auto set_bool = [&](bool& dst) {
    auto v = detail::to_bool(value);
    if (!v) return false;
    dst = *v;
    return true;
  };
  auto set_override = [&](std::optional<bool>& dst) {
    auto v = detail::to_bool(value);
    if (!v) return false;
    dst = *v;
    return true;
  };

  if (key == "track") {
    if (value.empty()) return false;
    cfg.track = detail::lower(value);
    return true;
  }
  if (key == "speed_scale")           return set_double(cfg.speed_scale, 0.0);
  if (key == "looped")                return set_override(cfg.looped);
  if (key == "chain_lift")            return set_override(cfg.chain_lift);
  if (key == "camera_height")         return set_double(cfg.camera_height, 0.0);
  if (key == "look_ahead")            return set_double(cfg.look_ahead, 0.0);
  if (key == "look_at_height_ratio")  return set_double(cfg.look_at_height_ratio, 0.0);
  if (key == "smoothing_rate")        return set_double(cfg.smoothing_rate, 0.0);
  if (key == "reset_energy_each_lap") return set_bool(cfg.reset_energy_each_lap);
  if (key == "max_frame_dt") {
    // Negative values are allowed and mean "no clamp".
    auto v = detail::to_double(value);
    if (!v) return false;
    cfg.max_frame_dt = *v;
    return true;
  }
  if (key == "smoothing") {
    auto m = to_smoothing(value);
    if (!m) return false;
    cfg.smoothing = *m;
    return true;
  }
  return false;
}

} // namespace

RideConfig ride_config_from_stream(std::istream& in,
                                   const RideConfig& base,
                                   std::vector<std::string>* warnings) {
  RideConfig cfg = base;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = detail::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = detail::split_csv_line(raw);
    const std::string key = detail::lower(cols[0]);
    if (key == "key") continue; // header row

    const std::string value = cols.size() > 1 ? cols[1] : std::string{};
    if (cols.size() < 2 || !apply_entry(cfg, key, value)) {
      if (warnings) {
        warnings->push_back("line " + std::to_string(line_no) + ": ignored '" + raw + "'");
      }
    }
  }
  return cfg;
}

std::optional<RideConfig> load_ride_config(const std::string& path,
                                           const RideConfig& base,
                                           std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return ride_config_from_stream(f, base, warnings);
}

} // namespace rcr
