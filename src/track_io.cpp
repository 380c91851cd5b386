#include <rcr/track_io.hpp>
#include <cmath>
#include <fstream>
#include "csv_util.hpp"

namespace rcr {

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return false;
  return detail::lower(cols[0]) == "x";
}

static std::optional<TrackPoint> parse_point_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  const auto x = detail::to_double(cols[0]);
  const auto y = detail::to_double(cols[1]);
  const auto z = detail::to_double(cols[2]);
  if (!x || !y || !z) return std::nullopt;
  if (!std::isfinite(*x) || !std::isfinite(*y) || !std::isfinite(*z)) return std::nullopt;

  TrackPoint p{};
  p.position = Vec3{*x, *y, *z};
  if (cols.size() >= 4 && !cols[3].empty()) {
    const auto tilt = detail::to_double(cols[3]);
    if (!tilt || !std::isfinite(*tilt)) return std::nullopt;
    p.tilt_deg = *tilt;
  }
  return p;
}

std::vector<TrackPoint> track_points_from_csv_stream(std::istream& in) {
  std::vector<TrackPoint> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = detail::trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = detail::split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto p = parse_point_row(cols); p.has_value()) {
      out.push_back(*p);
    }
  }
  return out;
}

std::optional<std::vector<TrackPoint>> load_track_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return track_points_from_csv_stream(f);
}

} // namespace rcr
