#include <rcr/track_presets.hpp>
#include <cmath>
#include <utility>
#include "csv_util.hpp"

namespace rcr {

namespace {

struct Builder {
  std::vector<TrackPoint> pts;
  void add(double x, double y, double z, double tilt = 0.0) {
    pts.push_back(TrackPoint{Vec3{x, y, z}, tilt});
  }
};

// Station, lift hill and first drop shared by the loop and helix layouts.
void add_lift_and_drop(Builder& b, double crest_y) {
  b.add(0.0, 2.0, 0.0);
  b.add(0.0, 2.0, 5.0 * kForwardSeparation);
  b.add(0.0, 0.30 * crest_y, 10.0 * kForwardSeparation);
  b.add(0.0, 0.65 * crest_y, 15.0 * kForwardSeparation);
  b.add(0.0, crest_y, 20.0 * kForwardSeparation);
  b.add(0.0, crest_y - 1.0, 24.0 * kForwardSeparation);
  b.add(0.0, 0.45 * crest_y, 29.0 * kForwardSeparation);
  b.add(0.0, 2.0, 34.0 * kForwardSeparation);
}

TrackLayout classic() {
  Builder b;
  b.add(  0.0,  2.0,   0.0);
  b.add(  0.0,  2.0,  10.0);
  b.add(  0.0,  6.0,  20.0);
  b.add(  0.0, 14.0,  30.0);
  b.add(  0.0, 22.0,  40.0);
  b.add(  0.0, 26.0,  48.0);
  b.add(  0.0, 24.0,  54.0);
  b.add(  0.0, 12.0,  62.0);
  b.add(  0.0,  4.0,  70.0);
  b.add(  6.0,  3.0,  80.0,  20.0);
  b.add( 16.0,  5.0,  84.0,  35.0);
  b.add( 26.0,  8.0,  80.0,  35.0);
  b.add( 32.0, 10.0,  70.0,  20.0);
  b.add( 32.0,  6.0,  55.0);
  b.add( 32.0, 12.0,  40.0);
  b.add( 32.0,  5.0,  25.0);
  b.add( 28.0,  3.0,  10.0, -25.0);
  b.add( 20.0,  2.5,   0.0, -35.0);
  b.add( 10.0,  2.0,  -8.0, -25.0);
  b.add(  2.0,  2.0,  -6.0, -10.0);
  return TrackLayout{"classic", "Classic", std::move(b.pts), true, true};
}

TrackLayout vertical_loop() {
  Builder b;
  add_lift_and_drop(b, 20.0);

  // Loop in the y-z plane, drifting sideways so entry and exit do not overlap.
  const double zc = 34.0 * kForwardSeparation + 3.0 * kLoopRadius;
  const double base_y = 2.0;
  for (int i = 0; i < kLoopPointsCount; ++i) {
    const double a = kTAU * double(i) / double(kLoopPointsCount);
    b.add(kExitSeparation * double(i) / double(kLoopPointsCount),
          base_y + kLoopRadius * (1.0 - std::cos(a)),
          zc + kLoopRadius * std::sin(a));
  }

  // Exit run and return leg back to the station.
  const double xr = kExitSeparation + 1.0;
  b.add(xr,        2.0, zc + 4.0 * kLoopRadius);
  b.add(xr + 8.0,  2.5, zc + 6.0 * kLoopRadius, 30.0);
  b.add(xr + 16.0, 3.0, zc + 4.0 * kLoopRadius, 30.0);
  b.add(xr + 18.0, 3.0, zc * 0.5);
  b.add(xr + 16.0, 2.5, -6.0, -30.0);
  b.add(xr + 6.0,  2.0, -10.0, -30.0);
  return TrackLayout{"loop", "Vertical Loop", std::move(b.pts), true, true};
}

TrackLayout helix() {
  Builder b;
  const double crest = 24.0;
  add_lift_and_drop(b, crest);

  // Two descending turns, banked into the curve.
  const double radius = 12.0;
  const double cx = radius;
  const double cz = 40.0 * kForwardSeparation;
  const int per_turn = 8;
  const int turns = 2;
  const double drop_per_turn = 4.0 * kHelixSeparation;
  double y = 18.0;
  for (int i = 0; i <= per_turn * turns; ++i) {
    const double a = kPI + kTAU * double(i) / double(per_turn);
    b.add(cx + radius * std::cos(a), y, cz + radius * std::sin(a), 30.0);
    y -= drop_per_turn / double(per_turn);
  }

  b.add(2.0 * radius + 4.0, 3.0, cz - 2.0 * radius, 10.0);
  b.add(2.0 * radius, 2.5, -4.0, -20.0);
  b.add(radius * 0.5, 2.0, -10.0, -20.0);
  return TrackLayout{"helix", "Helix", std::move(b.pts), true, true};
}

TrackLayout flat() {
  Builder b;
  const int n = 24;
  const double rx = 30.0, rz = 18.0;
  for (int i = 0; i < n; ++i) {
    const double a = kTAU * double(i) / double(n);
    b.add(rx * std::cos(a), 0.0, rz * std::sin(a));
  }
  return TrackLayout{"flat", "Flat Oval", std::move(b.pts), true, false};
}

} // namespace

TrackLayout make_preset(TrackPreset p) {
  switch (p) {
    case TrackPreset::Classic:      return classic();
    case TrackPreset::VerticalLoop: return vertical_loop();
    case TrackPreset::Helix:        return helix();
    case TrackPreset::Flat:         return flat();
    default:                        return classic();
  }
}

const char* preset_name(TrackPreset p) {
  switch (p) {
    case TrackPreset::Classic:      return "Classic";
    case TrackPreset::VerticalLoop: return "Vertical Loop";
    case TrackPreset::Helix:        return "Helix";
    case TrackPreset::Flat:         return "Flat Oval";
    default: return "Unknown";
  }
}

const char* preset_key(TrackPreset p) {
  switch (p) {
    case TrackPreset::Classic:      return "classic";
    case TrackPreset::VerticalLoop: return "loop";
    case TrackPreset::Helix:        return "helix";
    case TrackPreset::Flat:         return "flat";
    default: return "";
  }
}

std::optional<TrackPreset> preset_by_key(const std::string& key) {
  const std::string k = detail::lower(detail::trim(key));
  for (int i = 0; i < static_cast<int>(TrackPreset::Count); ++i) {
    const auto p = static_cast<TrackPreset>(i);
    if (k == preset_key(p)) return p;
  }
  return std::nullopt;
}

TrackPreset next_preset(TrackPreset p) {
  const int next = (static_cast<int>(p) + 1) % static_cast<int>(TrackPreset::Count);
  return static_cast<TrackPreset>(next);
}

TrackLayout custom_layout(std::vector<TrackPoint> points) {
  return TrackLayout{"custom", "Custom", std::move(points), true, true};
}

TrackLayout apply_ride_overrides(TrackLayout layout, const RideConfig& cfg) {
  if (cfg.looped.has_value()) layout.looped = *cfg.looped;
  if (cfg.chain_lift.has_value()) layout.chain_lift = *cfg.chain_lift;
  return layout;
}

} // namespace rcr
