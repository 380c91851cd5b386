#include <rcr/speed.hpp>
#include <algorithm>
#include <cmath>

namespace rcr {

const char* phase_name(RidePhase p) {
  switch (p) {
    case RidePhase::ChainLift: return "Chain lift";
    case RidePhase::Gravity:   return "Gravity";
    default: return "Unknown";
  }
}

double energy_speed(double height_drop) {
  return std::sqrt(2.0 * kGravity * std::max(0.0, height_drop));
}

SpeedStep integrate_speed(const TrackCurve& curve, const SpeedInput& in) {
  SpeedStep out{};
  out.new_progress = in.progress;
  out.max_height = in.max_height;
  if (curve.empty()) return out;

  const double current_height = curve.point_at(in.progress).y;

  if (in.chain_lift && in.progress < in.first_peak) {
    out.phase = RidePhase::ChainLift;
    out.speed = kChainLiftRate * in.speed_scale;
    out.max_height = std::max(out.max_height, current_height);
  } else {
    out.phase = RidePhase::Gravity;
    out.max_height = std::max(out.max_height, current_height);
    const double drop = out.max_height - current_height;
    out.speed = std::max(kMinRideSpeed, energy_speed(drop)) * in.speed_scale;
  }

  const double len = curve.arc_length();
  const double delta = (len > 0.0) ? (out.speed * in.dt) / len : 0.0;
  double next = in.progress + delta;

  if (next >= 1.0) {
    if (!in.looped) {
      out.finished = true;
      return out;
    }
    next = std::fmod(next, 1.0);
    out.wrapped = true;
    if (in.chain_lift || in.reset_energy_each_lap) {
      out.max_height = curve.point_at(0.0).y;
    }
  }

  out.new_progress = next;
  return out;
}

} // namespace rcr
