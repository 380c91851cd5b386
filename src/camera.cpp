#include <rcr/camera.hpp>
#include <algorithm>
#include <cmath>

namespace rcr {

const char* smoothing_name(SmoothingMode m) {
  switch (m) {
    case SmoothingMode::PerFrame:   return "Per-frame";
    case SmoothingMode::TimeScaled: return "Time-scaled";
    default: return "Unknown";
  }
}

FrameBasis build_frame_basis(const Vec3& tangent, double tilt_deg) {
  FrameBasis b{};
  b.tangent = normalize(tangent);

  Vec3 right = cross(b.tangent, kWorldUp);
  // Vertical track: tangent parallel to world up leaves no usable right vector.
  if (length_sq(right) < kDegenerateRightSq) right = kFallbackRight;
  b.right = normalize(right);

  b.base_up = normalize(cross(b.right, b.tangent));
  b.up = rotate_about_axis(b.base_up, b.tangent, deg_to_rad(tilt_deg));
  return b;
}

double look_ahead_param(double t, bool looped, double look_ahead) {
  const double ahead = t + look_ahead;
  if (looped) return std::fmod(ahead, 1.0);
  return std::min(ahead, kOpenLookAheadMax);
}

CameraPose target_pose(const TrackCurve& curve, double t, double tilt_deg,
                       const CameraParams& params) {
  const Vec3 position = curve.point_at(t);
  const FrameBasis basis = build_frame_basis(curve.tangent_at(t), tilt_deg);

  CameraPose pose{};
  pose.position = position + basis.up * params.height;

  const double ahead_t = look_ahead_param(t, curve.looped(), params.look_ahead);
  pose.look_at = curve.point_at(ahead_t) + basis.up * (params.height * params.look_at_height_ratio);
  return pose;
}

double smoothing_factor(SmoothingMode mode, double dt, double rate) {
  switch (mode) {
    case SmoothingMode::TimeScaled:
      if (dt <= 0.0 || rate <= 0.0) return 0.0;
      return 1.0 - std::exp(-rate * dt);
    case SmoothingMode::PerFrame:
    default:
      return kPerFrameBlend;
  }
}

} // namespace rcr
