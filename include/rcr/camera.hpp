#pragma once
#include <rcr/vec3.hpp>
#include <rcr/track_curve.hpp>

namespace rcr {

inline constexpr Vec3   kWorldUp              {0.0, 1.0, 0.0};
inline constexpr Vec3   kFallbackRight        {1.0, 0.0, 0.0};
inline constexpr double kDegenerateRightSq    = 0.001;
inline constexpr double kCameraHeight         = 1.5;
inline constexpr double kLookAhead            = 0.03;
inline constexpr double kLookAtHeightRatio    = 0.8;
inline constexpr double kOpenLookAheadMax     = 0.999;
inline constexpr double kPerFrameBlend        = 0.25;
// Decay rate (1/s) for which time-scaled smoothing equals kPerFrameBlend at 60 Hz.
inline constexpr double kDefaultSmoothingRate = 17.26;

// Orthonormal ride frame. right/base_up are built against world up (no
// parallel transport, so no roll drift); up is base_up banked around tangent.
struct FrameBasis {
  Vec3 tangent{};
  Vec3 right{};
  Vec3 base_up{};
  Vec3 up{};
};

struct CameraPose {
  Vec3 position{};
  Vec3 look_at{};
};

struct CameraParams {
  double height = kCameraHeight;
  double look_ahead = kLookAhead;
  double look_at_height_ratio = kLookAtHeightRatio;
};

enum class SmoothingMode : int {
  PerFrame   = 0,  // fixed blend each frame (frame-rate dependent)
  TimeScaled = 1,  // 1 - exp(-rate * dt)
};

const char* smoothing_name(SmoothingMode m);

FrameBasis build_frame_basis(const Vec3& tangent, double tilt_deg);

// t + look_ahead, wrapped when looped, else clamped below the curve end.
double look_ahead_param(double t, bool looped, double look_ahead = kLookAhead);

// Unsmoothed camera pose for progress t.
CameraPose target_pose(const TrackCurve& curve, double t, double tilt_deg,
                       const CameraParams& params = {});

double smoothing_factor(SmoothingMode mode, double dt, double rate = kDefaultSmoothingRate);

// Last emitted camera pose, blended toward each new target.
struct PoseSmoother {
  CameraPose pose{};

  void snap(const CameraPose& target) { pose = target; }
  const CameraPose& blend(const CameraPose& target, double factor) {
    pose.position = lerp(pose.position, target.position, factor);
    pose.look_at  = lerp(pose.look_at,  target.look_at,  factor);
    return pose;
  }
};

} // namespace rcr
