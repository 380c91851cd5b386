#pragma once
#include <rcr/track_curve.hpp>

namespace rcr {

inline constexpr double kGravity       = 9.8;  // m/s^2, unit mass
inline constexpr double kChainLiftRate = 0.9;  // world units per second before scale
inline constexpr double kMinRideSpeed  = 1.0;  // gravity-phase floor before scale

enum class RidePhase : int {
  ChainLift = 0,
  Gravity   = 1,
};

const char* phase_name(RidePhase p);

struct SpeedInput {
  double progress = 0.0;       // current t
  double dt = 0.0;             // frame time (s)
  double speed_scale = 1.0;    // designer multiplier
  double first_peak = 0.0;     // chain lift disengages at this t
  double max_height = 0.0;     // energy tracker
  bool looped = false;
  bool chain_lift = false;
  bool reset_energy_each_lap = false;  // also reset max_height on wrap without chain lift
};

struct SpeedStep {
  double new_progress = 0.0;
  double max_height = 0.0;
  double speed = 0.0;          // world units per second, after scale
  RidePhase phase = RidePhase::Gravity;
  bool wrapped = false;        // looped track crossed t=1 this step
  bool finished = false;       // open track reached the end; new_progress == input progress
};

// v = sqrt(2 g dh); negative drops count as zero.
double energy_speed(double height_drop);

// Advance progress by one frame using chain-lift rate or energy conservation.
SpeedStep integrate_speed(const TrackCurve& curve, const SpeedInput& in);

} // namespace rcr
