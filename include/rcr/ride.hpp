#pragma once
#include <optional>
#include <vector>
#include <rcr/camera.hpp>
#include <rcr/config.hpp>
#include <rcr/speed.hpp>
#include <rcr/track_curve.hpp>

namespace rcr {

// Ride parameters owned by the caller and passed into every frame update.
struct RideState {
  double progress = 0.0;     // [0,1) looped, [0,1] open
  double speed_scale = 1.0;
  bool looped = true;
  bool chain_lift = true;
  bool riding = false;
};

enum class FrameStatus : int {
  Skipped  = 0,  // not riding, or no curve
  Advanced = 1,  // progress written back, pose updated
  Finished = 2,  // open track completed; riding cleared, progress and pose untouched
};

struct FrameResult {
  FrameStatus status = FrameStatus::Skipped;
  double dt = 0.0;            // effective (clamped) frame time
  double speed = 0.0;         // world units per second
  double progress = 0.0;      // progress after this frame
  RidePhase phase = RidePhase::Gravity;
  bool lap_completed = false;
  CameraPose pose{};          // smoothed camera pose
};

// Per-frame ride progression: speed integration plus camera orientation.
// Single-threaded; call update() once per rendered frame.
class RideEngine {
public:
  RideEngine() = default;
  explicit RideEngine(const RideConfig& cfg) : cfg_(cfg) {}

  void set_config(const RideConfig& cfg) { cfg_ = cfg; }
  const RideConfig& config() const { return cfg_; }

  // Replaces the control points and rebuilds the curve and peak cache.
  void set_track(std::vector<TrackPoint> points, bool looped);

  // Idle -> Riding. Returns false and leaves state untouched if there is no curve to ride.
  bool start_ride(RideState& state);
  // External stop; Riding -> Idle.
  void stop_ride(RideState& state);

  FrameResult update(RideState& state, double dt);

  bool has_curve() const { return curve_.has_value(); }
  const std::optional<TrackCurve>& curve() const { return curve_; }
  const std::vector<TrackPoint>& points() const { return points_; }
  double first_peak() const { return first_peak_; }
  double max_height() const { return max_height_; }
  const CameraPose& pose() const { return smoother_.pose; }

private:
  void rebuild_(bool looped);
  double clamp_dt_(double dt) const;

  RideConfig cfg_{};
  std::vector<TrackPoint> points_;
  std::optional<TrackCurve> curve_{};
  bool looped_{true};
  double first_peak_{0.0};   // recomputed only on track / loop change
  double max_height_{0.0};
  PoseSmoother smoother_{};
};

} // namespace rcr
