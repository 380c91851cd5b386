#include <rcr/ride.hpp>
#include <algorithm>
#include <utility>
#include <rcr/peak.hpp>

namespace rcr {

void RideEngine::set_track(std::vector<TrackPoint> points, bool looped) {
  points_ = std::move(points);
  rebuild_(looped);
}

void RideEngine::rebuild_(bool looped) {
  looped_ = looped;
  curve_ = make_track_curve(points_, looped_);
  first_peak_ = find_first_peak(curve_);
}

double RideEngine::clamp_dt_(double dt) const {
  if (dt <= 0.0) return 0.0;
  if (cfg_.max_frame_dt > 0.0) return std::min(dt, cfg_.max_frame_dt);
  return dt;
}

bool RideEngine::start_ride(RideState& state) {
  if (state.looped != looped_) rebuild_(state.looped);
  if (!curve_) return false;
  state.riding = true;
  state.progress = 0.0;

  max_height_ = curve_->point_at(0.0).y;
  const double tilt = tilt_at(points_, 0.0, looped_);
  smoother_.snap(target_pose(*curve_, 0.0, tilt, cfg_.camera_params()));
  return true;
}

void RideEngine::stop_ride(RideState& state) {
  state.riding = false;
}

FrameResult RideEngine::update(RideState& state, double dt) {
  FrameResult r{};
  r.progress = state.progress;
  r.pose = smoother_.pose;

  if (state.looped != looped_) rebuild_(state.looped);
  if (!state.riding || !curve_) return r;

  r.dt = clamp_dt_(dt);

  SpeedInput in{};
  in.progress = state.progress;
  in.dt = r.dt;
  in.speed_scale = state.speed_scale;
  in.first_peak = first_peak_;
  in.max_height = max_height_;
  in.looped = state.looped;
  in.chain_lift = state.chain_lift;
  in.reset_energy_each_lap = cfg_.reset_energy_each_lap;

  const SpeedStep step = integrate_speed(*curve_, in);
  max_height_ = step.max_height;
  r.speed = step.speed;
  r.phase = step.phase;

  if (step.finished) {
    state.riding = false;
    r.status = FrameStatus::Finished;
    return r;
  }

  state.progress = step.new_progress;
  r.progress = state.progress;
  r.lap_completed = step.wrapped;

  const double tilt = tilt_at(points_, state.progress, state.looped);
  const CameraPose target = target_pose(*curve_, state.progress, tilt, cfg_.camera_params());
  const double factor = smoothing_factor(cfg_.smoothing, r.dt, cfg_.smoothing_rate);
  r.pose = smoother_.blend(target, factor);
  r.status = FrameStatus::Advanced;
  return r;
}

} // namespace rcr
