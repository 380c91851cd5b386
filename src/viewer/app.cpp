#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <rcr/viewer/app.hpp>
#include <rcr/camera.hpp>

namespace rcr {

namespace {

constexpr int kSamplesPerPoint = 15;   // curve samples drawn per control point
constexpr int kTieInterval     = 3;    // draw a tie every N samples
constexpr int kSupportInterval = 9;    // draw a support every N samples
constexpr double kSpeedStep    = 0.25;

Vector3 toRay(const Vec3& v) {
  return Vector3{ float(v.x), float(v.y), float(v.z) };
}

// Time formatting helper
void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

std::string timestamp_yyyyMMdd_HHmmss_() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const RideConfig& cfg, std::optional<std::vector<TrackPoint>> custom_track)
  : cfg_(cfg), custom_track_(std::move(custom_track)), engine_(cfg) {
  if (auto p = preset_by_key(cfg_.track); p.has_value()) {
    preset_ = *p;
  } else {
    TraceLog(LOG_WARNING, "RCR: unknown track preset '%s', using %s",
             cfg_.track.c_str(), preset_name(preset_));
  }
  state_.speed_scale = cfg_.speed_scale;
}

std::string ViewerApp::track_label_() const {
  return custom_track_.has_value() ? std::string("custom") : std::string(preset_name(preset_));
}

void ViewerApp::load_layout_() {
  TrackLayout layout = custom_track_.has_value() ? custom_layout(*custom_track_)
                                                 : make_preset(preset_);
  // Config flags pick the initial topology; later preset switches use the layout defaults.
  if (!overrides_applied_) {
    layout = apply_ride_overrides(std::move(layout), cfg_);
    overrides_applied_ = true;
  }
  state_.looped = layout.looped;
  state_.chain_lift = layout.chain_lift;

  engine_.stop_ride(state_);
  engine_.set_track(std::move(layout.points), state_.looped);
  telem_.reset();
  last_frame_ = FrameResult{};
  saved_summary_path_.clear();

  resample_();
  if (const auto& curve = engine_.curve(); curve.has_value()) {
    TraceLog(LOG_INFO, "RCR: track '%s' loaded (%d points, length %.1f, first peak t=%.2f)",
             track_label_().c_str(), int(engine_.points().size()),
             curve->arc_length(), engine_.first_peak());
  } else {
    TraceLog(LOG_WARNING, "RCR: track '%s' has fewer than 2 points; nothing to ride",
             track_label_().c_str());
  }
}

void ViewerApp::resample_() {
  samples_.clear();
  const auto& curve = engine_.curve();
  if (!curve.has_value()) return;
  const int n = int(curve->control_count()) * kSamplesPerPoint;
  samples_.reserve(std::size_t(n) + 1);
  for (int i = 0; i <= n; ++i) samples_.push_back(curve->point_at(double(i) / double(n)));
}

void ViewerApp::start_ride_() {
  telem_.reset();
  saved_summary_path_.clear();
  if (!engine_.start_ride(state_)) {
    TraceLog(LOG_WARNING, "RCR: ride requested without a track curve");
    return;
  }
  TraceLog(LOG_INFO, "RCR: ride started (looped=%d chain_lift=%d speed=%.2f)",
           int(state_.looped), int(state_.chain_lift), state_.speed_scale);
}

void ViewerApp::finish_ride_() {
  const RideSummary s = telem_.summary(track_label_());
  const std::string path = "ride_summary_" + timestamp_yyyyMMdd_HHmmss_() + ".csv";
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    TraceLog(LOG_WARNING, "RCR: could not write ride summary to %s", path.c_str());
    return;
  }
  write_ride_summary_csv(f, s);
  saved_summary_path_ = path;
  TraceLog(LOG_INFO, "RCR: ride finished in %.2fs, top speed %.1f (saved %s)",
           s.ride_time, s.top_speed, path.c_str());
}

int ViewerApp::run() {
  const int W = 1280, H = 720;
  InitWindow(W, H, "RCR - Ride Viewer");
  SetTargetFPS(144);

  load_layout_();

  while (!WindowShouldClose()) {
    process_input_();
    step_ride_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_ENTER)) start_ride_();
  if (IsKeyPressed(KEY_BACKSPACE) && state_.riding) {
    engine_.stop_ride(state_);
    TraceLog(LOG_INFO, "RCR: ride stopped at t=%.3f", state_.progress);
  }

  // Track / topology changes
  if (IsKeyPressed(KEY_T)) {
    custom_track_.reset();
    preset_ = next_preset(preset_);
    load_layout_();
  }
  if (IsKeyPressed(KEY_L)) {
    state_.looped = !state_.looped;
    engine_.set_track(engine_.points(), state_.looped);
    resample_();
    TraceLog(LOG_INFO, "RCR: looped=%d", int(state_.looped));
  }
  if (IsKeyPressed(KEY_C)) state_.chain_lift = !state_.chain_lift;

  // Ride tuning
  if (IsKeyPressed(KEY_LEFT_BRACKET))  state_.speed_scale = std::max(kSpeedStep, state_.speed_scale - kSpeedStep);
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) state_.speed_scale += kSpeedStep;
  if (IsKeyPressed(KEY_M)) {
    RideConfig cfg = engine_.config();
    cfg.smoothing = (cfg.smoothing == SmoothingMode::PerFrame) ? SmoothingMode::TimeScaled
                                                                : SmoothingMode::PerFrame;
    engine_.set_config(cfg);
  }
  if (IsKeyPressed(KEY_O)) orbit_view_ = !orbit_view_;
}

void ViewerApp::step_ride_(double dt) {
  const FrameResult r = engine_.update(state_, dt);
  if (r.status == FrameStatus::Skipped) return;
  last_frame_ = r;
  telem_.update(r);
  if (r.status == FrameStatus::Finished) finish_ride_();
}

void ViewerApp::render_frame_() {
  Camera3D cam{};
  cam.up = Vector3{0.0f, 1.0f, 0.0f};
  cam.fovy = 75.0f;
  cam.projection = CAMERA_PERSPECTIVE;

  if (state_.riding && !orbit_view_) {
    const CameraPose& pose = engine_.pose();
    cam.position = toRay(pose.position);
    cam.target = toRay(pose.look_at);
  } else {
    // Slow orbit around the track centre.
    Vec3 lo{1e9, 1e9, 1e9}, hi{-1e9, -1e9, -1e9};
    for (const auto& p : samples_) {
      lo = Vec3{std::min(lo.x, p.x), std::min(lo.y, p.y), std::min(lo.z, p.z)};
      hi = Vec3{std::max(hi.x, p.x), std::max(hi.y, p.y), std::max(hi.z, p.z)};
    }
    const Vec3 centre = samples_.empty() ? Vec3{} : (lo + hi) * 0.5;
    const double radius = samples_.empty() ? 40.0 : std::max(20.0, distance(lo, hi));
    const double a = GetTime() * 0.1;
    cam.position = toRay(centre + Vec3{radius * std::cos(a), radius * 0.6, radius * std::sin(a)});
    cam.target = toRay(centre);
    cam.fovy = 55.0f;
  }

  BeginDrawing();
  ClearBackground(Color{135, 190, 235, 255});
  BeginMode3D(cam);
  DrawPlane(Vector3{0.0f, 0.0f, 0.0f}, Vector2{400.0f, 400.0f}, Color{70, 120, 60, 255});
  draw_track_();
  EndMode3D();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_track_() {
  const auto& curve = engine_.curve();
  if (!curve.has_value() || samples_.size() < 2) return;

  const int n = int(samples_.size()) - 1;
  std::vector<Vec3> left, right;
  left.reserve(samples_.size());
  right.reserve(samples_.size());
  for (int i = 0; i <= n; ++i) {
    const double t = double(i) / double(n);
    const double tilt = tilt_at(engine_.points(), t, curve->looped());
    const FrameBasis b = build_frame_basis(curve->tangent_at(t), tilt);
    const Vec3 side = rotate_about_axis(b.right, b.tangent, deg_to_rad(tilt));
    left.push_back(samples_[i] - side * kRailOffset);
    right.push_back(samples_[i] + side * kRailOffset);

    if (i % kTieInterval == 0) {
      DrawLine3D(toRay(samples_[i] - side * (kTieWidth * 0.5)),
                 toRay(samples_[i] + side * (kTieWidth * 0.5)), Color{110, 80, 50, 255});
    }
    if (i % kSupportInterval == 0 && samples_[i].y > kScale) {
      DrawLine3D(toRay(samples_[i]), toRay(Vec3{samples_[i].x, 0.0, samples_[i].z}),
                 Color{200, 200, 205, 255});
    }
  }

  for (int i = 1; i <= n; ++i) {
    DrawLine3D(toRay(left[i-1]),  toRay(left[i]),  Color{220, 40, 40, 255});
    DrawLine3D(toRay(right[i-1]), toRay(right[i]), Color{220, 40, 40, 255});
  }

  // Station marker at t=0
  DrawCube(toRay(samples_.front()), 0.6f, 0.2f, 0.6f, Color{240, 240, 240, 255});
}

void ViewerApp::draw_hud_() {
  char last[32], best[32], ride[32];
  fmt_time(telem_.last_lap(), last, sizeof(last));
  fmt_time(telem_.best_lap(), best, sizeof(best));
  fmt_time(telem_.ride_time(), ride, sizeof(ride));

  DrawRectangle(12, 12, 640, 96, Color{0, 0, 0, 120});
  DrawText(TextFormat("track=%s  %s  t=%.3f  speed=%.1f (top %.1f)  x%.2f",
                      track_label_().c_str(),
                      state_.riding ? "RIDING" : "IDLE",
                      state_.progress,
                      telem_.speed(),
                      telem_.top_speed(),
                      state_.speed_scale),
           20, 20, 20, Color{235, 235, 240, 255});

  DrawText(TextFormat("phase=%s  laps=%llu  ride=%s  last=%s  best=%s  loop=%s  lift=%s  smooth=%s",
                      phase_name(last_frame_.phase),
                      (unsigned long long)telem_.laps(),
                      ride, last, best,
                      state_.looped ? "on" : "off",
                      state_.chain_lift ? "on" : "off",
                      smoothing_name(engine_.config().smoothing)),
           20, 46, 16, Color{220, 230, 220, 255});

  if (!saved_summary_path_.empty()) {
    DrawText(TextFormat("saved: %s", saved_summary_path_.c_str()), 20, 66, 14, Color{240, 220, 160, 255});
  }

  DrawText("Enter: Ride | Backspace: Stop | T: Track | L: Loop | C: Chain lift | [ ]: Speed | M: Smoothing | O: Orbit",
           20, 86, 14, Color{200, 210, 200, 255});
}

} // namespace rcr
