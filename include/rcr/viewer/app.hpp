#pragma once
#include <optional>
#include <string>
#include <vector>
#include <rcr/config.hpp>
#include <rcr/ride.hpp>
#include <rcr/telemetry.hpp>
#include <rcr/track_presets.hpp>

namespace rcr {

// RAII application that renders the track and rides the camera along it.
class ViewerApp {
public:
  // custom_track: points loaded from CSV; replaces the preset named in cfg.
  explicit ViewerApp(const RideConfig& cfg,
                     std::optional<std::vector<TrackPoint>> custom_track = std::nullopt);
  int run(); // returns 0 on normal exit

private:
  // Input & simulation
  void process_input_();
  void step_ride_(double dt);
  void load_layout_();
  void resample_();
  void start_ride_();
  void finish_ride_();
  // Rendering
  void render_frame_();
  void draw_track_();
  void draw_hud_();

  std::string track_label_() const;

  // Dependencies
  RideConfig cfg_;
  std::optional<std::vector<TrackPoint>> custom_track_;
  TrackPreset preset_{TrackPreset::Classic};
  bool overrides_applied_{false};

  // Ride
  RideEngine engine_;
  RideState state_{};
  RideTelemetry telem_{};
  FrameResult last_frame_{};
  std::vector<Vec3> samples_;   // dense curve samples for drawing

  // UI state
  bool orbit_view_{false};
  std::string saved_summary_path_;
};

} // namespace rcr
