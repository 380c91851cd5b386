#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rcr/camera.hpp>

namespace rcr {

struct RideConfig {
  std::string track = "classic";   // preset key, used when no track CSV is given
  double speed_scale = 1.0;
  // Overrides for the layout's own flags; unset keeps the layout default.
  std::optional<bool> looped;
  std::optional<bool> chain_lift;
  double camera_height = kCameraHeight;
  double look_ahead = kLookAhead;
  double look_at_height_ratio = kLookAtHeightRatio;
  SmoothingMode smoothing = SmoothingMode::PerFrame;
  double smoothing_rate = kDefaultSmoothingRate;
  double max_frame_dt = 0.1;       // seconds; <= 0 disables clamping
  bool reset_energy_each_lap = false;

  CameraParams camera_params() const {
    return CameraParams{camera_height, look_ahead, look_at_height_ratio};
  }
};

// Stream-based loader of "key,value" rows applied on top of base.
// Ignores lines starting with '#' and blank lines; trims whitespace.
// Unknown keys and unparsable values are skipped and described in warnings (if given).
RideConfig ride_config_from_stream(std::istream& in,
                                   const RideConfig& base = {},
                                   std::vector<std::string>* warnings = nullptr);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<RideConfig> load_ride_config(const std::string& path,
                                           const RideConfig& base = {},
                                           std::vector<std::string>* warnings = nullptr);

} // namespace rcr
