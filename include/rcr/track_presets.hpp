#pragma once
#include <optional>
#include <string>
#include <vector>
#include <rcr/config.hpp>
#include <rcr/track_curve.hpp>

namespace rcr {

// World scale shared by the built-in layouts.
inline constexpr double kScale             = 0.5;
inline constexpr double kLoopRadius        = 8.0 * kScale;
inline constexpr int    kLoopPointsCount   = 16;
inline constexpr double kHelixSeparation   = 3.5 * kScale;
inline constexpr double kExitSeparation    = 3.0 * kScale;
inline constexpr double kForwardSeparation = 2.0 * kScale;
inline constexpr double kRailOffset        = 0.3 * kScale;
inline constexpr double kTieWidth          = 1.0 * kScale;

enum class TrackPreset : int {
  Classic = 0,       // chain-lift hill, drop, banked turns, camel hump
  VerticalLoop = 1,  // lift hill into a full vertical loop
  Helix = 2,         // lift hill into a banked descending helix
  Flat = 3,          // level oval, no lift
  Count
};

struct TrackLayout {
  std::string key;               // e.g., "classic"
  const char* name = "";
  std::vector<TrackPoint> points;
  bool looped = true;
  bool chain_lift = true;
};

TrackLayout make_preset(TrackPreset p);
const char* preset_name(TrackPreset p);
const char* preset_key(TrackPreset p);

// Case-insensitive lookup by key ("classic", "loop", "helix", "flat").
std::optional<TrackPreset> preset_by_key(const std::string& key);

TrackPreset next_preset(TrackPreset p);

// Layout for points loaded from a track file: looped, with chain lift.
TrackLayout custom_layout(std::vector<TrackPoint> points);

// Applies the config's looped / chain_lift overrides where they are set.
TrackLayout apply_ride_overrides(TrackLayout layout, const RideConfig& cfg);

} // namespace rcr
