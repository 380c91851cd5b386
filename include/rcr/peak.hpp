#pragma once
#include <optional>
#include <rcr/track_curve.hpp>

namespace rcr {

// Scan window and thresholds for locating the top of the initial climb.
inline constexpr double kPeakScanEnd      = 0.5;
inline constexpr double kPeakScanStep     = 0.01;
inline constexpr double kClimbThreshold   = 0.1;   // tangent.y above this = climbing
inline constexpr double kDescentThreshold = -0.1;  // tangent.y below this = descending
inline constexpr double kFallbackPeak     = 0.2;

// Progress of the highest point of the first climb within [0, 0.5].
// Returns kFallbackPeak when no climb is detected.
double find_first_peak(const TrackCurve& curve);

// Same, but 0 when there is no curve (chain lift never engages).
double find_first_peak(const std::optional<TrackCurve>& curve);

} // namespace rcr
