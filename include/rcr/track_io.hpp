#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rcr/track_curve.hpp>

namespace rcr {

// Stream-based CSV loader (test-friendly; no filesystem required).
// Rows: x,y,z[,tilt_deg]. Accepts an optional header row (first column "x");
// ignores lines starting with '#' and blank lines. Invalid rows are skipped.
std::vector<TrackPoint> track_points_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<TrackPoint>> load_track_csv(const std::string& path);

} // namespace rcr
