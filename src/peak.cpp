#include <rcr/peak.hpp>
#include <cmath>
#include <limits>

namespace rcr {

double find_first_peak(const TrackCurve& curve) {
  if (curve.empty()) return 0.0;

  double max_height = -std::numeric_limits<double>::infinity();
  double peak_t = 0.0;
  bool found_climb = false;

  // Integer counter so the last sample lands exactly on 0.5.
  const int steps = static_cast<int>(std::lround(kPeakScanEnd / kPeakScanStep));
  for (int i = 0; i <= steps; ++i) {
    const double t = double(i) * kPeakScanStep;
    const Vec3 p  = curve.point_at(t);
    const Vec3 tg = curve.tangent_at(t);

    if (tg.y > kClimbThreshold) found_climb = true;

    if (found_climb && p.y > max_height) {
      max_height = p.y;
      peak_t = t;
    }

    if (found_climb && tg.y < kDescentThreshold && t > peak_t) break;
  }

  return peak_t > 0.0 ? peak_t : kFallbackPeak;
}

double find_first_peak(const std::optional<TrackCurve>& curve) {
  if (!curve.has_value() || curve->empty()) return 0.0;
  return find_first_peak(*curve);
}

} // namespace rcr
