#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rcr/vec3.hpp>

namespace rcr {

// Designer control point: world position plus banking angle (degrees).
struct TrackPoint {
  Vec3 position{};
  double tilt_deg = 0.0;
};

// Immutable centripetal Catmull-Rom curve through a sequence of control points.
// Parameter t in [0,1] is uniform per segment (not per unit length).
// Closed curves wrap any t modulo 1; open curves clamp t to [0,1].
class TrackCurve {
public:
  static constexpr int kArcDivisions = 200;

  TrackCurve() = default;
  TrackCurve(std::vector<Vec3> ctrl, bool looped);

  Vec3 point_at(double t) const;
  // Unit direction of travel at t.
  Vec3 tangent_at(double t) const;
  double arc_length() const { return length_; }

  bool looped() const { return looped_; }
  bool empty() const { return ctrl_.size() < 2; }
  std::size_t control_count() const { return ctrl_.size(); }

private:
  struct Cubic {
    double c0{}, c1{}, c2{}, c3{};
    double value(double u) const { return c0 + u*(c1 + u*(c2 + u*c3)); }
    double slope(double u) const { return c1 + u*(2.0*c2 + 3.0*c3*u); }
  };
  struct Span {
    Cubic x, y, z;
    Vec3 chord{};  // p2 - p1, used when the derivative vanishes
    double u = 0.0;
  };

  Span span_at_(double t) const;
  double normalize_param_(double t) const;
  void build_length_();

  std::vector<Vec3> ctrl_;
  bool looped_{false};
  double length_{0.0};
};

// nullopt when fewer than 2 points: a valid "no curve" state, not an error.
std::optional<TrackCurve> make_track_curve(const std::vector<TrackPoint>& points, bool looped);

// Banking angle (degrees) at progress t, linearly interpolated between control
// points using the same segment mapping as TrackCurve.
double tilt_at(const std::vector<TrackPoint>& points, double t, bool looped);

} // namespace rcr
