#include <rcr/track_curve.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace rcr {

namespace {

// Segments whose knot spacing collapses below this use the neighbouring spacing.
constexpr double kMinKnotSpacing = 1e-4;

double wrap01(double t) {
  double w = t - std::floor(t);
  if (w >= 1.0) w = 0.0;
  return w;
}

struct SegmentMap {
  std::size_t index = 0;
  double weight = 0.0;
};

// Maps t onto (segment index, local weight) for n control points.
SegmentMap map_segment(std::size_t n, double t, bool looped) {
  const double segs = looped ? double(n) : double(n - 1);
  const double p = segs * t;
  SegmentMap m{};
  m.index = static_cast<std::size_t>(std::floor(p));
  m.weight = p - std::floor(p);
  if (looped) {
    m.index %= n;
  } else if (m.index >= n - 1) {
    m.index = n - 2;
    m.weight = 1.0;
  }
  return m;
}

} // namespace

TrackCurve::TrackCurve(std::vector<Vec3> ctrl, bool looped)
  : ctrl_(std::move(ctrl)), looped_(looped) {
  if (ctrl_.size() < 2) { ctrl_.clear(); length_ = 0.0; return; }
  build_length_();
}

double TrackCurve::normalize_param_(double t) const {
  if (looped_) return wrap01(t);
  return std::clamp(t, 0.0, 1.0);
}

TrackCurve::Span TrackCurve::span_at_(double t) const {
  const std::size_t l = ctrl_.size();
  const SegmentMap m = map_segment(l, normalize_param_(t), looped_);
  const std::size_t i = m.index;

  // Open ends extrapolate a phantom point mirrored through the end point.
  const Vec3 p0 = (looped_ || i > 0) ? ctrl_[(i + l - 1) % l] : ctrl_[0] * 2.0 - ctrl_[1];
  const Vec3& p1 = ctrl_[i % l];
  const Vec3& p2 = ctrl_[(i + 1) % l];
  const Vec3 p3 = (looped_ || i + 2 < l) ? ctrl_[(i + 2) % l] : ctrl_[l-1] * 2.0 - ctrl_[l-2];

  // Centripetal parameterization: knot spacing = |Pi+1 - Pi|^0.5
  double dt0 = std::pow(length_sq(p1 - p0), 0.25);
  double dt1 = std::pow(length_sq(p2 - p1), 0.25);
  double dt2 = std::pow(length_sq(p3 - p2), 0.25);
  if (dt1 < kMinKnotSpacing) dt1 = 1.0;
  if (dt0 < kMinKnotSpacing) dt0 = dt1;
  if (dt2 < kMinKnotSpacing) dt2 = dt1;

  // Non-uniform Catmull-Rom tangents, rescaled to the [0,1] segment, then Hermite form.
  auto cubic = [&](double x0, double x1, double x2, double x3) {
    double m1 = (x1 - x0) / dt0 - (x2 - x0) / (dt0 + dt1) + (x2 - x1) / dt1;
    double m2 = (x2 - x1) / dt1 - (x3 - x1) / (dt1 + dt2) + (x3 - x2) / dt2;
    m1 *= dt1;
    m2 *= dt1;
    Cubic c;
    c.c0 = x1;
    c.c1 = m1;
    c.c2 = -3.0*x1 + 3.0*x2 - 2.0*m1 - m2;
    c.c3 =  2.0*x1 - 2.0*x2 + m1 + m2;
    return c;
  };

  Span s;
  s.x = cubic(p0.x, p1.x, p2.x, p3.x);
  s.y = cubic(p0.y, p1.y, p2.y, p3.y);
  s.z = cubic(p0.z, p1.z, p2.z, p3.z);
  s.chord = p2 - p1;
  s.u = m.weight;
  return s;
}

Vec3 TrackCurve::point_at(double t) const {
  if (empty()) return Vec3{};
  const Span s = span_at_(t);
  return { s.x.value(s.u), s.y.value(s.u), s.z.value(s.u) };
}

Vec3 TrackCurve::tangent_at(double t) const {
  if (empty()) return Vec3{1.0, 0.0, 0.0};
  const Span s = span_at_(t);
  const Vec3 d{ s.x.slope(s.u), s.y.slope(s.u), s.z.slope(s.u) };
  if (length_sq(d) > 1e-12) return normalize(d);
  if (length_sq(s.chord) > 1e-12) return normalize(s.chord);
  return Vec3{1.0, 0.0, 0.0};
}

void TrackCurve::build_length_() {
  double total = 0.0;
  Vec3 prev = point_at(0.0);
  for (int i = 1; i <= kArcDivisions; ++i) {
    const double t = double(i) / double(kArcDivisions);
    // For closed curves t=1 wraps to 0, which is also the closing point.
    const Vec3 cur = point_at(t);
    total += distance(prev, cur);
    prev = cur;
  }
  length_ = total;
}

std::optional<TrackCurve> make_track_curve(const std::vector<TrackPoint>& points, bool looped) {
  if (points.size() < 2) return std::nullopt;
  std::vector<Vec3> ctrl;
  ctrl.reserve(points.size());
  for (const auto& p : points) ctrl.push_back(p.position);
  return TrackCurve{std::move(ctrl), looped};
}

double tilt_at(const std::vector<TrackPoint>& points, double t, bool looped) {
  const std::size_t n = points.size();
  if (n == 0) return 0.0;
  if (n == 1) return points[0].tilt_deg;
  const double tn = looped ? wrap01(t) : std::clamp(t, 0.0, 1.0);
  const SegmentMap m = map_segment(n, tn, looped);
  const double a = points[m.index % n].tilt_deg;
  const double b = points[(m.index + 1) % n].tilt_deg;
  return a + (b - a) * m.weight;
}

} // namespace rcr
