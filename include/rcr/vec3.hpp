#pragma once
#include <cmath>
#include <numbers>

namespace rcr {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

inline constexpr double deg_to_rad(double deg) { return deg * kPI / 180.0; }
inline constexpr double rad_to_deg(double rad) { return rad * 180.0 / kPI; }

// World space: +Y is up.
struct Vec3 {
  double x{};
  double y{};
  double z{};

  Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
  Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }
  Vec3 operator-() const { return {-x, -y, -z}; }
};

inline Vec3 operator*(double s, const Vec3& v) { return v * s; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x*b.x + a.y*b.y + a.z*b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b) {
  return { a.y*b.z - a.z*b.y,
           a.z*b.x - a.x*b.z,
           a.x*b.y - a.y*b.x };
}

inline double length_sq(const Vec3& v) { return dot(v, v); }
inline double length(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline double distance(const Vec3& a, const Vec3& b) { return length(b - a); }

// Zero vector stays zero.
inline Vec3 normalize(const Vec3& v) {
  const double L = length(v);
  if (L <= 0.0) return v;
  return v / L;
}

inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
  return { a.x + (b.x - a.x) * t,
           a.y + (b.y - a.y) * t,
           a.z + (b.z - a.z) * t };
}

// Rodrigues rotation of v around a unit-length axis.
inline Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, double angle_rad) {
  const double c = std::cos(angle_rad);
  const double s = std::sin(angle_rad);
  return v * c + cross(axis, v) * s + axis * (dot(axis, v) * (1.0 - c));
}

} // namespace rcr
