#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include <rcr/camera.hpp>

using Catch::Approx;
using namespace rcr;

static void require_vec(const Vec3& v, double x, double y, double z) {
  REQUIRE(v.x == Approx(x).margin(1e-9));
  REQUIRE(v.y == Approx(y).margin(1e-9));
  REQUIRE(v.z == Approx(z).margin(1e-9));
}

TEST_CASE("Frame basis for level travel along +Z") {
  const FrameBasis b = build_frame_basis(Vec3{0, 0, 1}, 0.0);
  require_vec(b.tangent, 0, 0, 1);
  require_vec(b.right,  -1, 0, 0);
  require_vec(b.base_up, 0, 1, 0);
  require_vec(b.up,      0, 1, 0);
}

TEST_CASE("Frame basis is orthonormal and right-handed for any non-vertical tangent") {
  const Vec3 tangents[] = {
    {1, 0, 0}, {0, 0, -1}, {1, 1, 0}, {0.3, -0.8, 0.5}, {-2, 0.5, 7}, {0.01, -0.2, -1},
  };
  for (const Vec3& t : tangents) {
    const FrameBasis b = build_frame_basis(t, 0.0);
    REQUIRE(length(b.tangent) == Approx(1.0));
    REQUIRE(length(b.right)   == Approx(1.0));
    REQUIRE(length(b.base_up) == Approx(1.0));
    REQUIRE(dot(b.tangent, b.right)   == Approx(0.0).margin(1e-9));
    REQUIRE(dot(b.tangent, b.base_up) == Approx(0.0).margin(1e-9));
    REQUIRE(dot(b.right,   b.base_up) == Approx(0.0).margin(1e-9));
    // (tangent, base_up, right) is right-handed; base_up never points down.
    const Vec3 c = cross(b.tangent, b.base_up);
    REQUIRE(dot(c, b.right) == Approx(1.0));
    REQUIRE(b.base_up.y >= 0.0);
    // Without tilt, up equals base_up.
    REQUIRE(distance(b.up, b.base_up) == Approx(0.0).margin(1e-9));
  }
}

TEST_CASE("Tilt banks the up vector around the tangent") {
  const FrameBasis b = build_frame_basis(Vec3{0, 0, 1}, 90.0);
  require_vec(b.up, -1, 0, 0);

  const FrameBasis h = build_frame_basis(Vec3{0, 0, 1}, 30.0);
  REQUIRE(length(h.up) == Approx(1.0));
  REQUIRE(dot(h.up, h.tangent) == Approx(0.0).margin(1e-9));
  REQUIRE(dot(h.up, h.base_up) == Approx(std::cos(deg_to_rad(30.0))));
}

TEST_CASE("Vertical tangent falls back to a fixed right vector") {
  const FrameBasis b = build_frame_basis(Vec3{0, 1, 0}, 0.0);
  require_vec(b.right, 1, 0, 0);
  require_vec(b.base_up, 0, 0, 1);
  REQUIRE(length(b.up) == Approx(1.0));

  const FrameBasis d = build_frame_basis(Vec3{0, -1, 0}, 45.0);
  REQUIRE(length(d.base_up) == Approx(1.0));
  REQUIRE(length(d.up) == Approx(1.0));
  REQUIRE(dot(d.up, d.tangent) == Approx(0.0).margin(1e-9));
}

TEST_CASE("look_ahead_param wraps or clamps") {
  REQUIRE(look_ahead_param(0.5, true) == Approx(0.53));
  REQUIRE(look_ahead_param(0.99, true) == Approx(0.02));
  REQUIRE(look_ahead_param(0.5, false) == Approx(0.53));
  REQUIRE(look_ahead_param(0.98, false) == Approx(0.999));
  REQUIRE(look_ahead_param(0.999, false) == Approx(0.999));
}

TEST_CASE("target_pose sits above the rail and looks ahead") {
  auto c = make_track_curve({ {{0, 0, 0}}, {{0, 0, 10}}, {{0, 0, 20}} }, false);
  REQUIRE(c.has_value());

  const CameraPose p = target_pose(*c, 0.5, 0.0);
  require_vec(p.position, 0, kCameraHeight, 10);
  REQUIRE(p.look_at.x == Approx(0.0).margin(1e-9));
  REQUIRE(p.look_at.y == Approx(kCameraHeight * kLookAtHeightRatio));
  REQUIRE(p.look_at.z == Approx(20.0 * 0.53));

  SECTION("custom camera parameters") {
    const CameraParams params{2.0, 0.1, 0.5};
    const CameraPose q = target_pose(*c, 0.5, 0.0, params);
    REQUIRE(q.position.y == Approx(2.0));
    REQUIRE(q.look_at.y == Approx(1.0));
    REQUIRE(q.look_at.z == Approx(12.0));
  }

  SECTION("near the open end the look-at point is clamped") {
    const CameraPose e = target_pose(*c, 0.99, 0.0);
    REQUIRE(e.look_at.z == Approx(20.0 * 0.999));
  }
}

TEST_CASE("smoothing_factor modes") {
  REQUIRE(smoothing_factor(SmoothingMode::PerFrame, 1.0 / 60.0) == Approx(0.25));
  REQUIRE(smoothing_factor(SmoothingMode::PerFrame, 1.0 / 10.0) == Approx(0.25));

  // Default rate matches the per-frame blend at 60 Hz.
  REQUIRE(smoothing_factor(SmoothingMode::TimeScaled, 1.0 / 60.0) == Approx(0.25).margin(1e-3));
  REQUIRE(smoothing_factor(SmoothingMode::TimeScaled, 0.0) == Approx(0.0));

  // Two half frames blend the same total as one full frame.
  const double full = smoothing_factor(SmoothingMode::TimeScaled, 0.02);
  const double half = smoothing_factor(SmoothingMode::TimeScaled, 0.01);
  REQUIRE(1.0 - full == Approx((1.0 - half) * (1.0 - half)));
}

TEST_CASE("PoseSmoother converges toward a constant target") {
  PoseSmoother s;
  s.snap(CameraPose{Vec3{0, 0, 0}, Vec3{0, 0, 5}});
  const CameraPose target{Vec3{10, 4, -2}, Vec3{3, 3, 3}};

  double prev = distance(s.pose.position, target.position);
  double prev_look = distance(s.pose.look_at, target.look_at);
  int frames = 0;
  while (prev > 1e-6) {
    s.blend(target, kPerFrameBlend);
    const double d = distance(s.pose.position, target.position);
    const double dl = distance(s.pose.look_at, target.look_at);
    REQUIRE(d < prev);
    REQUIRE(dl < prev_look);
    prev = d;
    prev_look = dl;
    ++frames;
    REQUIRE(frames < 200);
  }
  // Each frame keeps 75% of the remaining distance.
  REQUIRE(frames > 40);
}
