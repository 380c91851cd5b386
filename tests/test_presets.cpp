#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <sstream>
#include <string>

#include <rcr/camera.hpp>
#include <rcr/config.hpp>
#include <rcr/track_presets.hpp>

using Catch::Approx;
using namespace rcr;

TEST_CASE("Every preset builds a rideable curve") {
  for (int i = 0; i < static_cast<int>(TrackPreset::Count); ++i) {
    const auto p = static_cast<TrackPreset>(i);
    const TrackLayout layout = make_preset(p);
    REQUIRE(layout.points.size() >= 2);
    REQUIRE(layout.key == preset_key(p));
    REQUIRE(std::string(layout.name) == preset_name(p));

    auto curve = make_track_curve(layout.points, layout.looped);
    REQUIRE(curve.has_value());
    REQUIRE(curve->arc_length() > 10.0);

    // Ride frame stays well-formed everywhere, vertical sections included.
    for (int k = 0; k <= 400; ++k) {
      const double t = double(k) / 400.0;
      const FrameBasis b = build_frame_basis(curve->tangent_at(t), tilt_at(layout.points, t, layout.looped));
      REQUIRE(length(b.up) == Approx(1.0));
      REQUIRE(dot(b.up, b.tangent) == Approx(0.0).margin(1e-9));
    }
  }
}

TEST_CASE("Flat preset is level without chain lift") {
  const TrackLayout flat = make_preset(TrackPreset::Flat);
  REQUIRE_FALSE(flat.chain_lift);
  for (const auto& p : flat.points) REQUIRE(p.position.y == 0.0);
}

TEST_CASE("Vertical loop preset contains a near-vertical section") {
  const TrackLayout loop = make_preset(TrackPreset::VerticalLoop);
  auto curve = make_track_curve(loop.points, loop.looped);
  REQUIRE(curve.has_value());
  double max_abs_y = 0.0;
  for (int k = 0; k <= 1000; ++k) {
    const double ty = curve->tangent_at(double(k) / 1000.0).y;
    max_abs_y = std::max(max_abs_y, ty < 0.0 ? -ty : ty);
  }
  REQUIRE(max_abs_y > 0.9);
}

TEST_CASE("preset_by_key is case-insensitive") {
  REQUIRE(preset_by_key("classic") == TrackPreset::Classic);
  REQUIRE(preset_by_key(" LOOP ") == TrackPreset::VerticalLoop);
  REQUIRE(preset_by_key("Helix") == TrackPreset::Helix);
  REQUIRE_FALSE(preset_by_key("nowhere").has_value());
}

TEST_CASE("next_preset cycles through every layout") {
  TrackPreset p = TrackPreset::Classic;
  for (int i = 0; i < static_cast<int>(TrackPreset::Count); ++i) p = next_preset(p);
  REQUIRE(p == TrackPreset::Classic);
  REQUIRE(next_preset(TrackPreset::Flat) == TrackPreset::Classic);
}

TEST_CASE("Ride config flags override layout defaults only when set") {
  const TrackLayout helix = make_preset(TrackPreset::Helix);
  REQUIRE(helix.looped);
  REQUIRE(helix.chain_lift);

  SECTION("unset flags keep the preset's topology") {
    const TrackLayout l = apply_ride_overrides(helix, RideConfig{});
    REQUIRE(l.looped);
    REQUIRE(l.chain_lift);
    REQUIRE(l.points.size() == helix.points.size());
  }

  SECTION("a loaded config picks the preset and overrides its flags") {
    std::istringstream ss("key,value\ntrack,helix\nlooped,false\n");
    const RideConfig cfg = ride_config_from_stream(ss);
    const auto p = preset_by_key(cfg.track);
    REQUIRE(p.has_value());
    REQUIRE(*p == TrackPreset::Helix);

    const TrackLayout l = apply_ride_overrides(make_preset(*p), cfg);
    REQUIRE(l.key == "helix");
    REQUIRE_FALSE(l.looped);
    REQUIRE(l.chain_lift);
  }

  SECTION("custom tracks honour the flags too") {
    RideConfig cfg{};
    cfg.looped = false;
    cfg.chain_lift = false;
    const TrackLayout l = apply_ride_overrides(custom_layout(helix.points), cfg);
    REQUIRE(l.key == "custom");
    REQUIRE_FALSE(l.looped);
    REQUIRE_FALSE(l.chain_lift);
  }
}
