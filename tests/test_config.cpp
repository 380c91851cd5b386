#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <rcr/config.hpp>

using Catch::Approx;
using namespace rcr;

TEST_CASE("RideConfig defaults") {
  const RideConfig cfg{};
  REQUIRE(cfg.track == "classic");
  REQUIRE(cfg.speed_scale == Approx(1.0));
  REQUIRE_FALSE(cfg.looped.has_value());
  REQUIRE_FALSE(cfg.chain_lift.has_value());
  REQUIRE(cfg.camera_height == Approx(1.5));
  REQUIRE(cfg.look_ahead == Approx(0.03));
  REQUIRE(cfg.look_at_height_ratio == Approx(0.8));
  REQUIRE(cfg.smoothing == SmoothingMode::PerFrame);
  REQUIRE_FALSE(cfg.reset_energy_each_lap);
}

TEST_CASE("ride_config_from_stream applies known keys") {
  std::istringstream ss(R"(key,value
# ride tuning
track, Helix
speed_scale, 1.75
looped, false
chain_lift, no
camera_height, 2.0
smoothing, time_scaled
smoothing_rate, 8
max_frame_dt, -1
reset_energy_each_lap, on
)");
  std::vector<std::string> warnings;
  const RideConfig cfg = ride_config_from_stream(ss, RideConfig{}, &warnings);
  REQUIRE(warnings.empty());
  REQUIRE(cfg.track == "helix");
  REQUIRE(cfg.speed_scale == Approx(1.75));
  REQUIRE(cfg.looped.has_value());
  REQUIRE_FALSE(*cfg.looped);
  REQUIRE(cfg.chain_lift.has_value());
  REQUIRE_FALSE(*cfg.chain_lift);
  REQUIRE(cfg.camera_height == Approx(2.0));
  REQUIRE(cfg.smoothing == SmoothingMode::TimeScaled);
  REQUIRE(cfg.smoothing_rate == Approx(8.0));
  REQUIRE(cfg.max_frame_dt == Approx(-1.0));
  REQUIRE(cfg.reset_energy_each_lap);

  const CameraParams cp = cfg.camera_params();
  REQUIRE(cp.height == Approx(2.0));
  REQUIRE(cp.look_ahead == Approx(0.03));
}

TEST_CASE("ride_config_from_stream skips bad rows and keeps the base") {
  RideConfig base{};
  base.speed_scale = 3.0;
  std::istringstream ss(R"(
speed_scale, fast
looped, maybe
unknown_key, 1
camera_height, -2
look_ahead
)");
  std::vector<std::string> warnings;
  const RideConfig cfg = ride_config_from_stream(ss, base, &warnings);
  REQUIRE(warnings.size() == 5);
  REQUIRE(cfg.speed_scale == Approx(3.0));
  REQUIRE_FALSE(cfg.looped.has_value());
  REQUIRE(cfg.camera_height == Approx(1.5));
  REQUIRE(cfg.look_ahead == Approx(0.03));
}

TEST_CASE("ride_config_from_stream works without a warnings sink") {
  std::istringstream ss("speed_scale,2\nbogus,1\n");
  const RideConfig cfg = ride_config_from_stream(ss);
  REQUIRE(cfg.speed_scale == Approx(2.0));
}

TEST_CASE("load_ride_config returns nullopt on missing file") {
  REQUIRE_FALSE(load_ride_config("this_file_does_not_exist.cfg").has_value());
}
