#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <rcr/track_io.hpp>

using Catch::Approx;
using namespace rcr;

static std::string csv_minimal = R"(x,y,z,tilt_deg
0,2,0,0
0,10,20,0
5,4,40,15
)";

static std::string csv_with_noise = R"( x , y , z
# comment lines are ignored
0 , 2 , 0
, , ,            # bad row skipped
1, two, 3
4, 5, 6, 30
7, 8            # too few columns
9, 10, 11, bank
12, 13, 14,
)";

TEST_CASE("track_points_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto pts = track_points_from_csv_stream(ss);
  REQUIRE(pts.size() == 3);
  REQUIRE(pts[1].position.y == Approx(10.0));
  REQUIRE(pts[1].position.z == Approx(20.0));
  REQUIRE(pts[2].position.x == Approx(5.0));
  REQUIRE(pts[2].tilt_deg == Approx(15.0));
}

TEST_CASE("track_points_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto pts = track_points_from_csv_stream(ss);
  REQUIRE(pts.size() == 3);
  REQUIRE(pts[0].tilt_deg == Approx(0.0));
  REQUIRE(pts[1].position.x == Approx(4.0));
  REQUIRE(pts[1].tilt_deg == Approx(30.0));
  // Empty trailing tilt column defaults to level.
  REQUIRE(pts[2].position.z == Approx(14.0));
  REQUIRE(pts[2].tilt_deg == Approx(0.0));
}

TEST_CASE("Headerless files are accepted") {
  std::istringstream ss("1,2,3\n4,5,6\n");
  auto pts = track_points_from_csv_stream(ss);
  REQUIRE(pts.size() == 2);
  auto curve = make_track_curve(pts, false);
  REQUIRE(curve.has_value());
}

TEST_CASE("load_track_csv returns nullopt on missing file") {
  auto none = load_track_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
