#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <rpace/samples_csv.hpp>

using Catch::Approx;
using namespace rpace;

static std::string csv_minimal = R"(lat,lon,ele
45.0700,7.6800,240.0
45.0710,7.6810,245.5
)";

static std::string csv_with_noise = R"( latitude , longitude , elevation
# exported track

45.0700 , 7.6800 , 240.0
45.0710,7.6810
not,a,number
95.0,7.0,100.0
45.0720 , 7.6820 ,
45.0730,7.6830,250x
)";

TEST_CASE("samples_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto pts = samples_from_csv_stream(ss);
  REQUIRE(pts.size() == 2);
  REQUIRE(pts[0].lat_deg == Approx(45.07));
  REQUIRE(pts[0].lon_deg == Approx(7.68));
  REQUIRE(pts[1].ele_m == Approx(245.5));
}

TEST_CASE("samples_from_csv_stream handles spaces, comments, missing elevation and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto pts = samples_from_csv_stream(ss);
  REQUIRE(pts.size() == 3);
  REQUIRE(pts[0].ele_m == Approx(240.0));
  REQUIRE(pts[1].ele_m == 0.0);   // no elevation column
  REQUIRE(pts[2].ele_m == 0.0);   // empty elevation field
  REQUIRE(pts[2].lat_deg == Approx(45.072));
}

TEST_CASE("samples_from_csv_stream works without a header") {
  std::istringstream ss("0.0,0.0,10\n0.01,0.0,20\n");
  REQUIRE(samples_from_csv_stream(ss).size() == 2);
}

TEST_CASE("load_samples_csv returns nullopt on missing file") {
  auto none = load_samples_csv("this_route_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
