#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <rpace/export.hpp>

using namespace rpace;

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

TEST_CASE("write_cycling_csv emits header and one row per segment") {
  const std::vector<Segment> segs{{1000.0, 0.06}, {1000.0, 0.0}, {1000.0, -0.04}};
  auto route = compute_cycling_route(segs, RiderParams{80.0, 0.32, 0.004}, CyclingPolicy{200.0, 300.0});
  REQUIRE(route.has_value());

  std::ostringstream out;
  write_cycling_csv(out, *route);
  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 4);
  REQUIRE(lines[0] == "segment,distance_m,grade_pct,power_w,speed_kmh,time_s,cum_distance_km,cum_time_min");
  REQUIRE(lines[1].rfind("1,1000.00,6.00,224.0,", 0) == 0);
  REQUIRE(lines[3].rfind("3,1000.00,-4.00,120.0,", 0) == 0);
  REQUIRE(lines[3].find(",3.000,") != std::string::npos);
}

TEST_CASE("write_running_csv emits pace column") {
  const std::vector<Segment> segs{{1000.0, 0.01}, {500.0, 0.0}};
  RunningInput in; in.base_pace_s_per_km = 300.0;
  auto route = compute_running_route(segs, in);
  REQUIRE(route.has_value());

  std::ostringstream out;
  write_running_csv(out, *route);
  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0] == "segment,distance_m,grade_pct,pace_s_per_km,speed_kmh,time_s,cum_distance_km,cum_time_min");
  REQUIRE(lines[1] == "1,1000.00,1.00,312.0,11.54,312.00,1.000,5.20");
  REQUIRE(lines[2] == "2,500.00,0.00,300.0,12.00,150.00,1.500,7.70");
}

TEST_CASE("save_running_csv fails on an unwritable path") {
  RunningRoute empty;
  REQUIRE_FALSE(save_running_csv("/nonexistent_dir/route.csv", empty));
}
