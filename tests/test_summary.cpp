#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <rpace/summary.hpp>

using Catch::Approx;
using namespace rpace;

static CyclingSegmentResult bike_row(double dist_m, double power_w, double time_s) {
  CyclingSegmentResult r;
  r.segment = Segment{dist_m, 0.0};
  r.power_w = power_w;
  r.speed_mps = time_s > 0.0 ? dist_m / time_s : 0.0;
  r.time_s = time_s;
  return r;
}

static RunningSegmentResult run_row(double dist_m, double time_s) {
  RunningSegmentResult r;
  r.segment = Segment{dist_m, 0.0};
  r.time_s = time_s;
  return r;
}

TEST_CASE("summarize_cycling") {
  SECTION("single segment") {
    auto s = summarize_cycling({bike_row(1000.0, 200.0, 200.0)}, 250.0);
    REQUIRE(s.total_distance_km == Approx(1.0));
    REQUIRE(s.total_time_h == Approx(200.0 / 3600.0));
    REQUIRE(s.avg_power_w == Approx(200.0));
    REQUIRE(s.intensity_factor == Approx(0.8));
    REQUIRE(s.tss == Approx(3.5556).epsilon(1e-4));
  }

  SECTION("average power is weighted by time") {
    // 300 W for 100 s and 100 W for 300 s -> (30000 + 30000) / 400
    auto s = summarize_cycling({bike_row(1000.0, 300.0, 100.0), bike_row(1000.0, 100.0, 300.0)}, 300.0);
    REQUIRE(s.avg_power_w == Approx(150.0));
  }

  SECTION("zero time and non-positive CP degrade to zero") {
    auto empty = summarize_cycling({}, 250.0);
    REQUIRE(empty.avg_power_w == 0.0);
    REQUIRE(empty.tss == 0.0);

    auto no_cp = summarize_cycling({bike_row(1000.0, 200.0, 200.0)}, 0.0);
    REQUIRE(no_cp.avg_power_w == Approx(200.0));
    REQUIRE(no_cp.intensity_factor == 0.0);
    REQUIRE(no_cp.tss == 0.0);
  }
}

TEST_CASE("summarize_running") {
  SECTION("average pace in min/km") {
    auto s = summarize_running({run_row(1000.0, 300.0), run_row(1000.0, 330.0)});
    REQUIRE(s.total_distance_km == Approx(2.0));
    REQUIRE(s.total_time_h == Approx(630.0 / 3600.0));
    REQUIRE(s.avg_pace_min_per_km.has_value());
    REQUIRE(*s.avg_pace_min_per_km == Approx(5.25));
  }

  SECTION("zero distance leaves pace undefined") {
    auto s = summarize_running({run_row(0.0, 0.0)});
    REQUIRE(s.total_distance_km == 0.0);
    REQUIRE_FALSE(s.avg_pace_min_per_km.has_value());
  }
}

TEST_CASE("cumulative_series") {
  std::vector<RunningSegmentResult> rows{run_row(500.0, 150.0), run_row(0.0, 0.0), run_row(1500.0, 450.0)};
  auto s = cumulative_series(rows);
  REQUIRE(s.distance_km.size() == 3);
  REQUIRE(s.time_min.size() == 3);
  REQUIRE(s.distance_km[0] == Approx(0.5));
  REQUIRE(s.distance_km[1] == Approx(0.5));
  REQUIRE(s.distance_km[2] == Approx(2.0));
  REQUIRE(s.time_min[0] == Approx(2.5));
  REQUIRE(s.time_min[2] == Approx(10.0));
  for (std::size_t i = 1; i < s.distance_km.size(); ++i) {
    REQUIRE(s.distance_km[i] >= s.distance_km[i-1]);
    REQUIRE(s.time_min[i] >= s.time_min[i-1]);
  }
}
