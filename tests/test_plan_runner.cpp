#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <thread>
#include <vector>

#include <rpace/plan_buffer.hpp>
#include <rpace/plan_runner.hpp>

using Catch::Approx;
using namespace rpace;

static std::vector<Sample> hill_route() {
  return {
    {45.000, 7.000, 200.0},
    {45.004, 7.000, 240.0},
    {45.008, 7.000, 260.0},
    {45.012, 7.000, 230.0},
    {45.016, 7.000, 190.0},
  };
}

// Poll the buffer until a plan with at least min_revision arrives (or ~2 s pass).
static bool wait_for_plan(PlanRunner& r, std::uint64_t& cursor, PlanSnapshot& out,
                          std::uint64_t min_revision) {
  for (int i = 0; i < 2000; ++i) {
    if (r.buffer().try_consume_latest(cursor, out) && out.revision >= min_revision) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return false;
}

TEST_CASE("LatestBuffer publishes and consumes latest") {
  LatestBuffer<int> buf;
  buf.publish(1);
  buf.publish(2);

  std::uint64_t cursor = 0;
  int out = 0;
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out == 2);
  REQUIRE(cursor == 2);
  // Second call without publish should return false
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));
}

TEST_CASE("compute_plan computes both legs and the event") {
  const auto segs = segment_route(hill_route());
  auto p = profile_by_key("road");
  REQUIRE(p.has_value());

  auto plan = compute_plan(segs, *p, 7);
  REQUIRE(plan.revision == 7);
  REQUIRE(plan.error.empty());
  REQUIRE(plan.bike.has_value());
  REQUIRE(plan.run.has_value());
  REQUIRE(plan.event.has_value());

  auto bike = compute_cycling_route(segs, p->rider, p->cycling);
  auto run  = compute_running_route(segs, p->running);
  REQUIRE(plan.bike->series.time_min == bike->series.time_min);
  REQUIRE(plan.run->series.time_min == run->series.time_min);
  REQUIRE(plan.event->total_s == Approx(plan.event->bike_s + p->transition_s + plan.event->run_s));
}

TEST_CASE("compute_plan reports the first validation problem") {
  const auto segs = segment_route(hill_route());
  auto p = profile_by_key("road");
  REQUIRE(p.has_value());
  p->rider.cda_m2 = 0.0;

  auto plan = compute_plan(segs, *p);
  REQUIRE_FALSE(plan.error.empty());
  REQUIRE_FALSE(plan.bike.has_value());
  REQUIRE_FALSE(plan.run.has_value());
  REQUIRE_FALSE(plan.event.has_value());
}

TEST_CASE("PlanRunner publishes recomputed plans") {
  PlanRunner runner;
  runner.set_route(hill_route());
  REQUIRE(runner.segments().size() == 4);
  REQUIRE(runner.route_profile().distance_km.size() == 5);
  runner.start();

  auto p = profile_by_key("road");
  REQUIRE(p.has_value());

  std::uint64_t cursor = 0;
  PlanSnapshot got;
  runner.request(*p);
  REQUIRE(wait_for_plan(runner, cursor, got, 1));
  REQUIRE(got.bike.has_value());
  const auto direct = compute_plan(runner.segments(), *p);
  REQUIRE(got.bike->series.time_min == direct.bike->series.time_min);
  REQUIRE(got.run->series.time_min == direct.run->series.time_min);

  // A higher target power gives a faster bike leg.
  p->cycling.target_power_w += 40.0;
  runner.request(*p);
  PlanSnapshot faster;
  REQUIRE(wait_for_plan(runner, cursor, faster, 2));
  REQUIRE(faster.bike->summary.total_time_h < got.bike->summary.total_time_h);

  runner.stop();
}

TEST_CASE("PlanRunner stop is idempotent and safe without start") {
  PlanRunner idle;
  idle.stop();

  PlanRunner r;
  r.start();
  r.stop();
  r.stop();
  REQUIRE(r.buffer().sequence() == 0);
}
