#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include <rpace/power.hpp>

using Catch::Approx;
using namespace rpace;

TEST_CASE("power_required") {
  const RiderParams r{80.0, 0.3, 0.004};

  SECTION("flat road: rolling + aero only") {
    // 0.004*80*9.81*10 + 0.5*1.225*0.3*1000
    REQUIRE(power_required(10.0, 0.0, r) == Approx(31.392 + 183.75));
  }

  SECTION("terms add up and gravity follows the slope sign") {
    auto up   = power_terms(8.0, 0.05, r);
    auto down = power_terms(8.0, -0.05, r);
    REQUIRE(up.total() == Approx(power_required(8.0, 0.05, r)));
    REQUIRE(up.gravity > 0.0);
    REQUIRE(down.gravity == Approx(-up.gravity));
    REQUIRE(up.rolling == Approx(down.rolling));
    const double theta = std::atan(0.05);
    REQUIRE(up.gravity == Approx(80.0 * kGravity * std::sin(theta) * 8.0));
  }

  SECTION("strictly increasing in speed up to the bracket top") {
    for (double grade : {0.0, 0.02, 0.05, 0.10}) {
      double prev = power_required(0.05, grade, r);
      for (double v = 0.1; v <= 25.0; v += 0.1) {
        const double p = power_required(v, grade, r);
        REQUIRE(p > prev);
        prev = p;
      }
    }
  }
}

TEST_CASE("solve_velocity") {
  const RiderParams r{75.0, 0.28, 0.005};

  SECTION("inverts power_required inside the bracket") {
    for (double grade : {0.0, 0.03, 0.08}) {
      for (double v0 : {0.5, 4.0, 9.3, 15.0, 24.0}) {
        const double p = power_required(v0, grade, r);
        REQUIRE(std::fabs(solve_velocity(p, grade, r) - v0) < 1e-6);
      }
    }
  }

  SECTION("power above the bracket lands on the top edge") {
    const double v = solve_velocity(1e6, 0.0, r);
    REQUIRE(v == Approx(kSolverMaxSpeed).margin(1e-9));
  }

  SECTION("power below the bracket lands on the bottom edge") {
    const double v = solve_velocity(0.0, 0.0, r);
    REQUIRE(v == Approx(kSolverMinSpeed).margin(1e-9));
  }

  SECTION("deterministic") {
    REQUIRE(solve_velocity(230.0, 0.04, r) == solve_velocity(230.0, 0.04, r));
  }
}
