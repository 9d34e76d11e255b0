#include <rpace/power.hpp>
#include <cmath>

namespace rpace {

PowerTerms power_terms(double v_mps, double grade, const RiderParams& r) {
  const double theta = std::atan(grade);
  PowerTerms t;
  t.rolling = r.crr * r.mass_kg * kGravity * std::cos(theta) * v_mps;
  t.aero    = 0.5 * kAirDensity * r.cda_m2 * v_mps * v_mps * v_mps;
  t.gravity = r.mass_kg * kGravity * std::sin(theta) * v_mps;
  return t;
}

double power_required(double v_mps, double grade, const RiderParams& r) {
  return power_terms(v_mps, grade, r).total();
}

double solve_velocity(double power_w, double grade, const RiderParams& r) {
  double lo = kSolverMinSpeed;
  double hi = kSolverMaxSpeed;
  for (int i = 0; i < kSolverIterations; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (power_required(mid, grade, r) > power_w) hi = mid;
    else                                         lo = mid;
  }
  return 0.5 * (lo + hi);
}

} // namespace rpace
