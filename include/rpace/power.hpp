#pragma once

namespace rpace {

inline constexpr double kGravity    = 9.81;   // m/s^2
inline constexpr double kAirDensity = 1.225;  // kg/m^3

// Solver bracket and fixed iteration count.
inline constexpr double kSolverMinSpeed  = 0.1;   // m/s
inline constexpr double kSolverMaxSpeed  = 25.0;  // m/s
inline constexpr int    kSolverIterations = 50;

struct RiderParams {
  double mass_kg = 80.0;  // rider + bike
  double cda_m2  = 0.32;  // drag area
  double crr     = 0.004; // rolling resistance coefficient
};

// The three resistive contributions (watts) at speed v.
struct PowerTerms {
  double rolling = 0.0;
  double aero    = 0.0;
  double gravity = 0.0; // negative downhill
  double total() const { return rolling + aero + gravity; }
};

PowerTerms power_terms(double v_mps, double grade, const RiderParams& r);

// Steady-state power (W) to hold v_mps on the given grade.
// Strictly increasing in v for v > 0 when mass, CdA and Crr are positive.
double power_required(double v_mps, double grade, const RiderParams& r);

// Inverse of power_required by bisection over [kSolverMinSpeed, kSolverMaxSpeed].
// Always returns the midpoint after kSolverIterations halvings; a power outside
// the bracket's range lands on the nearest edge.
double solve_velocity(double power_w, double grade, const RiderParams& r);

} // namespace rpace
