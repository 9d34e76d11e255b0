#pragma once
#include <vector>
#include <rpace/geo.hpp>
#include <rpace/power.hpp>

namespace rpace {

struct CyclingPolicy {
  double target_power_w   = 200.0; // steady-state target
  double critical_power_w = 250.0; // CP / FTP, caps climbing surges
};

// Grade tiers, checked in this order (strict inequalities).
inline constexpr double kClimbGrade       = 0.05;
inline constexpr double kRiseGrade        = 0.02;
inline constexpr double kDescentGrade     = -0.03;
inline constexpr double kClimbPowerFactor   = 1.12;
inline constexpr double kRisePowerFactor    = 1.06;
inline constexpr double kDescentPowerFactor = 0.60;
inline constexpr double kDescentPowerFloorW = 50.0;

// Power (W) held on a segment of the given grade.
double assigned_power(double grade, const CyclingPolicy& p);

struct CyclingSegmentResult {
  Segment segment;
  double power_w   = 0.0;
  double speed_mps = 0.0;
  double time_s    = 0.0;
};

// One result per segment, same order.
std::vector<CyclingSegmentResult> simulate_cycling(const std::vector<Segment>& segments,
                                                   const RiderParams& rider,
                                                   const CyclingPolicy& policy);

} // namespace rpace
