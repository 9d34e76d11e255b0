#pragma once
#include <optional>
#include <vector>
#include <rpace/geo.hpp>

namespace rpace {

inline constexpr double kUphillSecPerPct     = 12.0; // s/km added per % grade
inline constexpr double kDownhillSecPerPct   = 6.0;  // s/km saved per % grade
inline constexpr double kDownhillMaxGainSec  = 18.0;
inline constexpr double kDownhillPaceFloor   = 0.85; // never faster than 85% of base

// Grade-adjusted pace (s/km) for a base pace (s/km).
double adjust_pace(double base_pace_s_per_km, double grade);

// Reference speed (km/h) <-> pace (s/km). Non-positive input yields 0.
double pace_from_speed_kmh(double speed_kmh);
double speed_kmh_from_pace(double pace_s_per_km);

struct RunningPolicy {
  double base_pace_s_per_km = 300.0;
  double fatigue            = 0.0;   // fraction, inflates base pace uniformly
};

// Parameter-input view: exactly one of base pace / reference speed is set.
struct RunningInput {
  std::optional<double> base_pace_s_per_km;
  std::optional<double> speed_kmh;
  double fatigue = 0.0;
};

// nullopt unless exactly one source is set and it is positive.
std::optional<RunningPolicy> resolve_running_policy(const RunningInput& in);

struct RunningSegmentResult {
  Segment segment;
  double pace_s_per_km = 0.0;
  double speed_mps     = 0.0;
  double time_s        = 0.0;
};

// One result per segment, same order. Fatigue applies to the base pace of
// every segment; it does not compound along the route.
std::vector<RunningSegmentResult> simulate_running(const std::vector<Segment>& segments,
                                                   const RunningPolicy& policy);

} // namespace rpace
