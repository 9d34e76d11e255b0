#pragma once
#include <cstddef>
#include <numbers>
#include <vector>

namespace rpace {

inline constexpr double kPI            = std::numbers::pi_v<double>;
inline constexpr double kDegToRad      = kPI / 180.0;
inline constexpr double kEarthRadiusM  = 6371000.0;

// One recorded track point.
struct Sample {
  double lat_deg = 0.0;
  double lon_deg = 0.0;
  double ele_m   = 0.0;   // 0 when the source had no elevation
};

// Straight piece of route between two consecutive samples.
struct Segment {
  double distance_m = 0.0; // great-circle distance, >= 0
  double grade      = 0.0; // rise / run, 0 when distance_m == 0
};

// Great-circle distance (meters) on a sphere of kEarthRadiusM.
double haversine_m(const Sample& a, const Sample& b);

// n samples -> max(0, n-1) segments, in order. No smoothing.
std::vector<Segment> segment_route(const std::vector<Sample>& samples);

// Per-sample chart axes: cumulative distance (km) and raw elevation (m).
struct RouteProfile {
  std::vector<double> distance_km;
  std::vector<double> ele_m;
};
RouteProfile route_profile(const std::vector<Sample>& samples);

struct ElevationTotals {
  double ascent_m  = 0.0;
  double descent_m = 0.0; // positive number
};
ElevationTotals elevation_totals(const std::vector<Sample>& samples);

} // namespace rpace
