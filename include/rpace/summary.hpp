#pragma once
#include <optional>
#include <vector>
#include <rpace/cycling.hpp>
#include <rpace/running.hpp>

namespace rpace {

// Running sums in segment order; both series have one entry per segment.
struct CumulativeSeries {
  std::vector<double> distance_km;
  std::vector<double> time_min;
};

CumulativeSeries cumulative_series(const std::vector<CyclingSegmentResult>& rows);
CumulativeSeries cumulative_series(const std::vector<RunningSegmentResult>& rows);

struct CyclingSummary {
  double total_distance_km = 0.0;
  double total_time_h      = 0.0;
  double avg_power_w       = 0.0; // time-weighted
  double intensity_factor  = 0.0; // avg / CP
  double tss               = 0.0; // h * IF^2 * 100
};

struct RunningSummary {
  double total_distance_km = 0.0;
  double total_time_h      = 0.0;
  std::optional<double> avg_pace_min_per_km; // nullopt on a zero-distance route
};

CyclingSummary summarize_cycling(const std::vector<CyclingSegmentResult>& rows,
                                 double critical_power_w);
RunningSummary summarize_running(const std::vector<RunningSegmentResult>& rows);

} // namespace rpace
