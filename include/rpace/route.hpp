#pragma once
#include <optional>
#include <string>
#include <vector>
#include <rpace/geo.hpp>
#include <rpace/power.hpp>
#include <rpace/cycling.hpp>
#include <rpace/running.hpp>
#include <rpace/summary.hpp>

namespace rpace {

struct CyclingRoute {
  std::vector<CyclingSegmentResult> rows;
  CumulativeSeries series;
  CyclingSummary summary;
};

struct RunningRoute {
  std::vector<RunningSegmentResult> rows;
  CumulativeSeries series;
  RunningSummary summary;
};

// Input checks. Each returns a message describing the first problem found,
// or nullopt when the input is usable.
std::optional<std::string> validate_samples(const std::vector<Sample>& samples);
std::optional<std::string> validate_rider(const RiderParams& rider);
std::optional<std::string> validate_cycling_policy(const CyclingPolicy& policy);
std::optional<std::string> validate_running_input(const RunningInput& in);

// Full recompute from segments; nullopt when rider or policy is invalid.
std::optional<CyclingRoute> compute_cycling_route(const std::vector<Segment>& segments,
                                                  const RiderParams& rider,
                                                  const CyclingPolicy& policy);
std::optional<RunningRoute> compute_running_route(const std::vector<Segment>& segments,
                                                  const RunningInput& in);

// Convenience: validate samples, segment them, then compute.
std::optional<CyclingRoute> compute_cycling_route(const std::vector<Sample>& samples,
                                                  const RiderParams& rider,
                                                  const CyclingPolicy& policy);
std::optional<RunningRoute> compute_running_route(const std::vector<Sample>& samples,
                                                  const RunningInput& in);

} // namespace rpace
