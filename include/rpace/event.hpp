#pragma once
#include <optional>
#include <vector>
#include <rpace/route.hpp>

namespace rpace {

// Sum of legs with a transition between each pair.
// Returns nullopt unless legs is non-empty and legs.size() == transitions.size() + 1.
// Negative values clamp to zero.
std::optional<double> multisport_time(const std::vector<double>& leg_times_s,
                                      const std::vector<double>& transitions_s);

struct EventSummary {
  double bike_s       = 0.0;
  double transition_s = 0.0;
  double run_s        = 0.0;
  double total_s      = 0.0;
};

// Bike leg, one transition, then the run leg (fatigue already in the run).
EventSummary estimate_duathlon(const CyclingRoute& bike,
                               const RunningRoute& run,
                               double transition_s);

} // namespace rpace
