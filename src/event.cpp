#include <rpace/event.hpp>
#include <algorithm>

namespace rpace {

std::optional<double> multisport_time(const std::vector<double>& leg_times_s,
                                      const std::vector<double>& transitions_s) {
  if (leg_times_s.empty()) return std::nullopt;
  if (transitions_s.size() + 1 != leg_times_s.size()) return std::nullopt;

  double sum = 0.0;
  for (std::size_t i = 0; i < leg_times_s.size(); ++i) {
    sum += std::max(0.0, leg_times_s[i]);
    if (i + 1 < leg_times_s.size()) {
      sum += std::max(0.0, transitions_s[i]);
    }
  }
  return sum;
}

EventSummary estimate_duathlon(const CyclingRoute& bike,
                               const RunningRoute& run,
                               double transition_s) {
  EventSummary e;
  e.bike_s       = bike.summary.total_time_h * 3600.0;
  e.run_s        = run.summary.total_time_h * 3600.0;
  e.transition_s = std::max(0.0, transition_s);
  e.total_s      = multisport_time({e.bike_s, e.run_s}, {e.transition_s}).value_or(0.0);
  return e;
}

} // namespace rpace
