#include <rpace/running.hpp>
#include <algorithm>

namespace rpace {

double adjust_pace(double base_pace_s_per_km, double grade) {
  const double pct = grade * 100.0;
  if (pct > 0.0) {
    return base_pace_s_per_km + kUphillSecPerPct * pct;
  }
  const double gain = std::min(kDownhillSecPerPct * (-pct), kDownhillMaxGainSec);
  return std::max(base_pace_s_per_km - gain, base_pace_s_per_km * kDownhillPaceFloor);
}

double pace_from_speed_kmh(double speed_kmh) {
  return speed_kmh > 0.0 ? 3600.0 / speed_kmh : 0.0;
}

double speed_kmh_from_pace(double pace_s_per_km) {
  return pace_s_per_km > 0.0 ? 3600.0 / pace_s_per_km : 0.0;
}

std::optional<RunningPolicy> resolve_running_policy(const RunningInput& in) {
  if (in.base_pace_s_per_km.has_value() == in.speed_kmh.has_value()) return std::nullopt;
  const double pace = in.base_pace_s_per_km ? *in.base_pace_s_per_km
                                            : pace_from_speed_kmh(*in.speed_kmh);
  if (!(pace > 0.0)) return std::nullopt;
  return RunningPolicy{pace, in.fatigue};
}

std::vector<RunningSegmentResult> simulate_running(const std::vector<Segment>& segments,
                                                   const RunningPolicy& policy) {
  const double base = policy.base_pace_s_per_km * (1.0 + policy.fatigue);

  std::vector<RunningSegmentResult> out;
  out.reserve(segments.size());
  for (const auto& seg : segments) {
    RunningSegmentResult r;
    r.segment       = seg;
    r.pace_s_per_km = adjust_pace(base, seg.grade);
    r.speed_mps     = r.pace_s_per_km > 0.0 ? 1000.0 / r.pace_s_per_km : 0.0;
    r.time_s        = r.speed_mps > 0.0 ? seg.distance_m / r.speed_mps : 0.0;
    out.push_back(r);
  }
  return out;
}

} // namespace rpace
