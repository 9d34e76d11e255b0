#include <rpace/cycling.hpp>
#include <algorithm>

namespace rpace {

double assigned_power(double grade, const CyclingPolicy& p) {
  if (grade > kClimbGrade) {
    return std::min(kClimbPowerFactor * p.target_power_w, p.critical_power_w);
  }
  if (grade > kRiseGrade) {
    return kRisePowerFactor * p.target_power_w;
  }
  if (grade < kDescentGrade) {
    return std::max(kDescentPowerFactor * p.target_power_w, kDescentPowerFloorW);
  }
  return p.target_power_w;
}

std::vector<CyclingSegmentResult> simulate_cycling(const std::vector<Segment>& segments,
                                                   const RiderParams& rider,
                                                   const CyclingPolicy& policy) {
  std::vector<CyclingSegmentResult> out;
  out.reserve(segments.size());
  for (const auto& seg : segments) {
    CyclingSegmentResult r;
    r.segment   = seg;
    r.power_w   = assigned_power(seg.grade, policy);
    r.speed_mps = solve_velocity(r.power_w, seg.grade, rider);
    r.time_s    = r.speed_mps > 0.0 ? seg.distance_m / r.speed_mps : 0.0;
    out.push_back(r);
  }
  return out;
}

} // namespace rpace
