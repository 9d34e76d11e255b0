#include <rpace/route.hpp>
#include <cmath>
#include <string>

namespace rpace {

static inline bool positive(double x) { return std::isfinite(x) && x > 0.0; }

std::optional<std::string> validate_samples(const std::vector<Sample>& samples) {
  if (samples.empty()) return "route has no samples";
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto& s = samples[i];
    if (!std::isfinite(s.lat_deg) || !std::isfinite(s.lon_deg) || !std::isfinite(s.ele_m)) {
      return "sample " + std::to_string(i) + " has a non-finite value";
    }
    if (s.lat_deg < -90.0 || s.lat_deg > 90.0) {
      return "sample " + std::to_string(i) + " latitude out of range [-90, 90]";
    }
    if (s.lon_deg < -180.0 || s.lon_deg > 180.0) {
      return "sample " + std::to_string(i) + " longitude out of range [-180, 180]";
    }
  }
  return std::nullopt;
}

std::optional<std::string> validate_rider(const RiderParams& rider) {
  if (!positive(rider.mass_kg)) return "total mass must be > 0 kg";
  if (!positive(rider.cda_m2))  return "CdA must be > 0 m^2";
  if (!positive(rider.crr))     return "Crr must be > 0";
  return std::nullopt;
}

std::optional<std::string> validate_cycling_policy(const CyclingPolicy& policy) {
  if (!std::isfinite(policy.target_power_w) || policy.target_power_w < 0.0) {
    return "target power must be >= 0 W";
  }
  if (!std::isfinite(policy.critical_power_w)) return "critical power must be finite";
  return std::nullopt;
}

std::optional<std::string> validate_running_input(const RunningInput& in) {
  const bool has_pace  = in.base_pace_s_per_km.has_value();
  const bool has_speed = in.speed_kmh.has_value();
  if (has_pace && has_speed) return "give either a base pace or a reference speed, not both";
  if (!has_pace && !has_speed) return "a base pace or a reference speed is required";
  if (has_pace && !positive(*in.base_pace_s_per_km)) return "base pace must be > 0 s/km";
  if (has_speed && !positive(*in.speed_kmh))         return "reference speed must be > 0 km/h";
  if (!std::isfinite(in.fatigue) || in.fatigue < 0.0 || in.fatigue > 1.0) {
    return "fatigue factor must be within [0, 1]";
  }
  return std::nullopt;
}

std::optional<CyclingRoute> compute_cycling_route(const std::vector<Segment>& segments,
                                                  const RiderParams& rider,
                                                  const CyclingPolicy& policy) {
  if (validate_rider(rider) || validate_cycling_policy(policy)) return std::nullopt;
  CyclingRoute out;
  out.rows    = simulate_cycling(segments, rider, policy);
  out.series  = cumulative_series(out.rows);
  out.summary = summarize_cycling(out.rows, policy.critical_power_w);
  return out;
}

std::optional<RunningRoute> compute_running_route(const std::vector<Segment>& segments,
                                                  const RunningInput& in) {
  if (validate_running_input(in)) return std::nullopt;
  const auto policy = resolve_running_policy(in);
  if (!policy) return std::nullopt;
  RunningRoute out;
  out.rows    = simulate_running(segments, *policy);
  out.series  = cumulative_series(out.rows);
  out.summary = summarize_running(out.rows);
  return out;
}

std::optional<CyclingRoute> compute_cycling_route(const std::vector<Sample>& samples,
                                                  const RiderParams& rider,
                                                  const CyclingPolicy& policy) {
  if (validate_samples(samples)) return std::nullopt;
  return compute_cycling_route(segment_route(samples), rider, policy);
}

std::optional<RunningRoute> compute_running_route(const std::vector<Sample>& samples,
                                                  const RunningInput& in) {
  if (validate_samples(samples)) return std::nullopt;
  return compute_running_route(segment_route(samples), in);
}

} // namespace rpace
