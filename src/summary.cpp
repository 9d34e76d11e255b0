#include <rpace/summary.hpp>

namespace rpace {

namespace {

template <class Row>
CumulativeSeries cumulative_series_(const std::vector<Row>& rows) {
  CumulativeSeries s;
  s.distance_km.reserve(rows.size());
  s.time_min.reserve(rows.size());
  double dist_m = 0.0;
  double time_s = 0.0;
  for (const auto& r : rows) {
    dist_m += r.segment.distance_m;
    time_s += r.time_s;
    s.distance_km.push_back(dist_m / 1000.0);
    s.time_min.push_back(time_s / 60.0);
  }
  return s;
}

} // namespace

CumulativeSeries cumulative_series(const std::vector<CyclingSegmentResult>& rows) {
  return cumulative_series_(rows);
}

CumulativeSeries cumulative_series(const std::vector<RunningSegmentResult>& rows) {
  return cumulative_series_(rows);
}

CyclingSummary summarize_cycling(const std::vector<CyclingSegmentResult>& rows,
                                 double critical_power_w) {
  double dist_m = 0.0, time_s = 0.0, work_j = 0.0;
  for (const auto& r : rows) {
    dist_m += r.segment.distance_m;
    time_s += r.time_s;
    work_j += r.power_w * r.time_s;
  }

  CyclingSummary s;
  s.total_distance_km = dist_m / 1000.0;
  s.total_time_h      = time_s / 3600.0;
  s.avg_power_w       = time_s > 0.0 ? work_j / time_s : 0.0;
  s.intensity_factor  = critical_power_w > 0.0 ? s.avg_power_w / critical_power_w : 0.0;
  s.tss               = s.total_time_h * s.intensity_factor * s.intensity_factor * 100.0;
  return s;
}

RunningSummary summarize_running(const std::vector<RunningSegmentResult>& rows) {
  double dist_m = 0.0, time_s = 0.0;
  for (const auto& r : rows) {
    dist_m += r.segment.distance_m;
    time_s += r.time_s;
  }

  RunningSummary s;
  s.total_distance_km = dist_m / 1000.0;
  s.total_time_h      = time_s / 3600.0;
  if (s.total_distance_km > 0.0) {
    s.avg_pace_min_per_km = (time_s / 60.0) / s.total_distance_km;
  }
  return s;
}

} // namespace rpace
