#include <rpace/export.hpp>
#include <fstream>
#include <fmt/format.h>

namespace rpace {

void write_cycling_csv(std::ostream& out, const CyclingRoute& route) {
  out << "segment,distance_m,grade_pct,power_w,speed_kmh,time_s,cum_distance_km,cum_time_min\n";
  for (std::size_t i = 0; i < route.rows.size(); ++i) {
    const auto& r = route.rows[i];
    out << fmt::format("{},{:.2f},{:.2f},{:.1f},{:.2f},{:.2f},{:.3f},{:.2f}\n",
                       i + 1,
                       r.segment.distance_m,
                       r.segment.grade * 100.0,
                       r.power_w,
                       r.speed_mps * 3.6,
                       r.time_s,
                       route.series.distance_km[i],
                       route.series.time_min[i]);
  }
}

void write_running_csv(std::ostream& out, const RunningRoute& route) {
  out << "segment,distance_m,grade_pct,pace_s_per_km,speed_kmh,time_s,cum_distance_km,cum_time_min\n";
  for (std::size_t i = 0; i < route.rows.size(); ++i) {
    const auto& r = route.rows[i];
    out << fmt::format("{},{:.2f},{:.2f},{:.1f},{:.2f},{:.2f},{:.3f},{:.2f}\n",
                       i + 1,
                       r.segment.distance_m,
                       r.segment.grade * 100.0,
                       r.pace_s_per_km,
                       r.speed_mps * 3.6,
                       r.time_s,
                       route.series.distance_km[i],
                       route.series.time_min[i]);
  }
}

bool save_cycling_csv(const std::string& path, const CyclingRoute& route) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_cycling_csv(f, route);
  return static_cast<bool>(f);
}

bool save_running_csv(const std::string& path, const RunningRoute& route) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_running_csv(f, route);
  return static_cast<bool>(f);
}

} // namespace rpace
