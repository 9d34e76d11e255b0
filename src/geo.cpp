#include <rpace/geo.hpp>
#include <cmath>

namespace rpace {

double haversine_m(const Sample& a, const Sample& b) {
  const double lat1 = a.lat_deg * kDegToRad;
  const double lat2 = b.lat_deg * kDegToRad;
  const double dlat = (b.lat_deg - a.lat_deg) * kDegToRad;
  const double dlon = (b.lon_deg - a.lon_deg) * kDegToRad;

  const double s_lat = std::sin(dlat / 2.0);
  const double s_lon = std::sin(dlon / 2.0);
  const double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return kEarthRadiusM * c;
}

std::vector<Segment> segment_route(const std::vector<Sample>& samples) {
  std::vector<Segment> out;
  if (samples.size() < 2) return out;
  out.reserve(samples.size() - 1);
  for (std::size_t i = 1; i < samples.size(); ++i) {
    const double d  = haversine_m(samples[i-1], samples[i]);
    const double dz = samples[i].ele_m - samples[i-1].ele_m;
    out.push_back(Segment{d, d > 0.0 ? dz / d : 0.0});
  }
  return out;
}

RouteProfile route_profile(const std::vector<Sample>& samples) {
  RouteProfile p;
  p.distance_km.reserve(samples.size());
  p.ele_m.reserve(samples.size());
  double cum_m = 0.0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (i > 0) cum_m += haversine_m(samples[i-1], samples[i]);
    p.distance_km.push_back(cum_m / 1000.0);
    p.ele_m.push_back(samples[i].ele_m);
  }
  return p;
}

ElevationTotals elevation_totals(const std::vector<Sample>& samples) {
  ElevationTotals t;
  for (std::size_t i = 1; i < samples.size(); ++i) {
    const double dz = samples[i].ele_m - samples[i-1].ele_m;
    if (dz > 0.0) t.ascent_m += dz;
    else          t.descent_m -= dz;
  }
  return t;
}

} // namespace rpace
