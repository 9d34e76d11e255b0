#include <rpace/samples_csv.hpp>
#include <cmath>
#include <fstream>
#include <rpace/csv.hpp>

namespace rpace {

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return false;
  return cols[0] == "lat" || cols[0] == "latitude" || cols[0] == "Lat" || cols[0] == "Latitude";
}

static std::optional<Sample> parse_sample_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  const auto lat = parse_double(cols[0]);
  const auto lon = parse_double(cols[1]);
  if (!lat || !lon || !std::isfinite(*lat) || !std::isfinite(*lon)) return std::nullopt;
  if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0) return std::nullopt;

  double ele = 0.0;
  if (cols.size() >= 3 && !cols[2].empty()) {
    const auto e = parse_double(cols[2]);
    if (!e || !std::isfinite(*e)) return std::nullopt;
    ele = *e;
  }
  return Sample{*lat, *lon, ele};
}

std::vector<Sample> samples_from_csv_stream(std::istream& in) {
  std::vector<Sample> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto s = parse_sample_row(cols); s.has_value()) {
      out.push_back(*s);
    }
  }
  return out;
}

std::optional<std::vector<Sample>> load_samples_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return samples_from_csv_stream(f);
}

} // namespace rpace
