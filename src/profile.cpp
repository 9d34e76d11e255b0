#include <rpace/profile.hpp>
#include <algorithm>
#include <fstream>
#include <rpace/csv.hpp>

namespace rpace {

static constexpr std::size_t kProfileColumns = 10;

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < kProfileColumns) return false;
  return (cols[0] == "key" || cols[0] == "Key");
}

static std::optional<AthleteProfile> parse_profile_row(const std::vector<std::string>& cols) {
  if (cols.size() < kProfileColumns) return std::nullopt;
  if (cols[0].empty()) return std::nullopt;

  const auto mass   = parse_double(cols[1]);
  const auto cda    = parse_double(cols[2]);
  const auto crr    = parse_double(cols[3]);
  const auto cp     = parse_double(cols[4]);
  const auto target = parse_double(cols[5]);
  if (!(mass && cda && crr && cp && target)) return std::nullopt;
  if (*mass <= 0.0 || *cda <= 0.0 || *crr <= 0.0 || *target < 0.0) return std::nullopt;

  AthleteProfile p;
  p.key     = cols[0];
  p.rider   = RiderParams{*mass, *cda, *crr};
  p.cycling = CyclingPolicy{*target, *cp};

  // Pace and speed are mutually exclusive sources.
  const bool has_pace  = !cols[6].empty();
  const bool has_speed = !cols[7].empty();
  if (has_pace == has_speed) return std::nullopt;
  if (has_pace) {
    const auto pace = parse_double(cols[6]);
    if (!pace || *pace <= 0.0) return std::nullopt;
    p.running.base_pace_s_per_km = *pace;
  } else {
    const auto kmh = parse_double(cols[7]);
    if (!kmh || *kmh <= 0.0) return std::nullopt;
    p.running.speed_kmh = *kmh;
  }

  const auto fatigue = cols[8].empty() ? std::optional<double>(0.0) : parse_double(cols[8]);
  const auto trans   = cols[9].empty() ? std::optional<double>(0.0) : parse_double(cols[9]);
  if (!fatigue || !trans) return std::nullopt;
  p.running.fatigue = std::clamp(*fatigue, 0.0, kMaxFatigue);
  p.transition_s    = std::max(0.0, *trans);
  return p;
}

static std::vector<AthleteProfile> make_catalog_builtin() {
  std::vector<AthleteProfile> cat(3);
  cat[0].key = "road";
  cat[0].rider = RiderParams{80.0, 0.32, 0.0040};
  cat[0].cycling = CyclingPolicy{200.0, 250.0};
  cat[0].running.base_pace_s_per_km = 300.0;
  cat[0].running.fatigue = 0.05;
  cat[0].transition_s = 60.0;

  cat[1].key = "tt";
  cat[1].rider = RiderParams{78.0, 0.24, 0.0035};
  cat[1].cycling = CyclingPolicy{240.0, 280.0};
  cat[1].running.base_pace_s_per_km = 270.0;
  cat[1].running.fatigue = 0.08;
  cat[1].transition_s = 45.0;

  cat[2].key = "mtb";
  cat[2].rider = RiderParams{88.0, 0.45, 0.0120};
  cat[2].cycling = CyclingPolicy{180.0, 230.0};
  cat[2].running.speed_kmh = 10.0;
  cat[2].running.fatigue = 0.10;
  cat[2].transition_s = 90.0;
  return cat;
}

const std::vector<AthleteProfile>& profile_catalog() {
  static const std::vector<AthleteProfile> cat = make_catalog_builtin();
  return cat;
}

std::optional<AthleteProfile> profile_by_key(const std::string& key) {
  return profile_by_key_in(profile_catalog(), key);
}

std::optional<AthleteProfile> profile_by_key_in(const std::vector<AthleteProfile>& cat,
                                                const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const AthleteProfile& p){ return p.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<AthleteProfile> profile_catalog_from_csv_stream(std::istream& in) {
  std::vector<AthleteProfile> out;
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

    if (auto row = parse_profile_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<AthleteProfile>> load_profile_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return profile_catalog_from_csv_stream(f);
}

} // namespace rpace
