#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rpace/power.hpp>
#include <rpace/cycling.hpp>
#include <rpace/running.hpp>

namespace rpace {

inline constexpr double kMaxFatigue = 0.20;

// One athlete + equipment setup with default effort targets.
struct AthleteProfile {
  std::string key;          // e.g., "road"
  RiderParams rider;
  CyclingPolicy cycling;
  RunningInput running;     // pace XOR speed
  double transition_s = 0.0;
};

// Built-in tiny catalog (default/fallback).
const std::vector<AthleteProfile>& profile_catalog();

// Lookup helpers
std::optional<AthleteProfile> profile_by_key(const std::string& key);
std::optional<AthleteProfile> profile_by_key_in(const std::vector<AthleteProfile>& cat,
                                                const std::string& key);

// Columns: key,mass_kg,cda_m2,crr,critical_power_w,target_power_w,
//          base_pace_s_per_km,run_speed_kmh,fatigue,transition_s
// Exactly one of base_pace_s_per_km / run_speed_kmh must be non-empty.
// Header row optional; '#' comments and blank lines ignored; invalid rows skipped.
// Fatigue is clamped to [0, kMaxFatigue], transition to >= 0.
std::vector<AthleteProfile> profile_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<AthleteProfile>> load_profile_catalog_csv(const std::string& path);

} // namespace rpace
