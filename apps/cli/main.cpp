#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>

#include <rpace/csv.hpp>
#include <rpace/event.hpp>
#include <rpace/export.hpp>
#include <rpace/geo.hpp>
#include <rpace/profile.hpp>
#include <rpace/route.hpp>
#include <rpace/samples_csv.hpp>

using namespace rpace;

namespace {

enum class Mode { Bike, Run, Both };

struct Options {
  std::string route;                 // --route track.csv
  std::string profile_key = "road";  // --profile road|tt|mtb|<csv key>
  std::string profiles_csv;          // --profiles athletes.csv
  std::optional<double> target_power, critical_power;
  std::optional<double> pace, speed; // mutually exclusive overrides
  std::optional<double> fatigue, transition;
  std::string bike_csv, run_csv;     // --bike-csv / --run-csv
  Mode mode = Mode::Both;
};

void usage() {
  fmt::print(stderr,
    "usage: routepace_cli --route FILE [--profile KEY] [--profiles FILE]\n"
    "                     [--target-power W] [--critical-power W]\n"
    "                     [--pace S_PER_KM | --speed KMH] [--fatigue F] [--transition S]\n"
    "                     [--bike-csv OUT] [--run-csv OUT] [--mode bike|run|both]\n");
}

std::optional<Options> parse(int argc, char** argv) {
  Options o;
  for (int i = 1; i < argc; ++i) {
    const std::string a(argv[i]);
    auto text = [&](std::string& tgt) {
      if (i + 1 >= argc) { fmt::print(stderr, "[error] missing value after {}\n", a); return false; }
      tgt = argv[++i];
      return true;
    };
    auto number = [&](std::optional<double>& tgt) {
      std::string v;
      if (!text(v)) return false;
      tgt = parse_double(v);
      if (!tgt) fmt::print(stderr, "[error] {} expects a number, got '{}'\n", a, v);
      return tgt.has_value();
    };

    bool ok = true;
    if (a == "--route")               ok = text(o.route);
    else if (a == "--profile")        ok = text(o.profile_key);
    else if (a == "--profiles")       ok = text(o.profiles_csv);
    else if (a == "--target-power")   ok = number(o.target_power);
    else if (a == "--critical-power") ok = number(o.critical_power);
    else if (a == "--pace")           ok = number(o.pace);
    else if (a == "--speed")          ok = number(o.speed);
    else if (a == "--fatigue")        ok = number(o.fatigue);
    else if (a == "--transition")     ok = number(o.transition);
    else if (a == "--bike-csv")       ok = text(o.bike_csv);
    else if (a == "--run-csv")        ok = text(o.run_csv);
    else if (a == "--mode") {
      std::string m;
      ok = text(m);
      if (ok) {
        if (m == "bike")      o.mode = Mode::Bike;
        else if (m == "run")  o.mode = Mode::Run;
        else if (m == "both") o.mode = Mode::Both;
        else { fmt::print(stderr, "[error] unknown mode '{}'\n", m); ok = false; }
      }
    } else if (a == "--help" || a == "-h") {
      return std::nullopt;
    } else {
      fmt::print(stderr, "[error] unknown arg: {}\n", a);
      ok = false;
    }
    if (!ok) return std::nullopt;
  }
  if (o.route.empty()) {
    fmt::print(stderr, "[error] --route is required\n");
    return std::nullopt;
  }
  if (o.pace && o.speed) {
    fmt::print(stderr, "[error] --pace and --speed are mutually exclusive\n");
    return std::nullopt;
  }
  return o;
}

std::optional<AthleteProfile> resolve_profile(const Options& o) {
  std::optional<AthleteProfile> p;
  if (!o.profiles_csv.empty()) {
    auto cat = load_profile_catalog_csv(o.profiles_csv);
    if (!cat) {
      fmt::print(stderr, "[error] cannot open profile catalog {}\n", o.profiles_csv);
      return std::nullopt;
    }
    fmt::print(stderr, "[info] loaded {} profiles from {}\n", cat->size(), o.profiles_csv);
    p = profile_by_key_in(*cat, o.profile_key);
  } else {
    p = profile_by_key(o.profile_key);
  }
  if (!p) {
    fmt::print(stderr, "[error] unknown profile '{}'\n", o.profile_key);
    return std::nullopt;
  }

  if (o.target_power)   p->cycling.target_power_w = *o.target_power;
  if (o.critical_power) p->cycling.critical_power_w = *o.critical_power;
  if (o.pace)  { p->running.base_pace_s_per_km = *o.pace;  p->running.speed_kmh.reset(); }
  if (o.speed) { p->running.speed_kmh = *o.speed; p->running.base_pace_s_per_km.reset(); }
  if (o.fatigue) {
    if (*o.fatigue < 0.0 || *o.fatigue > kMaxFatigue) {
      fmt::print(stderr, "[warn] fatigue {:.2f} outside [0, {:.2f}], clamped\n", *o.fatigue, kMaxFatigue);
    }
    p->running.fatigue = std::clamp(*o.fatigue, 0.0, kMaxFatigue);
  }
  if (o.transition) p->transition_s = std::max(0.0, *o.transition);
  return p;
}

std::string hms(double seconds) {
  const long total = static_cast<long>(seconds + 0.5);
  return fmt::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

void print_bike(const CyclingRoute& r) {
  fmt::print("Bike\n");
  fmt::print("  distance   {:>10.2f} km\n", r.summary.total_distance_km);
  fmt::print("  time       {:>10}\n", hms(r.summary.total_time_h * 3600.0));
  fmt::print("  avg power  {:>10.1f} W\n", r.summary.avg_power_w);
  fmt::print("  IF         {:>10.3f}\n", r.summary.intensity_factor);
  fmt::print("  TSS        {:>10.1f}\n", r.summary.tss);
}

void print_run(const RunningRoute& r) {
  fmt::print("Run\n");
  fmt::print("  distance   {:>10.2f} km\n", r.summary.total_distance_km);
  fmt::print("  time       {:>10}\n", hms(r.summary.total_time_h * 3600.0));
  if (r.summary.avg_pace_min_per_km) {
    const double pace_s = *r.summary.avg_pace_min_per_km * 60.0;
    fmt::print("  avg pace   {:>10} /km\n",
               fmt::format("{}:{:02}", static_cast<int>(pace_s) / 60, static_cast<int>(pace_s) % 60));
  } else {
    fmt::print("  avg pace   {:>10}\n", "--");
  }
}

} // namespace

int main(int argc, char** argv) {
  const auto opts = parse(argc, argv);
  if (!opts) { usage(); return 2; }

  const auto samples = load_samples_csv(opts->route);
  if (!samples) {
    fmt::print(stderr, "[error] cannot open route {}\n", opts->route);
    return 1;
  }
  if (auto err = validate_samples(*samples)) {
    fmt::print(stderr, "[error] {}: {}\n", opts->route, *err);
    return 1;
  }

  const auto profile = resolve_profile(*opts);
  if (!profile) return 1;

  const auto segments = segment_route(*samples);
  const auto elev = elevation_totals(*samples);
  fmt::print("Route {}: {} samples, {} segments, +{:.0f} m / -{:.0f} m\n",
             opts->route, samples->size(), segments.size(), elev.ascent_m, elev.descent_m);

  std::optional<CyclingRoute> bike;
  std::optional<RunningRoute> run;

  if (opts->mode != Mode::Run) {
    if (auto err = validate_rider(profile->rider)) {
      fmt::print(stderr, "[error] profile '{}': {}\n", profile->key, *err); return 1;
    }
    if (auto err = validate_cycling_policy(profile->cycling)) {
      fmt::print(stderr, "[error] profile '{}': {}\n", profile->key, *err); return 1;
    }
    bike = compute_cycling_route(segments, profile->rider, profile->cycling);
    if (!bike) return 1;
    print_bike(*bike);
    if (!opts->bike_csv.empty()) {
      if (!save_cycling_csv(opts->bike_csv, *bike)) {
        fmt::print(stderr, "[error] cannot write {}\n", opts->bike_csv); return 1;
      }
      fmt::print(stderr, "[info] wrote {}\n", opts->bike_csv);
    }
  }

  if (opts->mode != Mode::Bike) {
    if (auto err = validate_running_input(profile->running)) {
      fmt::print(stderr, "[error] profile '{}': {}\n", profile->key, *err); return 1;
    }
    run = compute_running_route(segments, profile->running);
    if (!run) return 1;
    print_run(*run);
    if (!opts->run_csv.empty()) {
      if (!save_running_csv(opts->run_csv, *run)) {
        fmt::print(stderr, "[error] cannot write {}\n", opts->run_csv); return 1;
      }
      fmt::print(stderr, "[info] wrote {}\n", opts->run_csv);
    }
  }

  if (bike && run) {
    const auto e = estimate_duathlon(*bike, *run, profile->transition_s);
    fmt::print("Event\n");
    fmt::print("  bike       {:>10}\n", hms(e.bike_s));
    fmt::print("  transition {:>10}\n", hms(e.transition_s));
    fmt::print("  run        {:>10}\n", hms(e.run_s));
    fmt::print("  total      {:>10}\n", hms(e.total_s));
  }
  return 0;
}
