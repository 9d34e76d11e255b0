#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <rpace/viewer/app.hpp>
#include <rpace/export.hpp>

namespace rpace {

namespace {

static constexpr float kMargin      = 60.0f;
static constexpr float kHudHeight   = 120.0f;
static constexpr double kPowerStepW = 5.0;
static constexpr double kPaceStepS  = 5.0;
static constexpr double kSpeedStepK = 0.2;
static constexpr double kFatigueStep = 0.05;

static const Color kBg       {24, 26, 30, 255};
static const Color kAxis     {120, 125, 135, 255};
static const Color kText     {220, 225, 230, 255};
static const Color kElev     {46, 204, 113, 255};
static const Color kBike     {52, 152, 219, 255};
static const Color kRun      {241, 196, 15, 255};
static const Color kError    {231, 76, 60, 255};

static void fmt_hms(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  const long t = (long)(s + 0.5);
  std::snprintf(out, (size_t)cap, "%ld:%02ld:%02ld", t / 3600, (t / 60) % 60, t % 60);
}

static void fmt_pace(double s_per_km, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s_per_km <= 0.0 || !std::isfinite(s_per_km)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  const int t = (int)(s_per_km + 0.5);
  std::snprintf(out, (size_t)cap, "%d:%02d/km", t / 60, t % 60);
}

// Polyline of (xs[i], ys[i]) mapped into the rectangle; x range [0, x_max], y range [y_min, y_max].
static void draw_series(const std::vector<double>& xs, const std::vector<double>& ys,
                        double x_max, double y_min, double y_max,
                        float x, float y, float w, float h, Color c) {
  const std::size_t n = std::min(xs.size(), ys.size());
  if (n < 2 || x_max <= 0.0 || y_max <= y_min) return;
  auto map = [&](std::size_t i) {
    return Vector2{ x + float(xs[i] / x_max) * w,
                    y + h - float((ys[i] - y_min) / (y_max - y_min)) * h };
  };
  Vector2 prev = map(0);
  for (std::size_t i = 1; i < n; ++i) {
    const Vector2 cur = map(i);
    DrawLineEx(prev, cur, 2.0f, c);
    prev = cur;
  }
}

static void draw_frame(float x, float y, float w, float h, const char* title) {
  DrawRectangleLinesEx(Rectangle{x, y, w, h}, 1.0f, kAxis);
  DrawText(title, (int)x, (int)y - 20, 16, kText);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(PlanRunner& runner, std::vector<AthleteProfile> catalog, std::size_t start_index)
  : runner_(runner), catalog_(std::move(catalog)) {
  if (catalog_.empty()) catalog_ = profile_catalog();
  index_ = start_index < catalog_.size() ? start_index : 0;
  edit_ = catalog_[index_];
}

void ViewerApp::submit_() {
  runner_.request(edit_);
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "routepace - viewer");
  SetTargetFPS(60);

  submit_();
  while (!WindowShouldClose()) {
    process_input_();
    pump_plans_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  bool changed = false;

  // Cycling target power
  if (IsKeyPressed(KEY_UP))   { edit_.cycling.target_power_w += kPowerStepW; changed = true; }
  if (IsKeyPressed(KEY_DOWN)) {
    edit_.cycling.target_power_w = std::max(0.0, edit_.cycling.target_power_w - kPowerStepW);
    changed = true;
  }

  // Running base pace (or reference speed, whichever the profile is driven by)
  const int dir = IsKeyPressed(KEY_RIGHT) ? +1 : (IsKeyPressed(KEY_LEFT) ? -1 : 0);
  if (dir != 0) {
    if (edit_.running.base_pace_s_per_km) {
      // Right = faster = fewer seconds per km
      *edit_.running.base_pace_s_per_km = std::max(60.0, *edit_.running.base_pace_s_per_km - dir * kPaceStepS);
    } else if (edit_.running.speed_kmh) {
      *edit_.running.speed_kmh = std::max(1.0, *edit_.running.speed_kmh + dir * kSpeedStepK);
    }
    changed = true;
  }

  // Fatigue cycles 0 -> 0.05 -> ... -> kMaxFatigue -> 0
  if (IsKeyPressed(KEY_F)) {
    double f = edit_.running.fatigue + kFatigueStep;
    if (f > kMaxFatigue + 1e-9) f = 0.0;
    edit_.running.fatigue = f;
    changed = true;
  }

  // Next profile resets edits
  if (IsKeyPressed(KEY_P)) {
    index_ = (index_ + 1) % catalog_.size();
    edit_ = catalog_[index_];
    changed = true;
  }
  if (IsKeyPressed(KEY_R)) {
    edit_ = catalog_[index_];
    changed = true;
  }

  // Export latest plan
  if (IsKeyPressed(KEY_E)) {
    bool ok = true;
    if (plan_.bike) ok = save_cycling_csv("routepace_bike.csv", *plan_.bike) && ok;
    if (plan_.run)  ok = save_running_csv("routepace_run.csv", *plan_.run) && ok;
    status_ = ok ? "saved routepace_bike.csv, routepace_run.csv" : "export failed";
    TraceLog(ok ? LOG_INFO : LOG_WARNING, "routepace: %s", status_.c_str());
  }

  if (changed) submit_();
}

void ViewerApp::pump_plans_() {
  runner_.buffer().try_consume_latest(cursor_, plan_);
}

void ViewerApp::render_frame_() {
  const float W = (float)GetScreenWidth();
  const float H = (float)GetScreenHeight();
  const float chart_w = W - 2.0f * kMargin;
  const float chart_h = (H - kHudHeight - 3.0f * kMargin) * 0.5f;

  BeginDrawing();
  ClearBackground(kBg);

  draw_elevation_(kMargin, kHudHeight + kMargin, chart_w, chart_h);
  draw_time_chart_(kMargin, kHudHeight + 2.0f * kMargin + chart_h, chart_w, chart_h);
  draw_hud_();

  EndDrawing();
}

void ViewerApp::draw_elevation_(float x, float y, float w, float h) {
  const auto& prof = runner_.route_profile();
  draw_frame(x, y, w, h, "Elevation (m) vs distance (km)");
  if (prof.distance_km.size() < 2) return;

  const auto [lo, hi] = std::minmax_element(prof.ele_m.begin(), prof.ele_m.end());
  double y_min = *lo, y_max = *hi;
  if (y_max - y_min < 10.0) { y_max = y_min + 10.0; } // keep flat routes readable
  draw_series(prof.distance_km, prof.ele_m, prof.distance_km.back(), y_min, y_max, x, y, w, h, kElev);

  DrawText(TextFormat("%.0f", y_max), (int)(x - 45), (int)y, 14, kAxis);
  DrawText(TextFormat("%.0f", y_min), (int)(x - 45), (int)(y + h - 14), 14, kAxis);
  DrawText(TextFormat("%.1f", prof.distance_km.back()), (int)(x + w - 30), (int)(y + h + 4), 14, kAxis);
}

void ViewerApp::draw_time_chart_(float x, float y, float w, float h) {
  draw_frame(x, y, w, h, "Cumulative time (min) vs distance (km)   bike: blue  run: yellow");

  double x_max = 0.0, t_max = 0.0;
  if (plan_.bike && !plan_.bike->series.distance_km.empty()) {
    x_max = std::max(x_max, plan_.bike->series.distance_km.back());
    t_max = std::max(t_max, plan_.bike->series.time_min.back());
  }
  if (plan_.run && !plan_.run->series.distance_km.empty()) {
    x_max = std::max(x_max, plan_.run->series.distance_km.back());
    t_max = std::max(t_max, plan_.run->series.time_min.back());
  }
  if (x_max <= 0.0 || t_max <= 0.0) return;

  if (plan_.bike) draw_series(plan_.bike->series.distance_km, plan_.bike->series.time_min,
                              x_max, 0.0, t_max, x, y, w, h, kBike);
  if (plan_.run)  draw_series(plan_.run->series.distance_km, plan_.run->series.time_min,
                              x_max, 0.0, t_max, x, y, w, h, kRun);

  DrawText(TextFormat("%.0f", t_max), (int)(x - 45), (int)y, 14, kAxis);
  DrawText("0", (int)(x - 20), (int)(y + h - 14), 14, kAxis);
  DrawText(TextFormat("%.1f", x_max), (int)(x + w - 30), (int)(y + h + 4), 14, kAxis);
}

void ViewerApp::draw_hud_() {
  char pace_in[32];
  if (edit_.running.base_pace_s_per_km) fmt_pace(*edit_.running.base_pace_s_per_km, pace_in, sizeof(pace_in));
  else if (edit_.running.speed_kmh)     std::snprintf(pace_in, sizeof(pace_in), "%.1f km/h", *edit_.running.speed_kmh);
  else                                  std::snprintf(pace_in, sizeof(pace_in), "%s", "--");

  DrawText(TextFormat("profile=%s  target=%.0fW  CP=%.0fW  run=%s  fatigue=%.0f%%  rev=%llu",
                      edit_.key.c_str(),
                      edit_.cycling.target_power_w,
                      edit_.cycling.critical_power_w,
                      pace_in,
                      edit_.running.fatigue * 100.0,
                      (unsigned long long)plan_.revision),
           20, 14, 20, kText);

  if (!plan_.error.empty()) {
    DrawText(plan_.error.c_str(), 20, 42, 18, kError);
  } else {
    char bike_t[32] = "--", run_t[32] = "--", total_t[32] = "--", run_p[32] = "--";
    if (plan_.bike) fmt_hms(plan_.bike->summary.total_time_h * 3600.0, bike_t, sizeof(bike_t));
    if (plan_.run) {
      fmt_hms(plan_.run->summary.total_time_h * 3600.0, run_t, sizeof(run_t));
      if (plan_.run->summary.avg_pace_min_per_km) {
        fmt_pace(*plan_.run->summary.avg_pace_min_per_km * 60.0, run_p, sizeof(run_p));
      }
    }
    if (plan_.event) fmt_hms(plan_.event->total_s, total_t, sizeof(total_t));

    if (plan_.bike) {
      const auto& s = plan_.bike->summary;
      DrawText(TextFormat("Bike %.2f km  %s  avg %.0fW  IF %.2f  TSS %.0f",
                          s.total_distance_km, bike_t, s.avg_power_w, s.intensity_factor, s.tss),
               20, 42, 18, kBike);
    }
    DrawText(TextFormat("Run %s  avg %s     Event total %s", run_t, run_p, total_t),
             20, 66, 18, kRun);
  }

  DrawText("Up/Down: Target power | Left/Right: Run pace | F: Fatigue | P: Next profile | R: Reset | E: Export CSV",
           20, 92, 14, kAxis);
  if (!status_.empty()) {
    DrawText(status_.c_str(), GetScreenWidth() - 20 - MeasureText(status_.c_str(), 14), 92, 14, kText);
  }
}

} // namespace rpace
