#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <rpace/plan_runner.hpp>
#include <rpace/profile.hpp>

namespace rpace {

// RAII application that charts the latest published plan and its HUD.
class ViewerApp {
public:
  ViewerApp(PlanRunner& runner, std::vector<AthleteProfile> catalog, std::size_t start_index = 0);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_plans_();
  void submit_();
  // Rendering
  void render_frame_();
  void draw_elevation_(float x, float y, float w, float h);
  void draw_time_chart_(float x, float y, float w, float h);
  void draw_hud_();

  // Dependencies
  PlanRunner& runner_;
  std::vector<AthleteProfile> catalog_;

  // Parameters being edited (starts from catalog_[index_])
  std::size_t index_{0};
  AthleteProfile edit_{};

  // Latest plan received from the runner
  PlanSnapshot plan_{};
  std::uint64_t cursor_{0};

  std::string status_;
};

} // namespace rpace
