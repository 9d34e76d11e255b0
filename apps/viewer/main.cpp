#include <cstdio>
#include <string>
#include <utility>
#include <rpace/plan_runner.hpp>
#include <rpace/profile.hpp>
#include <rpace/route.hpp>
#include <rpace/samples_csv.hpp>
#include <rpace/viewer/app.hpp>
#include <fmt/core.h>

using namespace rpace;

int main(int argc, char** argv) {
  if (argc < 2) {
    fmt::print(stderr, "usage: routepace_viewer ROUTE.csv [PROFILE_KEY]\n");
    return 2;
  }

  auto samples = load_samples_csv(argv[1]);
  if (!samples) {
    fmt::print(stderr, "[error] cannot open route {}\n", argv[1]);
    return 1;
  }
  if (auto err = validate_samples(*samples)) {
    fmt::print(stderr, "[error] {}: {}\n", argv[1], *err);
    return 1;
  }

  const auto& cat = profile_catalog();
  std::size_t start = 0;
  if (argc >= 3) {
    const std::string key = argv[2];
    bool found = false;
    for (std::size_t i = 0; i < cat.size(); ++i) {
      if (cat[i].key == key) { start = i; found = true; }
    }
    if (!found) fmt::print(stderr, "[warn] unknown profile '{}', using '{}'\n", key, cat[start].key);
  }

  PlanRunner runner;
  runner.set_route(std::move(*samples));
  runner.start();

  ViewerApp app(runner, cat, start);
  const int code = app.run();

  runner.stop();
  return code;
}
