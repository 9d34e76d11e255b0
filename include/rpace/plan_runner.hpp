#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <rpace/event.hpp>
#include <rpace/geo.hpp>
#include <rpace/plan_buffer.hpp>
#include <rpace/profile.hpp>
#include <rpace/route.hpp>

namespace rpace {

// Both legs of one parameter set, computed from the same segments.
struct PlanSnapshot {
  std::uint64_t revision = 0;   // request counter that produced this plan
  AthleteProfile profile;
  std::optional<CyclingRoute> bike;
  std::optional<RunningRoute> run;
  std::optional<EventSummary> event;  // set when both legs computed
  std::string error;                  // first validation message, empty if none
};

using PlanBuffer = LatestBuffer<PlanSnapshot>;

// Synchronous full recompute; the running leg runs on a second thread.
PlanSnapshot compute_plan(const std::vector<Segment>& segments,
                          const AthleteProfile& profile,
                          std::uint64_t revision = 0);

// Owns the recompute thread and publishes plans.
class PlanRunner {
public:
  PlanRunner() = default;
  ~PlanRunner() { stop(); }
  PlanRunner(const PlanRunner&) = delete;
  PlanRunner& operator=(const PlanRunner&) = delete;

  void set_route(std::vector<Sample> samples); // call before start()
  const std::vector<Segment>& segments() const { return segments_; }
  const RouteProfile& route_profile() const { return route_profile_; }

  void start();
  void stop();

  // Safe from any thread. Pending requests coalesce to the newest one.
  void request(const AthleteProfile& p);

  PlanBuffer& buffer() { return buffer_; }
  const PlanBuffer& buffer() const { return buffer_; }

private:
  void thread_main_();

  std::thread th_;
  std::atomic<bool> running_{false};

  std::vector<Segment> segments_;
  RouteProfile route_profile_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<AthleteProfile> pending_;
  std::uint64_t next_revision_{0};
  std::uint64_t pending_revision_{0};

  PlanBuffer buffer_;
};

} // namespace rpace
