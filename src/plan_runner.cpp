#include <rpace/plan_runner.hpp>
#include <future>
#include <utility>

namespace rpace {

static std::optional<std::string> first_error(const AthleteProfile& p) {
  if (auto e = validate_rider(p.rider))             return e;
  if (auto e = validate_cycling_policy(p.cycling))  return e;
  if (auto e = validate_running_input(p.running))   return e;
  return std::nullopt;
}

PlanSnapshot compute_plan(const std::vector<Segment>& segments,
                          const AthleteProfile& profile,
                          std::uint64_t revision) {
  PlanSnapshot s;
  s.revision = revision;
  s.profile  = profile;
  if (auto e = first_error(profile)) {
    s.error = *e;
    return s;
  }

  // The legs share nothing but the read-only segments.
  auto run_task = std::async(std::launch::async, [&segments, &profile] {
    return compute_running_route(segments, profile.running);
  });
  s.bike = compute_cycling_route(segments, profile.rider, profile.cycling);
  s.run  = run_task.get();

  if (s.bike && s.run) {
    s.event = estimate_duathlon(*s.bike, *s.run, profile.transition_s);
  }
  return s;
}

void PlanRunner::set_route(std::vector<Sample> samples) {
  segments_ = segment_route(samples);
  route_profile_ = rpace::route_profile(samples);
}

void PlanRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&PlanRunner::thread_main_, this);
}

void PlanRunner::stop() {
  if (!running_.load()) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_.store(false);
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
}

void PlanRunner::request(const AthleteProfile& p) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_ = p;
    pending_revision_ = ++next_revision_;
  }
  cv_.notify_one();
}

void PlanRunner::thread_main_() {
  while (true) {
    AthleteProfile job;
    std::uint64_t rev = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this]{ return pending_.has_value() || !running_.load(); });
      if (!running_.load()) return;
      job = std::move(*pending_);
      rev = pending_revision_;
      pending_.reset();
    }
    buffer_.publish(compute_plan(segments_, job, rev));
  }
}

} // namespace rpace
