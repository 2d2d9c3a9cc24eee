#include <catch2/catch.hpp>

#include "health.hpp"

TEST_CASE("first overrun marks a healthy collector slow and reports it", "[health]") {
  auto out = on_overrun(HealthState::Healthy, false);
  CHECK(out.action == OverrunAction::Demote);
  CHECK(out.next == HealthState::Slow);
  CHECK(out.report_slow);
}

TEST_CASE("second overrun mutes a slow collector silently", "[health]") {
  auto out = on_overrun(HealthState::Slow, false);
  CHECK(out.action == OverrunAction::Demote);
  CHECK(out.next == HealthState::Muted);
  CHECK_FALSE(out.report_slow);
}

TEST_CASE("muted is terminal", "[health]") {
  auto out = on_overrun(HealthState::Muted, false);
  CHECK(out.next == HealthState::Muted);
  CHECK_FALSE(out.report_slow);
}

TEST_CASE("blocked critical collector stops the scheduler without demotion", "[health]") {
  for (auto s : {HealthState::Healthy, HealthState::Slow}) {
    auto out = on_overrun(s, true);
    CHECK(out.action == OverrunAction::StopScheduler);
    CHECK(out.next == s);
    CHECK_FALSE(out.report_slow);
  }
}

TEST_CASE("task overload reads state and critical capability", "[health]") {
  Task stats(TaskSpec{.name = "stats_collector",
                      .interval = std::chrono::milliseconds(60000),
                      .caps = Capability::Telemetry | Capability::Critical,
                      .fn = [](const Task&) {}});
  CHECK(on_overrun(stats).action == OverrunAction::StopScheduler);

  Task os(TaskSpec{.name = "os_metrics",
                   .interval = std::chrono::milliseconds(5000),
                   .fn = [](const Task&) {}});
  os.set_state(HealthState::Slow);
  CHECK(on_overrun(os).next == HealthState::Muted);
}
