// task.cpp
#include "task.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

static inline int64_t ns_between(Clock::time_point a, Clock::time_point b) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(b - a).count();
}

void TaskStats::observe(int64_t latency_ns, int64_t exec_ns, bool failed) {
  runs++;
  if (runs == 1) {
    exec_min_ns = exec_max_ns = exec_ns;
  } else {
    exec_min_ns = std::min(exec_min_ns, exec_ns);
    exec_max_ns = std::max(exec_max_ns, exec_ns);
  }
  latency_max_ns = std::max(latency_max_ns, latency_ns);
  latency_sum_ns += (latency_ns < 0 ? 0ULL : static_cast<uint64_t>(latency_ns));
  exec_sum_ns += static_cast<uint64_t>(exec_ns);
  if (failed) failures++;
}

const char* to_str(HealthState state) {
  switch (state) {
    case HealthState::Healthy: return "HEALTHY";
    case HealthState::Slow: return "SLOW";
    case HealthState::Muted: return "MUTED";
    default: return "UNKNOWN";
  }
}

Task::Task(TaskSpec spec) : spec_(std::move(spec)) {
  if (spec_.name.empty()) throw std::invalid_argument("task name must not be empty");
  if (spec_.interval.count() <= 0)
    throw std::invalid_argument("task " + spec_.name + ": interval must be positive");
  if (!spec_.fn) throw std::invalid_argument("task " + spec_.name + ": no run function");
}

bool Task::has(Capability cap) const {
  return (static_cast<uint8_t>(spec_.caps) & static_cast<uint8_t>(cap)) != 0;
}

void Task::set_start_time(Clock::time_point t) {
  start_time_ = t;
  in_progress_.store(true, std::memory_order_release);
}

void Task::run() {
  auto begin = Clock::now();
  bool failed = false;
  try {
    spec_.fn(*this);
  } catch (const std::exception& ex) {
    failed = true;
    spdlog::error("Collector {} failed: {}", spec_.name, ex.what());
  } catch (...) {
    failed = true;
    spdlog::error("Collector {} failed with a non-standard exception", spec_.name);
  }
  auto finish = Clock::now();

  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    stats_.observe(ns_between(start_time_, begin), ns_between(begin, finish), failed);
  }
  in_progress_.store(false, std::memory_order_release);
}

TaskStats Task::stats() const {
  std::lock_guard<std::mutex> lk(stats_mu_);
  return stats_;
}
