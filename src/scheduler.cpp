// scheduler.cpp
#include "scheduler.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "health.hpp"

using std::chrono::milliseconds;

const char* to_str(LoopExit exit) {
  switch (exit) {
    case LoopExit::TimeLimit: return "time limit reached";
    case LoopExit::CriticalTaskBlocked: return "critical collector blocked";
    default: return "unknown";
  }
}

Scheduler::Scheduler(StatsSink& stats, std::size_t worker_count)
    : stats_(stats), worker_count_(worker_count) {
  if (worker_count_ == 0) throw std::invalid_argument("scheduler needs at least one worker");
}

void Scheduler::add_task(std::shared_ptr<Task> task, Clock::time_point now) {
  if (!task) throw std::invalid_argument("cannot register a null task");
  if (started())
    throw std::logic_error("cannot register " + task->name() + " after the scheduler has started");
  for (auto& t : tasks_) {
    if (t.task->name() == task->name())
      throw std::invalid_argument("duplicate collector name " + task->name());
  }

  std::lock_guard<std::mutex> lk(controls_mu_);
  task->set_contention_monitoring(contention_monitoring_);
  auto interval = task->interval();
  tasks_.push_back(TaskRuntime{std::move(task), now + interval});
  if (interval < min_interval_) min_interval_ = interval;
}

void Scheduler::start() {
  if (pool_) return;
  if (tasks_.empty()) spdlog::warn("Starting collector scheduler with no registered collectors");

  // at most one outstanding submission per task, so the backlog never needs more
  auto backlog = std::max<std::size_t>(1, tasks_.size());
  pool_ = std::make_unique<WorkerPool>(worker_count_, backlog);
  spdlog::info("Collector scheduler started: {} collectors, {} workers, min interval {}ms",
               tasks_.size(), worker_count_, min_interval_.count());
}

LoopExit Scheduler::run() {
  return loop(std::nullopt);
}

LoopExit Scheduler::run_for(milliseconds dur) {
  return loop(Clock::now() + dur);
}

LoopExit Scheduler::loop(std::optional<Clock::time_point> end) {
  name_current_thread(kThreadName);
  start();
  auto prev_start = Clock::now();

  for (;;) {
    try {
      // sleep the remainder of the min interval, measured from the last wake
      auto elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - prev_start);
      auto to_sleep = min_interval_ - elapsed;
      if (end) to_sleep = std::min(to_sleep, std::chrono::ceil<milliseconds>(*end - Clock::now()));
      if (to_sleep.count() > 0) std::this_thread::sleep_for(to_sleep);
    } catch (const std::exception& ex) {
      spdlog::error("Exception in scheduler sleep: {}", ex.what());
    }

    prev_start = Clock::now();
    if (end && prev_start >= *end) return LoopExit::TimeLimit;

    if (!tick(prev_start)) {
      spdlog::info("Collector scheduler stopped: {}", to_str(LoopExit::CriticalTaskBlocked));
      return LoopExit::CriticalTaskBlocked;
    }
  }
}

bool Scheduler::tick(Clock::time_point now) {
  if (!enabled()) return true;
  start();

  for (auto& t : tasks_) {
    if (t.next_due > now) continue;
    if (!dispatch(t, now, mode())) return false;
  }
  return true;
}

bool Scheduler::dispatch(TaskRuntime& t, Clock::time_point now, CollectorMode mode) {
  Task& task = *t.task;
  // the slot is consumed whether or not the task runs
  t.next_due += task.interval();

  if (task.state() == HealthState::Muted) {
    stats_.record(SchedEvent::Muted, task.name());
    return true;
  }

  if (!can_schedule(task, mode)) {
    spdlog::debug("Skipping {} collector execution since running in collector mode {}",
                  task.name(), to_str(mode));
    stats_.record(SchedEvent::SkippedForMode, task.name());
    return true;
  }

  if (!task.in_progress()) {
    task.set_start_time(now);
    pool_->submit([job = t.task] { job->run(); });
    return true;
  }

  auto outcome = on_overrun(task);
  if (outcome.action == OverrunAction::StopScheduler) {
    spdlog::critical("{} is still in progress; it is critical and cannot be skipped", task.name());
    return false;
  }
  if (outcome.next != task.state()) {
    spdlog::info("Collector {} {} -> {}", task.name(), to_str(task.state()), to_str(outcome.next));
    task.set_state(outcome.next);
  }
  if (outcome.report_slow) stats_.record(SchedEvent::MarkedSlow, task.name());

  spdlog::info("Collector {} is still in progress, so skipping this interval", task.name());
  stats_.record(SchedEvent::SkippedInProgress, task.name());
  return true;
}

void Scheduler::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> lk(controls_mu_);
  if (enabled_ != enabled) spdlog::info("Collector scheduler {}", enabled ? "enabled" : "disabled");
  enabled_ = enabled;
}

bool Scheduler::enabled() const {
  std::lock_guard<std::mutex> lk(controls_mu_);
  return enabled_;
}

void Scheduler::set_mode(CollectorMode mode) {
  std::lock_guard<std::mutex> lk(controls_mu_);
  if (mode_ != mode) spdlog::info("Collector mode {} -> {}", to_str(mode_), to_str(mode));
  mode_ = mode;
}

CollectorMode Scheduler::mode() const {
  std::lock_guard<std::mutex> lk(controls_mu_);
  return mode_;
}

void Scheduler::set_contention_monitoring(bool enabled) {
  std::lock_guard<std::mutex> lk(controls_mu_);
  for (auto& t : tasks_) t.task->set_contention_monitoring(enabled);
  contention_monitoring_ = enabled;
}

bool Scheduler::contention_monitoring() const {
  std::lock_guard<std::mutex> lk(controls_mu_);
  return contention_monitoring_;
}

std::optional<Clock::time_point> Scheduler::next_due(const std::string& name) const {
  for (auto& t : tasks_) {
    if (t.task->name() == name) return t.next_due;
  }
  return std::nullopt;
}
