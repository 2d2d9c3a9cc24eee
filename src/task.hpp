// task.hpp

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

using Clock = std::chrono::steady_clock;

// Per-task execution accounting, written by the worker that runs the task.
struct TaskStats {
  uint64_t runs = 0;
  uint64_t failures = 0;

  int64_t latency_max_ns = 0;  // marked start -> body entry
  uint64_t latency_sum_ns = 0;

  int64_t exec_min_ns = 0;
  int64_t exec_max_ns = 0;
  uint64_t exec_sum_ns = 0;

  void observe(int64_t latency_ns, int64_t exec_ns, bool failed);
};

enum class HealthState : uint8_t { Healthy, Slow, Muted };

const char* to_str(HealthState state);

// Capabilities are tags, not subtypes. A task without Telemetry is ordinary.
enum class Capability : uint8_t {
  None = 0,
  Telemetry = 1 << 0,
  Critical = 1 << 1,  // blocked critical task stops the dispatch loop
};

constexpr Capability operator|(Capability a, Capability b) {
  return static_cast<Capability>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

class Task;

struct TaskSpec {
  std::string name;
  std::chrono::milliseconds interval{0};
  Capability caps = Capability::None;
  std::function<void(const Task&)> fn;
};

// A registered unit of work. The dispatch loop owns health state and marks
// the start time; the task clears its own in-progress flag when run() returns.
class Task {
  public:
    explicit Task(TaskSpec spec);

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    const std::string& name() const { return spec_.name; }
    std::chrono::milliseconds interval() const { return spec_.interval; }
    bool has(Capability cap) const;

    // Marks the task in progress; called right before submission.
    void set_start_time(Clock::time_point t);
    Clock::time_point start_time() const { return start_time_; }
    bool in_progress() const { return in_progress_.load(std::memory_order_acquire); }

    HealthState state() const { return state_.load(std::memory_order_relaxed); }
    void set_state(HealthState s) { state_.store(s, std::memory_order_relaxed); }

    bool contention_monitoring() const { return contention_.load(std::memory_order_relaxed); }
    void set_contention_monitoring(bool on) { contention_.store(on, std::memory_order_relaxed); }

    // Runs the body on the calling thread and clears in-progress afterwards,
    // also when the body throws.
    void run();

    TaskStats stats() const;

  private:
    TaskSpec spec_;
    Clock::time_point start_time_{};
    std::atomic<bool> in_progress_{false};
    std::atomic<HealthState> state_{HealthState::Healthy};
    std::atomic<bool> contention_{false};

    mutable std::mutex stats_mu_;
    TaskStats stats_;
};
