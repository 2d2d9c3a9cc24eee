// scheduler.hpp

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "admission.hpp"
#include "stats_sink.hpp"
#include "task.hpp"
#include "worker_pool.hpp"

struct TaskRuntime {
  std::shared_ptr<Task> task;
  Clock::time_point next_due;
};

enum class LoopExit { TimeLimit, CriticalTaskBlocked };

const char* to_str(LoopExit exit);

class Scheduler {
  public:
    static constexpr std::size_t kDefaultWorkerCount = 5;
    static constexpr const char* kThreadName = "CollectorSched";

    explicit Scheduler(StatsSink& stats, std::size_t worker_count = kDefaultWorkerCount);

    // Setup only: throws std::logic_error once the loop has started.
    void add_task(std::shared_ptr<Task> task, Clock::time_point now = Clock::now());

    // Creates the worker pool, sized to the registered tasks. Idempotent.
    void start();

    // Runs on the calling thread, renamed kThreadName, until a critical
    // task is found blocked.
    LoopExit run();
    LoopExit run_for(std::chrono::milliseconds dur);

    // One evaluation pass at `now`. Returns false when the loop must stop.
    bool tick(Clock::time_point now);

    // operating controls, safe to call from any thread
    void set_enabled(bool enabled);
    bool enabled() const;
    void set_mode(CollectorMode mode);
    CollectorMode mode() const;
    void set_contention_monitoring(bool enabled);
    bool contention_monitoring() const;

    const std::vector<TaskRuntime>& tasks() const { return tasks_; }
    std::optional<Clock::time_point> next_due(const std::string& name) const;
    std::chrono::milliseconds min_interval() const { return min_interval_; }
    bool started() const { return pool_ != nullptr; }

  private:
    LoopExit loop(std::optional<Clock::time_point> end);
    bool dispatch(TaskRuntime& t, Clock::time_point now, CollectorMode mode);

    StatsSink& stats_;
    std::size_t worker_count_;
    std::unique_ptr<WorkerPool> pool_;

    std::vector<TaskRuntime> tasks_;
    std::chrono::milliseconds min_interval_ = std::chrono::milliseconds::max();

    mutable std::mutex controls_mu_;
    bool enabled_ = false;
    CollectorMode mode_ = CollectorMode::Rca;
    bool contention_monitoring_ = false;
};
