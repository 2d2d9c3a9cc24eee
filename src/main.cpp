#include "options.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

static void burn_cpu(std::chrono::milliseconds d) {
  auto start = std::chrono::steady_clock::now();
  volatile double x = 0.0;
  while (std::chrono::steady_clock::now() - start < d) {
    x += std::sin(x + 0.001);
  }
}

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--mode rca|telemetry|dual] [--workers N] [--seconds N] [--overload]"
               " [--log-level trace|debug|info|warn|error]\n";
}

int main(int argc, char** argv) {
  auto opts = parse_options(argc, argv);
  if (!opts) {
    usage(argv[0]);
    return 2;
  }
  spdlog::set_level(opts->log_level);

  CounterSink stats;
  try {
    Scheduler sched(stats, opts->workers);

    // 100ms host metrics
    sched.add_task(std::make_shared<Task>(TaskSpec{
        .name = "os_metrics",
        .interval = std::chrono::milliseconds(100),
        .fn = [](const Task&) { burn_cpu(std::chrono::milliseconds(2)); }
        }));

    // 50ms heartbeat, telemetry only
    sched.add_task(std::make_shared<Task>(TaskSpec{
        .name = "heartbeat",
        .interval = std::chrono::milliseconds(50),
        .caps = Capability::Telemetry,
        .fn = [](const Task&) {}
        }));

    // 200ms thread contention sampler
    sched.add_task(std::make_shared<Task>(TaskSpec{
        .name = "thread_contention",
        .interval = std::chrono::milliseconds(200),
        .fn = [](const Task& self) {
          if (self.contention_monitoring()) burn_cpu(std::chrono::milliseconds(5));
        }
        }));

    // 1s self stats; the agent's own health reporting depends on it
    sched.add_task(std::make_shared<Task>(TaskSpec{
        .name = "stats_collector",
        .interval = std::chrono::milliseconds(1000),
        .caps = Capability::Telemetry | Capability::Critical,
        .fn = [](const Task&) {}
        }));

    if (opts->overload) {
      // blocks far past its interval; gets marked slow, then muted
      sched.add_task(std::make_shared<Task>(TaskSpec{
          .name = "disk_scan",
          .interval = std::chrono::milliseconds(10),
          .fn = [](const Task&) { std::this_thread::sleep_for(std::chrono::milliseconds(1000)); }
          }));
    }

    sched.set_mode(opts->mode);
    sched.set_contention_monitoring(true);
    sched.set_enabled(true);

    // stats printer (separate thread reading snapshots)
    std::atomic<bool> running{true};
    std::thread printer([&]{
        while (running) {
          std::this_thread::sleep_for(std::chrono::seconds(1));

          std::cout << "\n--- telemetry (" << to_str(sched.mode()) << ") ---\n";
          std::cout << std::left << std::setw(18) << "collector"
                    << std::setw(9) << "state"
                    << std::right << std::setw(8) << "runs"
                    << std::setw(8) << "slow"
                    << std::setw(8) << "muted"
                    << std::setw(8) << "busy"
                    << std::setw(8) << "mode"
                    << std::setw(14) << "exe_avg(us)"
                    << std::setw(14) << "exe_max(us)"
                    << "\n";

          for (auto& t : sched.tasks()) {
            const auto& name = t.task->name();
            const auto s = t.task->stats();
            double exe_avg_us = s.runs ? (double)s.exec_sum_ns / (double)s.runs / 1000.0 : 0.0;

            std::cout << std::left << std::setw(18) << name
                      << std::setw(9) << to_str(t.task->state())
                      << std::right << std::setw(8) << s.runs
                      << std::setw(8) << stats.count(SchedEvent::MarkedSlow, name)
                      << std::setw(8) << stats.count(SchedEvent::Muted, name)
                      << std::setw(8) << stats.count(SchedEvent::SkippedInProgress, name)
                      << std::setw(8) << stats.count(SchedEvent::SkippedForMode, name)
                      << std::setw(14) << exe_avg_us
                      << std::setw(14) << (double)s.exec_max_ns / 1000.0
                      << "\n";
          }
        }
        });

    LoopExit exit = LoopExit::TimeLimit;
    std::exception_ptr failure;
    try {
      exit = sched.run_for(std::chrono::seconds(opts->seconds));
    } catch (...) {
      failure = std::current_exception();
    }
    running = false;
    printer.join();
    if (failure) std::rethrow_exception(failure);

    spdlog::info("Collector scheduler exited: {}", to_str(exit));
    return exit == LoopExit::CriticalTaskBlocked ? 1 : 0;
  } catch (const std::exception& ex) {
    spdlog::critical("Collector scheduler failed: {}", ex.what());
    return 1;
  }
}
