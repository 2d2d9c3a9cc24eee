// stats_sink.hpp

#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

enum class SchedEvent { Muted, MarkedSlow, SkippedForMode, SkippedInProgress };

const char* to_str(SchedEvent ev);

// Write-only destination for scheduling occurrences, labelled by task name.
class StatsSink {
  public:
    virtual ~StatsSink() = default;
    virtual void record(SchedEvent ev, const std::string& task_name) = 0;
};

// In-memory counters, one per (event, task name).
class CounterSink : public StatsSink {
  public:
    using Key = std::pair<SchedEvent, std::string>;

    void record(SchedEvent ev, const std::string& task_name) override;

    uint64_t count(SchedEvent ev, const std::string& task_name) const;
    std::map<Key, uint64_t> snapshot() const;

  private:
    mutable std::mutex mu_;
    std::map<Key, uint64_t> counters_;
};
