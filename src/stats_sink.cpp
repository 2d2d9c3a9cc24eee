// stats_sink.cpp
#include "stats_sink.hpp"

const char* to_str(SchedEvent ev) {
  switch (ev) {
    case SchedEvent::Muted: return "CollectorsMuted";
    case SchedEvent::MarkedSlow: return "CollectorsSlow";
    case SchedEvent::SkippedForMode: return "CollectorsSkippedForMode";
    case SchedEvent::SkippedInProgress: return "CollectorsSkipped";
    default: return "Unknown";
  }
}

void CounterSink::record(SchedEvent ev, const std::string& task_name) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[Key{ev, task_name}]++;
}

uint64_t CounterSink::count(SchedEvent ev, const std::string& task_name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(Key{ev, task_name});
  return it == counters_.end() ? 0 : it->second;
}

std::map<CounterSink::Key, uint64_t> CounterSink::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}
