// health.hpp

#pragma once
#include "task.hpp"

// What happens to a task that is still running when its next slot comes due.
enum class OverrunAction {
  Demote,        // apply next state, skip this slot
  StopScheduler  // critical task is blocked; the loop must terminate
};

struct OverrunOutcome {
  OverrunAction action = OverrunAction::Demote;
  HealthState next = HealthState::Healthy;
  bool report_slow = false;  // only the HEALTHY -> SLOW edge is reported
};

// HEALTHY -> SLOW -> MUTED; MUTED is terminal.
OverrunOutcome on_overrun(HealthState current, bool critical);

inline OverrunOutcome on_overrun(const Task& task) {
  return on_overrun(task.state(), task.has(Capability::Critical));
}
