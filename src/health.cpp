// health.cpp
#include "health.hpp"

OverrunOutcome on_overrun(HealthState current, bool critical) {
  if (critical) return OverrunOutcome{OverrunAction::StopScheduler, current, false};

  switch (current) {
    case HealthState::Healthy:
      return OverrunOutcome{OverrunAction::Demote, HealthState::Slow, true};
    case HealthState::Slow:
      return OverrunOutcome{OverrunAction::Demote, HealthState::Muted, false};
    case HealthState::Muted:
    default:
      return OverrunOutcome{OverrunAction::Demote, HealthState::Muted, false};
  }
}
