// admission.hpp

#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include "task.hpp"

// Which families of collectors the agent runs.
enum class CollectorMode : uint8_t { Rca = 0, Dual = 1, Telemetry = 2 };

const char* to_str(CollectorMode mode);
std::optional<CollectorMode> parse_mode(std::string_view text);

bool can_schedule(bool telemetry, CollectorMode mode);

inline bool can_schedule(const Task& task, CollectorMode mode) {
  return can_schedule(task.has(Capability::Telemetry), mode);
}
