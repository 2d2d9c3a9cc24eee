// admission.cpp
#include "admission.hpp"

const char* to_str(CollectorMode mode) {
  switch (mode) {
    case CollectorMode::Rca: return "RCA";
    case CollectorMode::Dual: return "DUAL";
    case CollectorMode::Telemetry: return "TELEMETRY";
    default: return "UNKNOWN";
  }
}

std::optional<CollectorMode> parse_mode(std::string_view text) {
  if (text == "rca" || text == "RCA") return CollectorMode::Rca;
  if (text == "dual" || text == "DUAL") return CollectorMode::Dual;
  if (text == "telemetry" || text == "TELEMETRY") return CollectorMode::Telemetry;
  return std::nullopt;
}

bool can_schedule(bool telemetry, CollectorMode mode) {
  if (mode == CollectorMode::Dual) return true;
  return telemetry ? mode == CollectorMode::Telemetry : mode == CollectorMode::Rca;
}
