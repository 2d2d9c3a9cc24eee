// options.hpp

#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "scheduler.hpp"

// Command line of the demo binary.
struct Options {
  CollectorMode mode = CollectorMode::Dual;
  std::size_t workers = Scheduler::kDefaultWorkerCount;
  long seconds = 15;
  bool overload = false;
  spdlog::level::level_enum log_level = spdlog::level::info;
};

// spdlog maps unknown names to `off`; this rejects them instead.
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

// nullopt on an unknown flag, a missing value or a value that does not parse.
std::optional<Options> parse_options(int argc, const char* const* argv);
