// options.cpp
#include "options.hpp"
#include <cerrno>
#include <cstdlib>
#include <string>

namespace {
bool parse_number(const char* text, long& out) {
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v < 0) return false;
  out = v;
  return true;
}
} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
  auto lvl = spdlog::level::from_str(std::string(text));
  if (lvl == spdlog::level::off && text != "off") return std::nullopt;
  return lvl;
}

std::optional<Options> parse_options(int argc, const char* const* argv) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--overload") {
      opts.overload = true;
      continue;
    }
    if (i + 1 >= argc) return std::nullopt;
    const char* value = argv[++i];

    if (arg == "--mode") {
      auto mode = parse_mode(value);
      if (!mode) return std::nullopt;
      opts.mode = *mode;
    } else if (arg == "--workers") {
      long n = 0;
      if (!parse_number(value, n) || n == 0) return std::nullopt;
      opts.workers = static_cast<std::size_t>(n);
    } else if (arg == "--seconds") {
      if (!parse_number(value, opts.seconds)) return std::nullopt;
    } else if (arg == "--log-level") {
      auto lvl = parse_log_level(value);
      if (!lvl) return std::nullopt;
      opts.log_level = *lvl;
    } else {
      return std::nullopt;
    }
  }
  return opts;
}
