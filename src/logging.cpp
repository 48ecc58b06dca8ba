#include "transferroute/core/logging.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace transferroute::core {

namespace {
constexpr const char* kLoggerName = "transferroute";
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  // Function-local static: created once, thread-safe initialization.
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  const std::string text(name);
  const auto level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") return std::nullopt;
  return level;
}

} // namespace transferroute::core
