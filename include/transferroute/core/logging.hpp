/* Library logger (spdlog). */
#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace transferroute::core {

// Named "transferroute" logger, created on first use with a stderr sink and
// level warn. Reuses an already registered logger of that name.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// spdlog level name ("trace" .. "off", plus "warn"/"err" short forms).
// Unknown names give nullopt instead of spdlog's silent fallback to off.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace transferroute::core
