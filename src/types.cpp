#include "transferroute/core/types.hpp"

namespace transferroute::core {

std::string_view to_string(TransferSpeed speed) noexcept {
  switch (speed) {
    case TransferSpeed::Instant: return "instant";
    case TransferSpeed::SameDay: return "same_day";
    case TransferSpeed::OneDay: return "1_day";
    case TransferSpeed::ThreeDay: return "3_day";
  }
  return "unknown";
}

std::string_view to_string(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::Low: return "low";
    case RiskLevel::Medium: return "medium";
    case RiskLevel::High: return "high";
  }
  return "unknown";
}

std::string_view to_string(RouteCategory category) noexcept {
  switch (category) {
    case RouteCategory::Cheapest: return "cheapest";
    case RouteCategory::Fastest: return "fastest";
    case RouteCategory::Recommended: return "recommended";
  }
  return "unknown";
}

std::optional<RouteCategory> parse_route_category(std::string_view name) noexcept {
  if (name == "cheapest") return RouteCategory::Cheapest;
  if (name == "fastest") return RouteCategory::Fastest;
  if (name == "recommended") return RouteCategory::Recommended;
  return std::nullopt;
}

} // namespace transferroute::core
