/* Core route types and helper enums.
 *
 * For Python developers:
 * - Timestamp: millisecond-precision system_clock time point (like datetime)
 * - Money: double, in dollars
 * - std::optional<T>: nullable value (like T | None)
 * - std::span<const T>: read-only view over a contiguous batch (no copy)
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace transferroute::core {

using Money = double;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using Millis = std::chrono::milliseconds;

// Transfer speed of a single hop. Informative only; scoring reads arrival times.
enum class TransferSpeed {
  Instant = 1,
  SameDay = 2,
  OneDay = 3,
  ThreeDay = 4
};

enum class RiskLevel {
  Low = 1,
  Medium = 2,
  High = 3
};

// Category a selector assigns to its winner. Values outside the enumerators
// are treated as unrecognized by the reasoning generator.
enum class RouteCategory {
  Cheapest = 1,
  Fastest = 2,
  Recommended = 3
};

struct TransferStep {
  std::string from_account_id;
  std::string to_account_id;
  Money amount { 0.0 };
  TransferSpeed method { TransferSpeed::Instant };
  std::optional<Money> fee {};  // absent == free
  Timestamp estimated_arrival {};
};

struct Route {
  RouteCategory category { RouteCategory::Recommended };
  std::vector<TransferStep> steps;
  Money total_fees { 0.0 };
  Timestamp estimated_arrival {};
  RiskLevel risk_level { RiskLevel::Low };
  double risk_score { 0.0 };  // 0..100, lower is better
  std::string reasoning;
};

// Candidate batch handed to the engine. Index i of any per-route result
// (normalized cost/time, score) refers to batch[i].
using RouteBatch = std::span<const Route>;

[[nodiscard]] std::string_view to_string(TransferSpeed speed) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;
[[nodiscard]] std::string_view to_string(RouteCategory category) noexcept;
[[nodiscard]] std::optional<RouteCategory> parse_route_category(std::string_view name) noexcept;

} // namespace transferroute::core
