/* Batch-relative normalization of route cost and arrival delay. */
#pragma once

#include <vector>

#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Batch-wide maxima needed by the normalizers and the reasoning text.
// Computed fresh per call; never cached across batches.
struct BatchExtremes {
  Money max_fee { 0.0 };
  Millis max_delay { 0 };       // max over (estimated_arrival - now)
  Timestamp slowest_arrival {}; // latest estimated_arrival
};

// Empty batch -> default-initialized extremes.
[[nodiscard]] BatchExtremes batch_extremes(RouteBatch batch, Timestamp now) noexcept;

// Elementwise formulas shared by every caller:
//   normalize_cost = max_fee == 0 ? 0 : fee / max_fee * 100
//   normalize_time = max_delay == 0 ? 0 : delay / max_delay * 100
// normalize_time is not clamped: negative delays may map below 0 or above 100.
[[nodiscard]] double normalize_cost(Money fee, Money max_fee) noexcept;
[[nodiscard]] double normalize_time(Millis delay, Millis max_delay) noexcept;

// One value per route, parallel to the batch. Empty batch -> empty vector.
[[nodiscard]] std::vector<double> normalize_costs(RouteBatch batch);
[[nodiscard]] std::vector<double> normalize_times(RouteBatch batch, Timestamp now);

} // namespace transferroute::core
