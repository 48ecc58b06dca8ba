/*
  Batch-relative normalization.

  Both normalizers scale against the largest value in the batch, so the
  route(s) at the maximum map to exactly 100. Degenerate batches (all fees
  zero, all delays zero) map every route to 0 instead of dividing by zero.
*/
#include "transferroute/core/normalize.hpp"

#include <algorithm>

namespace transferroute::core {

BatchExtremes batch_extremes(RouteBatch batch, Timestamp now) noexcept {
  BatchExtremes ex;
  if (batch.empty()) return ex;
  ex.max_fee = batch.front().total_fees;
  ex.max_delay = batch.front().estimated_arrival - now;
  ex.slowest_arrival = batch.front().estimated_arrival;
  for (const auto& route : batch.subspan(1)) {
    ex.max_fee = std::max(ex.max_fee, route.total_fees);
    ex.max_delay = std::max(ex.max_delay, Millis(route.estimated_arrival - now));
    ex.slowest_arrival = std::max(ex.slowest_arrival, route.estimated_arrival);
  }
  return ex;
}

double normalize_cost(Money fee, Money max_fee) noexcept {
  if (max_fee == 0.0) return 0.0;
  return (fee / max_fee) * 100.0;
}

double normalize_time(Millis delay, Millis max_delay) noexcept {
  if (max_delay.count() == 0) return 0.0;
  return (static_cast<double>(delay.count()) / static_cast<double>(max_delay.count())) * 100.0;
}

std::vector<double> normalize_costs(RouteBatch batch) {
  std::vector<double> out;
  if (batch.empty()) return out;
  // Timestamp is irrelevant for max_fee.
  const auto ex = batch_extremes(batch, Timestamp{});
  out.reserve(batch.size());
  for (const auto& route : batch) {
    out.push_back(normalize_cost(route.total_fees, ex.max_fee));
  }
  return out;
}

std::vector<double> normalize_times(RouteBatch batch, Timestamp now) {
  std::vector<double> out;
  if (batch.empty()) return out;
  const auto ex = batch_extremes(batch, now);
  out.reserve(batch.size());
  for (const auto& route : batch) {
    out.push_back(normalize_time(route.estimated_arrival - now, ex.max_delay));
  }
  return out;
}

} // namespace transferroute::core
