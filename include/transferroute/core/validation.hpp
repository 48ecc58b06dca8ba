/* Route invariant checks run by the selectors before picking a winner. */
#pragma once

#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Absolute tolerance when comparing a route's total_fees with the sum of its
// step fees (floating-point sums are not associative).
inline constexpr double kFeeTolerance = 1e-6;

// Throws ValueError if:
// - route.steps is empty;
// - a step fee is present and negative (or not finite);
// - route.risk_score is not finite or outside [0, 100];
// - |route.total_fees - total_fees(route.steps)| > kFeeTolerance.
void validate_route(const Route& route);

// Throws EmptyBatchError on an empty batch, then validate_route per entry.
// The ValueError message names the offending batch index.
void validate_batch(RouteBatch batch);

} // namespace transferroute::core
