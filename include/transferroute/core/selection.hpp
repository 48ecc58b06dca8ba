/* Cheapest / fastest / recommended selectors over a candidate batch. */
#pragma once

#include <cstddef>

#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Public selectors. Each validates the batch first (validate_batch):
// EmptyBatchError on zero routes, ValueError on a broken route.
// Ties resolve to the first route in batch order. The returned reference
// points into the caller's batch.
[[nodiscard]] const Route& select_cheapest(RouteBatch batch);
[[nodiscard]] const Route& select_fastest(RouteBatch batch);
[[nodiscard]] const Route& select_recommended(RouteBatch batch, Timestamp now);

// Index variants without route validation. Still throw EmptyBatchError.
[[nodiscard]] std::size_t cheapest_index(RouteBatch batch);
[[nodiscard]] std::size_t fastest_index(RouteBatch batch);
[[nodiscard]] std::size_t recommended_index(RouteBatch batch, Timestamp now);

} // namespace transferroute::core
