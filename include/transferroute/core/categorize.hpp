/* Categorization step: pick, label and explain the three routes shown to users. */
#pragma once

#include <vector>

#include "transferroute/core/options.hpp"
#include "transferroute/core/types.hpp"

namespace transferroute::core {

struct RoutingResult {
  // Copies of the winners in order: cheapest, fastest, recommended.
  // Each copy carries its category and reasoning; the batch is untouched.
  std::vector<Route> routes;
  // Every selected route is above the risk warning threshold.
  bool all_routes_risky { false };
};

// Throws EmptyBatchError on an empty batch and, when opts.validate is set,
// ValueError on a broken route.
[[nodiscard]] RoutingResult categorize_routes(RouteBatch batch, Timestamp now,
                                              const CategorizeOptions& opts = {});

} // namespace transferroute::core
