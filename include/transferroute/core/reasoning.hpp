/* Natural-language explanation of why a route won its category. */
#pragma once

#include <string>

#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Builds the explanation for `route` winning `category` among `batch`.
// Never throws for data reasons: an unrecognized category yields a generic
// sentence, and an empty batch compares the route against itself.
//
// Cheapest:    zero-fee wording with step count, or fee vs. the most
//              expensive candidate (two decimals).
// Fastest:     arrival phrase (minutes / hours / days) and time saved vs.
//              the slowest candidate.
// Recommended: strengths derived from the weighted sub-scores
//              (cost >= 30, time >= 20, risk >= 20) and the overall score.
[[nodiscard]] std::string generate_reasoning(const Route& route,
                                             RouteCategory category,
                                             RouteBatch batch,
                                             Timestamp now);

} // namespace transferroute::core
