/*
  categorize_routes: runs the three selectors over one batch and returns
  labelled, explained copies of the winners. The same route may win more than
  one category; each category gets its own copy.
*/
#include "transferroute/core/categorize.hpp"

#include <utility>

#include "transferroute/core/logging.hpp"
#include "transferroute/core/reasoning.hpp"
#include "transferroute/core/risk.hpp"
#include "transferroute/core/selection.hpp"
#include "transferroute/core/validation.hpp"

namespace transferroute::core {

RoutingResult categorize_routes(RouteBatch batch, Timestamp now, const CategorizeOptions& opts) {
  if (opts.validate) {
    validate_batch(batch);
  }
  const std::size_t picks[3] = {
    cheapest_index(batch),
    fastest_index(batch),
    recommended_index(batch, now),
  };
  const RouteCategory categories[3] = {
    RouteCategory::Cheapest, RouteCategory::Fastest, RouteCategory::Recommended,
  };

  RoutingResult result;
  result.routes.reserve(3);
  for (std::size_t k = 0; k < 3; ++k) {
    Route copy = batch[picks[k]];
    copy.category = categories[k];
    copy.reasoning = generate_reasoning(batch[picks[k]], categories[k], batch, now);
    result.routes.push_back(std::move(copy));
  }
  result.all_routes_risky = all_routes_risky(result.routes, opts.risk);

  logger()->debug("categorized {} routes: cheapest={} fastest={} recommended={}{}",
                  batch.size(), picks[0], picks[1], picks[2],
                  result.all_routes_risky ? " (all risky)" : "");
  return result;
}

} // namespace transferroute::core
