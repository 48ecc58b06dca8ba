/*
  Selectors: stable linear reductions over the batch.

  Each keeps the first extremum found, so ties resolve to the earliest route
  in batch order. The public select_* entry points validate the batch before
  reducing; the *_index variants only reject empty batches.
*/
#include "transferroute/core/selection.hpp"

#include <string>

#include "transferroute/core/error.hpp"
#include "transferroute/core/logging.hpp"
#include "transferroute/core/scoring.hpp"
#include "transferroute/core/validation.hpp"

namespace transferroute::core {

namespace {
void require_non_empty(RouteBatch batch, const char* who) {
  if (batch.empty()) {
    throw EmptyBatchError(std::string(who) + ": route batch is empty");
  }
}
} // namespace

std::size_t cheapest_index(RouteBatch batch) {
  require_non_empty(batch, "cheapest_index");
  std::size_t best = 0;
  for (std::size_t i = 1; i < batch.size(); ++i) {
    if (batch[i].total_fees < batch[best].total_fees) best = i;
  }
  return best;
}

std::size_t fastest_index(RouteBatch batch) {
  require_non_empty(batch, "fastest_index");
  std::size_t best = 0;
  for (std::size_t i = 1; i < batch.size(); ++i) {
    if (batch[i].estimated_arrival < batch[best].estimated_arrival) best = i;
  }
  return best;
}

std::size_t recommended_index(RouteBatch batch, Timestamp now) {
  require_non_empty(batch, "recommended_index");
  const auto scores = score_batch(batch, now);
  std::size_t best = 0;
  for (std::size_t i = 1; i < scores.size(); ++i) {
    if (scores[i].total > scores[best].total) best = i;
  }
  return best;
}

const Route& select_cheapest(RouteBatch batch) {
  validate_batch(batch);
  const auto i = cheapest_index(batch);
  logger()->debug("cheapest: route {} of {} (fees {:.2f})", i, batch.size(), batch[i].total_fees);
  return batch[i];
}

const Route& select_fastest(RouteBatch batch) {
  validate_batch(batch);
  const auto i = fastest_index(batch);
  logger()->debug("fastest: route {} of {}", i, batch.size());
  return batch[i];
}

const Route& select_recommended(RouteBatch batch, Timestamp now) {
  validate_batch(batch);
  const auto i = recommended_index(batch, now);
  logger()->debug("recommended: route {} of {}", i, batch.size());
  return batch[i];
}

} // namespace transferroute::core
