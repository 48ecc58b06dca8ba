/*
  Route invariant checks.

  The selectors call validate_batch before any reduction so that a route whose
  total_fees disagrees with its steps can never be picked as "cheapest".
*/
#include "transferroute/core/validation.hpp"

#include <cmath>
#include <string>

#include <fmt/format.h>

#include "transferroute/core/error.hpp"
#include "transferroute/core/fees.hpp"
#include "transferroute/core/logging.hpp"

namespace transferroute::core {

void validate_route(const Route& route) {
  if (route.steps.empty()) {
    throw ValueError("route must have at least one transfer step");
  }
  for (std::size_t i = 0; i < route.steps.size(); ++i) {
    const auto& fee = route.steps[i].fee;
    if (fee && (!std::isfinite(*fee) || *fee < 0.0)) {
      throw ValueError(fmt::format("step {}: fee must be a finite value >= 0 (got {})", i, *fee));
    }
  }
  if (!std::isfinite(route.risk_score) || route.risk_score < 0.0 || route.risk_score > 100.0) {
    throw ValueError(fmt::format("risk_score must be within [0, 100] (got {})", route.risk_score));
  }
  const Money expected = total_fees(route.steps);
  if (!std::isfinite(route.total_fees) || std::fabs(route.total_fees - expected) > kFeeTolerance) {
    throw ValueError(fmt::format("total_fees {:.6f} does not match sum of step fees {:.6f}",
                                 route.total_fees, expected));
  }
}

void validate_batch(RouteBatch batch) {
  if (batch.empty()) {
    throw EmptyBatchError("route batch is empty");
  }
  for (std::size_t i = 0; i < batch.size(); ++i) {
    try {
      validate_route(batch[i]);
    } catch (const ValueError& e) {
      logger()->warn("rejecting batch: route {} is invalid: {}", i, e.what());
      throw ValueError(fmt::format("route {}: {}", i, e.what()));
    }
  }
}

} // namespace transferroute::core
