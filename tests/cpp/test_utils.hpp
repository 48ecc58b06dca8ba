#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include "transferroute/core/fees.hpp"
#include "transferroute/core/types.hpp"

namespace transferroute::core::test {

// Fixed reference "now" so every test is deterministic.
inline constexpr Timestamp kNow { Millis { 1'700'000'000'000LL } };

inline Timestamp at_minutes(std::int64_t m) { return kNow + std::chrono::minutes(m); }
inline Timestamp at_hours(std::int64_t h) { return kNow + std::chrono::hours(h); }

inline TransferStep make_step(std::optional<Money> fee, Timestamp arrival,
                              TransferSpeed method = TransferSpeed::Instant) {
  TransferStep s;
  s.from_account_id = "src";
  s.to_account_id = "dst";
  s.amount = 100.0;
  s.method = method;
  s.fee = fee;
  s.estimated_arrival = arrival;
  return s;
}

// Route whose steps carry the given fees; total_fees is derived from them so
// the route satisfies validate_route. All steps arrive at `arrival`.
inline Route make_route(std::initializer_list<std::optional<Money>> step_fees,
                        Timestamp arrival, double risk_score = 0.0,
                        TransferSpeed method = TransferSpeed::Instant) {
  Route r;
  for (const auto& fee : step_fees) {
    r.steps.push_back(make_step(fee, arrival, method));
  }
  r.total_fees = total_fees(r.steps);
  r.estimated_arrival = arrival;
  r.risk_score = risk_score;
  return r;
}

// Single-step route with the given fee.
inline Route make_route(Money fee, Timestamp arrival, double risk_score = 0.0) {
  return make_route({std::optional<Money>(fee)}, arrival, risk_score);
}

} // namespace transferroute::core::test
