/* Per-call option structs. */
#pragma once

namespace transferroute::core {

struct RiskOptions {
  // classify_risk_level: score <= low_max -> Low, <= medium_max -> Medium, else High.
  double low_max { 30.0 };
  double medium_max { 60.0 };
  // all_routes_risky: every route strictly above this score.
  double warning_threshold { 70.0 };
};

struct CategorizeOptions {
  // Run validate_route over the batch before selecting.
  bool validate { true };
  RiskOptions risk {};
};

} // namespace transferroute::core
