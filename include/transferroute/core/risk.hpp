/* Route risk assessment and high-risk warning. */
#pragma once

#include "transferroute/core/options.hpp"
#include "transferroute/core/types.hpp"

namespace transferroute::core {

// Component breakdown; score = timing*0.5 + reliability*0.3 + complexity*0.2.
struct RiskAssessment {
  double score { 0.0 };
  double timing { 0.0 };      // 0, 20, 50, 80 or 100
  double reliability { 0.0 }; // 0, 30 or 50
  double complexity { 0.0 };  // 0, 20 or 40
};

// Buffer before deadline: negative -> 100, > 48h -> 0, >= 24h -> 20,
// >= 6h -> 50, otherwise 80.
[[nodiscard]] double timing_risk(Timestamp estimated_arrival, Timestamp deadline) noexcept;

// Only instant hops -> 0, instant mixed with ACH hops -> 30, otherwise 50.
[[nodiscard]] double reliability_risk(const Route& route) noexcept;

// One hop -> 0, up to three hops -> 20, more -> 40.
[[nodiscard]] double complexity_risk(const Route& route) noexcept;

[[nodiscard]] RiskAssessment assess_risk(const Route& route, Timestamp deadline) noexcept;

[[nodiscard]] RiskLevel classify_risk_level(double risk_score,
                                            const RiskOptions& opts = {}) noexcept;

// True when the batch is non-empty and every route's risk_score is strictly
// above opts.warning_threshold.
[[nodiscard]] bool all_routes_risky(RouteBatch batch, const RiskOptions& opts = {}) noexcept;

} // namespace transferroute::core
