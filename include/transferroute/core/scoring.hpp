/* Weighted multi-criteria score for the "recommended" category. */
#pragma once

#include <vector>

#include "transferroute/core/types.hpp"

namespace transferroute::core {

inline constexpr double kCostWeight = 0.4;
inline constexpr double kTimeWeight = 0.3;
inline constexpr double kRiskWeight = 0.3;

// Weighted sub-scores of one route. Higher is better.
//   cost  = (100 - normalized_cost) * 0.4
//   time  = (100 - normalized_time) * 0.3
//   risk  = (100 - risk_score)      * 0.3
//   total = cost + time + risk
struct ScoreBreakdown {
  double cost { 0.0 };
  double time { 0.0 };
  double risk { 0.0 };
  double total { 0.0 };
};

[[nodiscard]] ScoreBreakdown score_route(const Route& route,
                                         double normalized_cost,
                                         double normalized_time) noexcept;

[[nodiscard]] double recommended_score(const Route& route,
                                       double normalized_cost,
                                       double normalized_time) noexcept;

// Normalizes cost and time once over the batch and scores every route.
// Result is parallel to the batch. This is the single path used both for
// selecting and for explaining the recommended route.
[[nodiscard]] std::vector<ScoreBreakdown> score_batch(RouteBatch batch, Timestamp now);

} // namespace transferroute::core
