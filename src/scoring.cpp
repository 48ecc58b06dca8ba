#include "transferroute/core/scoring.hpp"

#include "transferroute/core/normalize.hpp"

namespace transferroute::core {

ScoreBreakdown score_route(const Route& route, double normalized_cost,
                           double normalized_time) noexcept {
  ScoreBreakdown s;
  s.cost = (100.0 - normalized_cost) * kCostWeight;
  s.time = (100.0 - normalized_time) * kTimeWeight;
  s.risk = (100.0 - route.risk_score) * kRiskWeight;
  s.total = s.cost + s.time + s.risk;
  return s;
}

double recommended_score(const Route& route, double normalized_cost,
                         double normalized_time) noexcept {
  return score_route(route, normalized_cost, normalized_time).total;
}

std::vector<ScoreBreakdown> score_batch(RouteBatch batch, Timestamp now) {
  std::vector<ScoreBreakdown> out;
  if (batch.empty()) return out;
  const auto ex = batch_extremes(batch, now);
  out.reserve(batch.size());
  for (const auto& route : batch) {
    out.push_back(score_route(route,
                              normalize_cost(route.total_fees, ex.max_fee),
                              normalize_time(route.estimated_arrival - now, ex.max_delay)));
  }
  return out;
}

} // namespace transferroute::core
