#include "transferroute/core/risk.hpp"

#include <algorithm>
#include <chrono>

namespace transferroute::core {

double timing_risk(Timestamp estimated_arrival, Timestamp deadline) noexcept {
  const Millis buffer = deadline - estimated_arrival;
  if (buffer.count() < 0) return 100.0;
  const double buffer_hours = std::chrono::duration<double, std::ratio<3600>>(buffer).count();
  if (buffer_hours > 48.0) return 0.0;
  if (buffer_hours >= 24.0) return 20.0;
  if (buffer_hours >= 6.0) return 50.0;
  return 80.0;
}

double reliability_risk(const Route& route) noexcept {
  const auto is_instant = [](const TransferStep& s) { return s.method == TransferSpeed::Instant; };
  const bool has_instant = std::any_of(route.steps.begin(), route.steps.end(), is_instant);
  const bool has_ach = std::any_of(route.steps.begin(), route.steps.end(),
                                   [&](const TransferStep& s) { return !is_instant(s); });
  if (has_instant && !has_ach) return 0.0;
  if (has_instant && has_ach) return 30.0;
  return 50.0;
}

double complexity_risk(const Route& route) noexcept {
  const auto n = route.steps.size();
  if (n == 1) return 0.0;
  if (n <= 3) return 20.0;
  return 40.0;
}

RiskAssessment assess_risk(const Route& route, Timestamp deadline) noexcept {
  RiskAssessment r;
  r.timing = timing_risk(route.estimated_arrival, deadline);
  r.reliability = reliability_risk(route);
  r.complexity = complexity_risk(route);
  r.score = r.timing * 0.5 + r.reliability * 0.3 + r.complexity * 0.2;
  return r;
}

RiskLevel classify_risk_level(double risk_score, const RiskOptions& opts) noexcept {
  if (risk_score <= opts.low_max) return RiskLevel::Low;
  if (risk_score <= opts.medium_max) return RiskLevel::Medium;
  return RiskLevel::High;
}

bool all_routes_risky(RouteBatch batch, const RiskOptions& opts) noexcept {
  if (batch.empty()) return false;
  return std::all_of(batch.begin(), batch.end(),
                     [&](const Route& r) { return r.risk_score > opts.warning_threshold; });
}

} // namespace transferroute::core
