/*
  Reasoning generator.

  Text is derived from the same batch extremes and score_route() used by the
  selectors, so the recommended explanation always reports the score that was
  used to pick the route. Durations are measured in whole milliseconds and
  split with floor division (hours), then the remainder into minutes.
*/
#include "transferroute/core/reasoning.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "transferroute/core/normalize.hpp"
#include "transferroute/core/scoring.hpp"

namespace transferroute::core {

namespace {

constexpr std::int64_t kMsPerMinute = 60LL * 1000;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;

// Floor division for possibly negative numerators.
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

std::string plural(std::int64_t n, std::string_view noun) {
  return fmt::format("{} {}{}", n, noun, n != 1 ? "s" : "");
}

std::string cheapest_reasoning(const Route& route, const BatchExtremes& ex) {
  const Money fees = route.total_fees;
  const auto step_count = static_cast<std::int64_t>(route.steps.size());

  if (fees == 0.0) {
    return fmt::format("This route has zero fees, making it the most cost-effective option with {}.",
                       plural(step_count, "transfer step"));
  }

  const Money savings = ex.max_fee - fees;
  if (savings == 0.0) {
    return fmt::format("This route costs ${:.2f} in fees across {}.", fees, plural(step_count, "step"));
  }
  return fmt::format(
      "This route minimizes costs at ${:.2f} in total fees, saving ${:.2f} compared to the most expensive option.",
      fees, savings);
}

std::string arrival_phrase(Millis delay) {
  const std::int64_t ms = delay.count();
  const std::int64_t hours = floor_div(ms, kMsPerHour);
  // Remainder keeps the sign of the delay; minutes only matter when hours == 0.
  const std::int64_t minutes = floor_div(ms % kMsPerHour, kMsPerMinute);

  if (hours == 0 && minutes <= 5) return "within minutes";
  if (hours == 0) return fmt::format("in {} minutes", minutes);
  if (hours < 24) return "in " + plural(hours, "hour");
  return "in " + plural(floor_div(hours, 24), "day");
}

std::string fastest_reasoning(const Route& route, const BatchExtremes& ex, Timestamp now) {
  const std::string when = arrival_phrase(route.estimated_arrival - now);

  const std::int64_t saved_ms = (ex.slowest_arrival - route.estimated_arrival).count();
  const std::int64_t hours_saved = floor_div(saved_ms, kMsPerHour);

  if (saved_ms == 0) {
    return fmt::format("This route arrives {}, matching the fastest possible delivery time.", when);
  }
  if (hours_saved < 1) {
    return fmt::format("This route arrives {}, the fastest option available.", when);
  }
  const std::int64_t days_saved = floor_div(hours_saved, 24);
  if (days_saved > 0) {
    return fmt::format("This route arrives {}, {} faster than the slowest option.", when,
                       plural(days_saved, "day"));
  }
  return fmt::format("This route arrives {}, {} faster than the slowest option.", when,
                     plural(hours_saved, "hour"));
}

std::string recommended_reasoning(const Route& route, const BatchExtremes& ex, Timestamp now) {
  const auto s = score_route(route,
                             normalize_cost(route.total_fees, ex.max_fee),
                             normalize_time(route.estimated_arrival - now, ex.max_delay));

  std::vector<std::string_view> strengths;
  if (s.cost >= 30.0) strengths.emplace_back("competitive fees");
  if (s.time >= 20.0) strengths.emplace_back("fast delivery");
  if (s.risk >= 20.0) strengths.emplace_back("low risk");

  const std::string strengths_text =
      strengths.empty() ? std::string("balanced characteristics") : fmt::format("{}", fmt::join(strengths, ", "));

  return fmt::format(
      "This route offers the best overall balance with {}. It scores {:.1f}/100 on our weighted "
      "evaluation (cost 40%, speed 30%, risk 30%).",
      strengths_text, s.total);
}

} // namespace

std::string generate_reasoning(const Route& route, RouteCategory category,
                               RouteBatch batch, Timestamp now) {
  // An empty batch compares the route against itself.
  const RouteBatch effective = batch.empty() ? RouteBatch(&route, 1) : batch;
  const auto ex = batch_extremes(effective, now);

  switch (category) {
    case RouteCategory::Cheapest: return cheapest_reasoning(route, ex);
    case RouteCategory::Fastest: return fastest_reasoning(route, ex, now);
    case RouteCategory::Recommended: return recommended_reasoning(route, ex, now);
  }
  return "Selected for unknown category";
}

} // namespace transferroute::core
