#include <gtest/gtest.h>
#include <vector>
#include "transferroute/core/categorize.hpp"
#include "transferroute/core/logging.hpp"
#include "transferroute/core/types.hpp"
#include "test_utils.hpp"

using namespace transferroute::core;
using namespace transferroute::core::test;

TEST(Smoke, CategorizeSingleRoute) {
  std::vector<Route> batch{make_route(1.5, at_hours(2), 10.0)};
  auto result = categorize_routes(batch, kNow);
  ASSERT_EQ(result.routes.size(), 3u);
  EXPECT_EQ(result.routes[0].category, RouteCategory::Cheapest);
  EXPECT_EQ(result.routes[1].category, RouteCategory::Fastest);
  EXPECT_EQ(result.routes[2].category, RouteCategory::Recommended);
  EXPECT_FALSE(result.all_routes_risky);
}

TEST(Smoke, EnumNames) {
  EXPECT_EQ(to_string(TransferSpeed::Instant), "instant");
  EXPECT_EQ(to_string(TransferSpeed::SameDay), "same_day");
  EXPECT_EQ(to_string(TransferSpeed::OneDay), "1_day");
  EXPECT_EQ(to_string(TransferSpeed::ThreeDay), "3_day");
  EXPECT_EQ(to_string(RiskLevel::Medium), "medium");
  EXPECT_EQ(to_string(RouteCategory::Fastest), "fastest");
  EXPECT_EQ(to_string(static_cast<RouteCategory>(42)), "unknown");
  EXPECT_EQ(parse_route_category("recommended"), RouteCategory::Recommended);
  EXPECT_FALSE(parse_route_category("balanced").has_value());
}

TEST(Smoke, LoggerIsSharedAndAdjustable) {
  auto a = logger();
  auto b = logger();
  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(a->name(), "transferroute");
  set_log_level(spdlog::level::debug);
  EXPECT_EQ(a->level(), spdlog::level::debug);
  set_log_level(spdlog::level::warn);
  EXPECT_EQ(a->level(), spdlog::level::warn);
}

TEST(Smoke, ParseLogLevelRejectsUnknownNames) {
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_FALSE(parse_log_level("").has_value());
}
