#include <gtest/gtest.h>
#include <vector>
#include "transferroute/core/categorize.hpp"
#include "transferroute/core/error.hpp"
#include "transferroute/core/reasoning.hpp"
#include "test_utils.hpp"

using namespace transferroute::core;
using namespace transferroute::core::test;

namespace {
std::vector<Route> three_way_batch() {
  // 0: cheapest (free, slow); 1: fastest (expensive); 2: balanced.
  return {
    make_route(0.0, at_hours(72), 40.0),
    make_route(15.0, at_minutes(2), 20.0),
    make_route(2.0, at_hours(4), 5.0),
  };
}
} // namespace

TEST(Categorize, PicksLabelsAndExplainsEachCategory) {
  auto batch = three_way_batch();
  auto result = categorize_routes(batch, kNow);
  ASSERT_EQ(result.routes.size(), 3u);

  const auto& cheapest = result.routes[0];
  EXPECT_EQ(cheapest.category, RouteCategory::Cheapest);
  EXPECT_EQ(cheapest.total_fees, 0.0);
  EXPECT_EQ(cheapest.reasoning, generate_reasoning(batch[0], RouteCategory::Cheapest, batch, kNow));

  const auto& fastest = result.routes[1];
  EXPECT_EQ(fastest.category, RouteCategory::Fastest);
  EXPECT_EQ(fastest.estimated_arrival, at_minutes(2));
  EXPECT_EQ(fastest.reasoning,
            "This route arrives within minutes, 2 days faster than the slowest option.");

  const auto& recommended = result.routes[2];
  EXPECT_EQ(recommended.category, RouteCategory::Recommended);
  EXPECT_EQ(recommended.total_fees, 2.0);
  EXPECT_EQ(recommended.reasoning,
            generate_reasoning(batch[2], RouteCategory::Recommended, batch, kNow));
  EXPECT_FALSE(result.all_routes_risky);
}

TEST(Categorize, DoesNotMutateBatch) {
  auto batch = three_way_batch();
  for (auto& r : batch) r.reasoning = "untouched";
  auto result = categorize_routes(batch, kNow);
  for (const auto& r : batch) {
    EXPECT_EQ(r.reasoning, "untouched");
    EXPECT_EQ(r.category, RouteCategory::Recommended);
  }
  EXPECT_NE(result.routes[0].reasoning, "untouched");
}

TEST(Categorize, SameRouteCanWinEveryCategory) {
  std::vector<Route> batch{make_route(0.0, at_minutes(1), 0.0), make_route(5.0, at_hours(3), 50.0)};
  auto result = categorize_routes(batch, kNow);
  ASSERT_EQ(result.routes.size(), 3u);
  for (const auto& r : result.routes) {
    EXPECT_EQ(r.total_fees, 0.0);
    EXPECT_EQ(r.estimated_arrival, at_minutes(1));
  }
  EXPECT_EQ(result.routes[0].category, RouteCategory::Cheapest);
  EXPECT_EQ(result.routes[2].category, RouteCategory::Recommended);
}

TEST(Categorize, FlagsWhenEverySelectedRouteIsRisky) {
  std::vector<Route> batch{make_route(1.0, at_hours(1), 80.0), make_route(2.0, at_hours(2), 75.0)};
  EXPECT_TRUE(categorize_routes(batch, kNow).all_routes_risky);

  CategorizeOptions opts;
  opts.risk.warning_threshold = 90.0;
  EXPECT_FALSE(categorize_routes(batch, kNow, opts).all_routes_risky);
}

TEST(Categorize, EmptyBatchThrows) {
  std::vector<Route> batch;
  EXPECT_THROW((void)categorize_routes(batch, kNow), EmptyBatchError);
  CategorizeOptions opts;
  opts.validate = false;
  EXPECT_THROW((void)categorize_routes(batch, kNow, opts), EmptyBatchError);
}

TEST(Categorize, ValidationCanBeDisabled) {
  auto batch = three_way_batch();
  batch[2].total_fees = 99.0;
  EXPECT_THROW((void)categorize_routes(batch, kNow), ValueError);

  CategorizeOptions opts;
  opts.validate = false;
  auto result = categorize_routes(batch, kNow, opts);
  EXPECT_EQ(result.routes.size(), 3u);
}
