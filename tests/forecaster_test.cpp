// =============================================================================
// forecaster_test.cpp
// =============================================================================
// Tests for the IForecaster implementations and their shared helpers.
//
//   1. Hourly targets start on the first whole hour after the history
//   2. Insufficient history / bad horizon are rejected, not guessed at
//   3. Seasonal model: constant history -> constant forecast
//   4. Seasonal model: near points follow the present, far points the profile
//   5. Linear model: evaluate() is the standardized dot product
//   6. Linear model: output clamped to [0, 1], deterministic
//   7. LinearModelParameters JSON parsing and validation
// =============================================================================

#include "park/common/errors.hpp"
#include "park/forecast/forecast_features.hpp"
#include "park/forecast/linear_feature_forecaster.hpp"
#include "park/forecast/seasonal_profile_forecaster.hpp"
#include "park/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>

using park::domain::OccupancyBucket;

namespace {

// 2025-03-03T00:00:00Z (Monday)
constexpr std::int64_t kMonday = 1'740'960'000'000;
constexpr std::int64_t kHour = 3'600'000;

// `count` hourly buckets starting at start_ms, rate from rate_at(hour index).
template <typename RateFn>
std::vector<OccupancyBucket> hourlyHistory(std::int64_t start_ms, int count,
                                           RateFn rate_at) {
  std::vector<OccupancyBucket> out;
  for (int i = 0; i < count; ++i) {
    OccupancyBucket b;
    b.window_start = park::ms_to_timestamp(start_ms + i * kHour);
    b.window_end = park::ms_to_timestamp(start_ms + (i + 1) * kHour);
    const auto occupied = static_cast<std::size_t>(rate_at(i) * 100.0 + 0.5);
    b.occupied_count = occupied;
    b.available_count = 100 - occupied;
    out.push_back(b);
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Targets
// -----------------------------------------------------------------------------
TEST(ForecastFeaturesTest, HourlyTargetsStrictlyAfter) {
  const auto on_hour = park::forecast::hourlyTargets(
      park::ms_to_timestamp(kMonday + 10 * kHour), 3);
  ASSERT_EQ(on_hour.size(), 3u);
  EXPECT_EQ(park::timestamp_to_ms(on_hour[0]), kMonday + 11 * kHour);
  EXPECT_EQ(park::timestamp_to_ms(on_hour[2]), kMonday + 13 * kHour);

  const auto mid_hour = park::forecast::hourlyTargets(
      park::ms_to_timestamp(kMonday + 10 * kHour + 15 * 60'000), 1);
  EXPECT_EQ(park::timestamp_to_ms(mid_hour[0]), kMonday + 11 * kHour);
}

TEST(ForecastFeaturesTest, MeanRateHelpers) {
  const auto history = hourlyHistory(kMonday, 4, [](int i) { return i * 0.2; });
  EXPECT_NEAR(park::forecast::meanRate(history), 0.3, 1e-9);
  EXPECT_NEAR(park::forecast::meanRateBetween(
                  history, park::ms_to_timestamp(kMonday + 2 * kHour),
                  park::ms_to_timestamp(kMonday + 4 * kHour), -1.0),
              0.5, 1e-9);
  EXPECT_DOUBLE_EQ(park::forecast::meanRateBetween(
                       history, park::ms_to_timestamp(0),
                       park::ms_to_timestamp(1), -1.0),
                   -1.0);
  EXPECT_DOUBLE_EQ(park::forecast::meanRate({}), 0.0);
  EXPECT_DOUBLE_EQ(park::forecast::clampRate(1.7), 1.0);
  EXPECT_DOUBLE_EQ(park::forecast::clampRate(-0.2), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Argument checks (both models)
// -----------------------------------------------------------------------------
TEST(ForecasterTest, InsufficientHistoryIsAnError) {
  park::SeasonalProfileForecaster seasonal(12);
  park::LinearFeatureForecaster linear(park::LinearModelParameters{}, 12);
  const auto short_history =
      hourlyHistory(kMonday, 5, [](int) { return 0.5; });

  try {
    seasonal.predict(short_history, 6);
    FAIL() << "expected InsufficientHistoryError";
  } catch (const park::InsufficientHistoryError& e) {
    EXPECT_EQ(e.available(), 5u);
    EXPECT_EQ(e.required(), 12u);
  }
  EXPECT_THROW(linear.predict(short_history, 6), park::InsufficientHistoryError);
  EXPECT_THROW(seasonal.predict({}, 6), park::InsufficientHistoryError);
}

TEST(ForecasterTest, HorizonOutOfRangeIsAnError) {
  park::SeasonalProfileForecaster seasonal(1);
  const auto history = hourlyHistory(kMonday, 24, [](int) { return 0.5; });
  EXPECT_THROW(seasonal.predict(history, 0), park::InvalidIntervalError);
  EXPECT_THROW(seasonal.predict(history, -3), park::InvalidIntervalError);
  EXPECT_THROW(seasonal.predict(history, park::forecast::kMaxHorizonHours + 1),
               park::InvalidIntervalError);
}

// -----------------------------------------------------------------------------
// 3. Seasonal: flat in, flat out
// -----------------------------------------------------------------------------
TEST(SeasonalProfileForecasterTest, ConstantHistoryGivesConstantForecast) {
  park::SeasonalProfileForecaster model;
  const auto history = hourlyHistory(kMonday, 48, [](int) { return 0.4; });

  const auto points = model.predict(history, 24);
  ASSERT_EQ(points.size(), 24u);
  EXPECT_EQ(park::timestamp_to_ms(points.front().timestamp),
            kMonday + 49 * kHour);
  for (const auto& p : points) {
    EXPECT_NEAR(p.predicted_occupancy_rate, 0.4, 1e-9);
  }
  EXPECT_EQ(model.name(), "seasonal");
}

// -----------------------------------------------------------------------------
// 4. Seasonal: daily pattern with an unusual present
// -----------------------------------------------------------------------------
TEST(SeasonalProfileForecasterTest, BlendsPresentIntoProfile) {
  // Two days: busy 08:00-17:59 (0.9), quiet otherwise (0.1). Last bucket
  // (23:00 on day two) is unusually busy.
  auto history = hourlyHistory(kMonday, 48, [](int i) {
    const int hour = i % 24;
    return (hour >= 8 && hour < 18) ? 0.9 : 0.1;
  });
  history.back().occupied_count = 80;
  history.back().available_count = 20;

  park::SeasonalProfileForecaster model(12, 0.5);
  const auto points = model.predict(history, 12);
  ASSERT_EQ(points.size(), 12u);

  // First point (01:00): 0.5 * 0.8 + 0.5 * 0.1
  EXPECT_NEAR(points[0].predicted_occupancy_rate, 0.45, 1e-9);
  // Eleven hours out (11:00): essentially the busy profile.
  EXPECT_NEAR(points[10].predicted_occupancy_rate, 0.9, 0.01);
  for (const auto& p : points) {
    EXPECT_GE(p.predicted_occupancy_rate, 0.0);
    EXPECT_LE(p.predicted_occupancy_rate, 1.0);
  }
}

TEST(SeasonalProfileForecasterTest, RejectsBadDecay) {
  EXPECT_THROW(park::SeasonalProfileForecaster(12, 1.0), std::invalid_argument);
  EXPECT_THROW(park::SeasonalProfileForecaster(12, -0.1), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. Linear: evaluate()
// -----------------------------------------------------------------------------
TEST(LinearFeatureForecasterTest, EvaluateIsStandardizedDotProduct) {
  park::LinearModelParameters params;
  params.intercept = 0.5;
  params.weights[static_cast<std::size_t>(park::ForecastFeature::Hour)] = 0.1;
  params.means[static_cast<std::size_t>(park::ForecastFeature::Hour)] = 12.0;
  params.scales[static_cast<std::size_t>(park::ForecastFeature::Hour)] = 6.0;
  params.weights[static_cast<std::size_t>(park::ForecastFeature::IsWeekend)] =
      -0.2;

  park::LinearFeatureForecaster model(params, 1);
  std::array<double, park::kForecastFeatureCount> x{};
  x[static_cast<std::size_t>(park::ForecastFeature::Hour)] = 18.0;
  x[static_cast<std::size_t>(park::ForecastFeature::IsWeekend)] = 1.0;

  // 0.5 + 0.1 * (18 - 12) / 6 - 0.2 * 1
  EXPECT_NEAR(model.evaluate(x), 0.4, 1e-12);
}

// -----------------------------------------------------------------------------
// 6. Linear: clamped and deterministic
// -----------------------------------------------------------------------------
TEST(LinearFeatureForecasterTest, OutputClampedAndDeterministic) {
  park::LinearModelParameters params;
  params.intercept = 0.0;
  params.weights[static_cast<std::size_t>(park::ForecastFeature::Hour)] = 1.0;
  park::LinearFeatureForecaster model(params, 12);

  const auto history = hourlyHistory(kMonday, 24, [](int) { return 0.3; });
  const auto a = model.predict(history, 24);
  const auto b = model.predict(history, 24);
  ASSERT_EQ(a.size(), 24u);
  for (std::size_t i = 0; i < a.size(); ++i) {
    EXPECT_GE(a[i].predicted_occupancy_rate, 0.0);
    EXPECT_LE(a[i].predicted_occupancy_rate, 1.0);
    EXPECT_DOUBLE_EQ(a[i].predicted_occupancy_rate,
                     b[i].predicted_occupancy_rate);
  }
  // Targets run 01:00 .. 00:00; hour 0 gives 0.0, every other hour
  // saturates at 1.0.
  EXPECT_DOUBLE_EQ(a[0].predicted_occupancy_rate, 1.0);
  EXPECT_DOUBLE_EQ(a[23].predicted_occupancy_rate, 0.0);
  EXPECT_EQ(model.name(), "linear");
}

TEST(LinearFeatureForecasterTest, InterceptOnlyModel) {
  park::LinearModelParameters params;
  params.intercept = 0.35;
  park::LinearFeatureForecaster model(params, 1);
  const auto points =
      model.predict(hourlyHistory(kMonday, 3, [](int) { return 0.9; }), 5);
  ASSERT_EQ(points.size(), 5u);
  for (const auto& p : points) {
    EXPECT_DOUBLE_EQ(p.predicted_occupancy_rate, 0.35);
  }
}

// -----------------------------------------------------------------------------
// 7. Parameter parsing
// -----------------------------------------------------------------------------
TEST(LinearModelParametersTest, ParsesPartialJson) {
  const auto j = nlohmann::json::parse(R"({
    "intercept": 0.42,
    "weights": {"hour": 0.08, "current_occupancy": 0.15},
    "means": {"hour": 11.5},
    "scales": {"hour": 6.9}
  })");
  const auto params = park::LinearModelParameters::fromJson(j);

  const auto hour = static_cast<std::size_t>(park::ForecastFeature::Hour);
  const auto current =
      static_cast<std::size_t>(park::ForecastFeature::CurrentOccupancy);
  EXPECT_DOUBLE_EQ(params.intercept, 0.42);
  EXPECT_DOUBLE_EQ(params.weights[hour], 0.08);
  EXPECT_DOUBLE_EQ(params.weights[current], 0.15);
  EXPECT_DOUBLE_EQ(params.means[hour], 11.5);
  EXPECT_DOUBLE_EQ(params.scales[hour], 6.9);
  EXPECT_DOUBLE_EQ(params.scales[current], 1.0);
}

TEST(LinearModelParametersTest, RejectsInvalidJson) {
  EXPECT_THROW(park::LinearModelParameters::fromJson(nlohmann::json::array()),
               park::ConfigError);
  EXPECT_THROW(park::LinearModelParameters::fromJson(
                   nlohmann::json::parse(R"({"intercept": "high"})")),
               park::ConfigError);
  EXPECT_THROW(park::LinearModelParameters::fromJson(
                   nlohmann::json::parse(R"({"scales": {"hour": 0}})")),
               park::ConfigError);
  EXPECT_THROW(park::LinearModelParameters::fromJson(
                   nlohmann::json::parse(R"({"weights": [1, 2]})")),
               park::ConfigError);
  EXPECT_THROW(park::LinearModelParameters::loadFile("/nonexistent/model.json"),
               park::ConfigError);
}
