#pragma once

#include "park/forecast/i_forecaster.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace park {

// Feature order used by LinearModelParameters arrays.
enum class ForecastFeature : std::size_t {
  Hour = 0,
  DayOfWeek,
  IsWeekend,
  CurrentOccupancy,
  AvgOccupancyLastHour,
  AvgOccupancySameHourLastWeek,
  Count,
};

constexpr std::size_t kForecastFeatureCount =
    static_cast<std::size_t>(ForecastFeature::Count);

// JSON key of each feature, in ForecastFeature order.
const std::array<const char*, kForecastFeatureCount>& forecastFeatureNames();

// -----------------------------------------------------------------------------
// LinearModelParameters
// -----------------------------------------------------------------------------
// Offline-trained standardized linear model:
//
//     rate = intercept + sum_i weight[i] * (x[i] - mean[i]) / scale[i]
//
// JSON form (missing features default to weight 0, mean 0, scale 1):
//
//   {
//     "intercept": 0.42,
//     "weights": {"hour": 0.08, "current_occupancy": 0.15, ...},
//     "means":   {"hour": 11.5, ...},
//     "scales":  {"hour": 6.9, ...}
//   }
// -----------------------------------------------------------------------------
struct LinearModelParameters {
  double intercept{0.0};
  std::array<double, kForecastFeatureCount> weights{};
  std::array<double, kForecastFeatureCount> means{};
  std::array<double, kForecastFeatureCount> scales{1, 1, 1, 1, 1, 1};

  // @throws ConfigError on wrong types or a non-positive scale.
  static LinearModelParameters fromJson(const nlohmann::json& j);

  // @throws ConfigError if the file cannot be read or parsed.
  static LinearModelParameters loadFile(const std::string& path);
};

// -----------------------------------------------------------------------------
// LinearFeatureForecaster
// -----------------------------------------------------------------------------
//
// @brief  Evaluates LinearModelParameters on calendar and recent-occupancy
//         features for each hourly target.
//
// @details
// Features for target t, with H the bucket history:
//   hour, day_of_week (Mon = 0), is_weekend  - calendar of t, UTC
//   current_occupancy                         - occupied_count of H.back()
//   avg_occupancy_last_hour                   - mean rate of H's last hour
//   avg_occupancy_same_hour_last_week         - mean rate in [t - 7d, t - 7d
//                                               + 1h); falls back to the
//                                               mean rate for hour(t), then
//                                               the overall mean
// The output is clamped to [0, 1].
// -----------------------------------------------------------------------------
class LinearFeatureForecaster final : public IForecaster {
 public:
  LinearFeatureForecaster(LinearModelParameters params,
                          std::size_t min_history_buckets = 12);

  std::vector<domain::ForecastPoint> predict(
      const std::vector<domain::OccupancyBucket>& history,
      int horizon_hours) const override;

  std::size_t minimumHistory() const override { return min_history_; }

  std::string name() const override { return "linear"; }

  // Raw model output (unclamped) for one feature vector.
  double evaluate(
      const std::array<double, kForecastFeatureCount>& features) const;

  const LinearModelParameters& parameters() const { return params_; }

 private:
  LinearModelParameters params_;
  std::size_t min_history_;
};

}  // namespace park
