#include "park/forecast/seasonal_profile_forecaster.hpp"

#include "park/forecast/forecast_features.hpp"
#include "park/time/time_utils.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

namespace park {

SeasonalProfileForecaster::SeasonalProfileForecaster(
    std::size_t min_history_buckets, double decay)
    : min_history_(min_history_buckets == 0 ? 1 : min_history_buckets),
      decay_(decay) {
  if (!(decay_ >= 0.0 && decay_ < 1.0)) {
    throw std::invalid_argument("Seasonal decay must be in [0, 1)");
  }
}

std::vector<domain::ForecastPoint> SeasonalProfileForecaster::predict(
    const std::vector<domain::OccupancyBucket>& history,
    int horizon_hours) const {
  forecast::checkPredictArguments(history, horizon_hours, min_history_);

  std::array<double, 24> sum{};
  std::array<std::size_t, 24> n{};
  for (const auto& bucket : history) {
    const int hour = utc_hour(bucket.window_start);
    sum[hour] += bucket.occupancyRate();
    ++n[hour];
  }
  const double overall = forecast::meanRate(history);
  const double latest = history.back().occupancyRate();

  std::vector<domain::ForecastPoint> points;
  const auto targets =
      forecast::hourlyTargets(history.back().window_end, horizon_hours);
  points.reserve(targets.size());

  double weight = 1.0;
  for (const Timestamp target : targets) {
    weight *= decay_;
    const int hour = utc_hour(target);
    const double profile =
        n[hour] == 0 ? overall : sum[hour] / static_cast<double>(n[hour]);

    domain::ForecastPoint point;
    point.timestamp = target;
    point.predicted_occupancy_rate =
        forecast::clampRate(weight * latest + (1.0 - weight) * profile);
    points.push_back(point);
  }
  return points;
}

}  // namespace park
