#include "park/forecast/linear_feature_forecaster.hpp"

#include "park/common/errors.hpp"
#include "park/forecast/forecast_features.hpp"
#include "park/time/time_utils.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

namespace park {

const std::array<const char*, kForecastFeatureCount>& forecastFeatureNames() {
  static const std::array<const char*, kForecastFeatureCount> kNames = {
      "hour",
      "day_of_week",
      "is_weekend",
      "current_occupancy",
      "avg_occupancy_last_hour",
      "avg_occupancy_same_hour_last_week",
  };
  return kNames;
}

namespace {

// Reads section[name] for every feature into out, leaving absent ones.
void readFeatureMap(const nlohmann::json& j, const char* section,
                    std::array<double, kForecastFeatureCount>& out) {
  if (!j.contains(section)) {
    return;
  }
  const nlohmann::json& map = j.at(section);
  if (!map.is_object()) {
    throw ConfigError(std::string("Forecast model '") + section +
                      "' must be an object");
  }
  const auto& names = forecastFeatureNames();
  for (std::size_t i = 0; i < kForecastFeatureCount; ++i) {
    if (map.contains(names[i])) {
      const nlohmann::json& value = map.at(names[i]);
      if (!value.is_number()) {
        throw ConfigError(std::string("Forecast model ") + section + "." +
                          names[i] + " must be a number");
      }
      out[i] = value.get<double>();
    }
  }
}

}  // namespace

LinearModelParameters LinearModelParameters::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("Forecast model parameters must be a JSON object");
  }
  LinearModelParameters params;
  if (j.contains("intercept")) {
    if (!j.at("intercept").is_number()) {
      throw ConfigError("Forecast model intercept must be a number");
    }
    params.intercept = j.at("intercept").get<double>();
  }
  readFeatureMap(j, "weights", params.weights);
  readFeatureMap(j, "means", params.means);
  readFeatureMap(j, "scales", params.scales);

  for (std::size_t i = 0; i < kForecastFeatureCount; ++i) {
    if (!(params.scales[i] > 0.0)) {
      throw ConfigError(std::string("Forecast model scale for ") +
                        forecastFeatureNames()[i] + " must be positive");
    }
  }
  return params;
}

LinearModelParameters LinearModelParameters::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open forecast model file: " + path);
  }
  try {
    nlohmann::json j = nlohmann::json::parse(in);
    LinearModelParameters params = fromJson(j);
    std::cout << "[LinearFeatureForecaster] Loaded parameters from " << path
              << "\n";
    return params;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("Malformed forecast model file " + path + ": " +
                      e.what());
  }
}

LinearFeatureForecaster::LinearFeatureForecaster(LinearModelParameters params,
                                                 std::size_t min_history_buckets)
    : params_(std::move(params)),
      min_history_(min_history_buckets == 0 ? 1 : min_history_buckets) {}

double LinearFeatureForecaster::evaluate(
    const std::array<double, kForecastFeatureCount>& features) const {
  double rate = params_.intercept;
  for (std::size_t i = 0; i < kForecastFeatureCount; ++i) {
    rate += params_.weights[i] * (features[i] - params_.means[i]) /
            params_.scales[i];
  }
  return rate;
}

std::vector<domain::ForecastPoint> LinearFeatureForecaster::predict(
    const std::vector<domain::OccupancyBucket>& history,
    int horizon_hours) const {
  forecast::checkPredictArguments(history, horizon_hours, min_history_);

  using std::chrono::hours;
  const domain::OccupancyBucket& last = history.back();
  const double overall = forecast::meanRate(history);
  const double current = static_cast<double>(last.occupied_count);
  const double last_hour = forecast::meanRateBetween(
      history, last.window_end - hours(1), last.window_end, overall);

  std::vector<domain::ForecastPoint> points;
  for (const Timestamp target : forecast::hourlyTargets(last.window_end,
                                                        horizon_hours)) {
    const int hour = utc_hour(target);
    const int weekday = utc_weekday(target);

    // Same hour of day anywhere in the history, used when last week's slot
    // is not covered.
    double same_hour_sum = 0.0;
    std::size_t same_hour_n = 0;
    for (const auto& bucket : history) {
      if (utc_hour(bucket.window_start) == hour) {
        same_hour_sum += bucket.occupancyRate();
        ++same_hour_n;
      }
    }
    const double same_hour =
        same_hour_n == 0 ? overall
                         : same_hour_sum / static_cast<double>(same_hour_n);
    const Timestamp week_ago = target - hours(24 * 7);
    const double last_week = forecast::meanRateBetween(
        history, week_ago, week_ago + hours(1), same_hour);

    std::array<double, kForecastFeatureCount> x{};
    x[static_cast<std::size_t>(ForecastFeature::Hour)] = hour;
    x[static_cast<std::size_t>(ForecastFeature::DayOfWeek)] = weekday;
    x[static_cast<std::size_t>(ForecastFeature::IsWeekend)] =
        weekday >= 5 ? 1.0 : 0.0;
    x[static_cast<std::size_t>(ForecastFeature::CurrentOccupancy)] = current;
    x[static_cast<std::size_t>(ForecastFeature::AvgOccupancyLastHour)] =
        last_hour;
    x[static_cast<std::size_t>(
        ForecastFeature::AvgOccupancySameHourLastWeek)] = last_week;

    domain::ForecastPoint point;
    point.timestamp = target;
    point.predicted_occupancy_rate = forecast::clampRate(evaluate(x));
    points.push_back(point);
  }
  return points;
}

}  // namespace park
