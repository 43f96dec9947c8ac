#include "park/forecast/forecast_features.hpp"

#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace park {
namespace forecast {

std::vector<Timestamp> hourlyTargets(Timestamp after, int count) {
  const std::chrono::milliseconds hour = std::chrono::hours(1);
  std::vector<Timestamp> out;
  out.reserve(count > 0 ? static_cast<std::size_t>(count) : 0);
  Timestamp t = floor_to(after, hour) + hour;
  for (int i = 0; i < count; ++i) {
    out.push_back(t);
    t += hour;
  }
  return out;
}

double meanRateBetween(const std::vector<domain::OccupancyBucket>& history,
                       Timestamp from, Timestamp to, double fallback) {
  double sum = 0.0;
  std::size_t n = 0;
  for (const auto& bucket : history) {
    if (bucket.window_start >= from && bucket.window_start < to) {
      sum += bucket.occupancyRate();
      ++n;
    }
  }
  return n == 0 ? fallback : sum / static_cast<double>(n);
}

double meanRate(const std::vector<domain::OccupancyBucket>& history) {
  if (history.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& bucket : history) {
    sum += bucket.occupancyRate();
  }
  return sum / static_cast<double>(history.size());
}

double clampRate(double rate) { return std::clamp(rate, 0.0, 1.0); }

void checkPredictArguments(const std::vector<domain::OccupancyBucket>& history,
                           int horizon_hours, std::size_t minimum) {
  if (horizon_hours <= 0) {
    throw InvalidIntervalError("Forecast horizon must be positive");
  }
  if (horizon_hours > kMaxHorizonHours) {
    throw InvalidIntervalError("Forecast horizon must be at most " +
                               std::to_string(kMaxHorizonHours) + " hours");
  }
  if (history.size() < minimum) {
    throw InsufficientHistoryError(history.size(), minimum);
  }
}

}  // namespace forecast
}  // namespace park
