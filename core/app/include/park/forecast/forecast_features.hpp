#pragma once

#include "park/domain/occupancy.hpp"
#include "park/events/event_types.hpp"

#include <cstddef>
#include <vector>

namespace park {
namespace forecast {

// Longest forecast horizon, one week ahead.
constexpr int kMaxHorizonHours = 24 * 7;

// Hourly target instants: the first whole hour strictly after `after`, then
// one per hour, `count` in total.
std::vector<Timestamp> hourlyTargets(Timestamp after, int count);

// Mean occupancy rate of buckets whose window_start lies in [from, to).
// Returns `fallback` if none does.
double meanRateBetween(const std::vector<domain::OccupancyBucket>& history,
                       Timestamp from, Timestamp to, double fallback);

// Mean occupancy rate of all buckets; 0 for an empty history.
double meanRate(const std::vector<domain::OccupancyBucket>& history);

double clampRate(double rate);

// Shared argument checks for IForecaster::predict(). The horizon must be
// in [1, kMaxHorizonHours].
void checkPredictArguments(const std::vector<domain::OccupancyBucket>& history,
                           int horizon_hours, std::size_t minimum);

}  // namespace forecast
}  // namespace park
