#pragma once

#include "park/domain/occupancy.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// IForecaster: abstract occupancy-rate forecasting model
// -----------------------------------------------------------------------------
//
// @brief  Maps an ordered bucket history to hourly ForecastPoints.
//
// @details
// Implementations are swapped through ParkingEngine's configuration
// (forecast.model); callers depend only on this contract:
//   - One point per hour, the first on the first whole hour after the last
//     bucket's window_end, `horizon_hours` points in total.
//   - Deterministic for identical parameters and input.
//   - Every predicted_occupancy_rate in [0, 1].
//   - history.size() < minimumHistory() -> InsufficientHistoryError, never a
//     partial or made-up forecast.
//   - horizon_hours <= 0 -> InvalidIntervalError.
//
// Thread model:
//   predict() is const and must not mutate shared state; the engine calls it
//   from concurrent request handlers.
// -----------------------------------------------------------------------------
class IForecaster {
 public:
  virtual ~IForecaster() = default;

  virtual std::vector<domain::ForecastPoint> predict(
      const std::vector<domain::OccupancyBucket>& history,
      int horizon_hours) const = 0;

  // Fewest buckets predict() accepts.
  virtual std::size_t minimumHistory() const = 0;

  // Short model identifier reported by the boundary ("seasonal", "linear").
  virtual std::string name() const = 0;
};

}  // namespace park
