#pragma once

#include "park/forecast/i_forecaster.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// SeasonalProfileForecaster: hour-of-day profile blended with the present
// -----------------------------------------------------------------------------
//
// @brief  Default model. Needs no trained parameters.
//
// @details
// From the history it builds the mean occupancy rate per UTC hour of day.
// The point k hours ahead is
//
//     w_k * latest + (1 - w_k) * profile[hour(target)],   w_k = decay^k
//
// where latest is the last bucket's rate. Near-term points follow the
// present; far points converge on the daily pattern. Hours never seen in
// the history use the overall mean.
// -----------------------------------------------------------------------------
class SeasonalProfileForecaster final : public IForecaster {
 public:
  explicit SeasonalProfileForecaster(std::size_t min_history_buckets = 12,
                                     double decay = 0.5);

  std::vector<domain::ForecastPoint> predict(
      const std::vector<domain::OccupancyBucket>& history,
      int horizon_hours) const override;

  std::size_t minimumHistory() const override { return min_history_; }

  std::string name() const override { return "seasonal"; }

 private:
  std::size_t min_history_;
  double decay_;
};

}  // namespace park
