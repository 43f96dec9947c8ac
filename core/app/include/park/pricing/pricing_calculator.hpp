#pragma once

#include "park/domain/parking_space.hpp"
#include "park/events/event_types.hpp"
#include "park/registry/space_registry.hpp"

#include <string>

namespace park {

struct PriceQuote {
  domain::SpaceId space_id;
  double duration_hours{0.0};
  double hourly_rate{0.0};
  double total_cost{0.0};  // Rounded to cents
  std::string currency;
};

// -----------------------------------------------------------------------------
// PricingCalculator
// -----------------------------------------------------------------------------
//
// @brief  (space, interval) -> cost. Pure: no state besides the currency
//         label and a reference to the immutable registry.
//
// @details
// duration_hours is fractional; total_cost = duration_hours * hourly_rate
// computed in full precision and rounded half away from zero to the cent
// only when the quote is built. Nothing is rounded twice, so the cost of
// an interval does not depend on how often it has been quoted.
// -----------------------------------------------------------------------------
class PricingCalculator {
 public:
  PricingCalculator(const SpaceRegistry& registry, std::string currency);

  // @throws InvalidIntervalError if end <= start.
  PriceQuote cost(const domain::ParkingSpace& space, Timestamp start,
                  Timestamp end) const;

  // @throws InvalidSpaceError if the id is unknown.
  PriceQuote cost(const domain::SpaceId& space_id, Timestamp start,
                  Timestamp end) const;

  const std::string& currency() const { return currency_; }

  static double roundToMinorUnit(double amount);

 private:
  const SpaceRegistry& registry_;
  std::string currency_;
};

}  // namespace park
