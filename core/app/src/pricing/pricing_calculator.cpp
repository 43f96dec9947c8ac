#include "park/pricing/pricing_calculator.hpp"

#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <cmath>

namespace park {

PricingCalculator::PricingCalculator(const SpaceRegistry& registry,
                                     std::string currency)
    : registry_(registry), currency_(std::move(currency)) {}

double PricingCalculator::roundToMinorUnit(double amount) {
  return std::round(amount * 100.0) / 100.0;
}

PriceQuote PricingCalculator::cost(const domain::ParkingSpace& space,
                                   Timestamp start, Timestamp end) const {
  if (end <= start) {
    throw InvalidIntervalError("end_time must be after start_time");
  }
  PriceQuote quote;
  quote.space_id = space.id;
  quote.duration_hours = hours_between(start, end);
  quote.hourly_rate = space.hourly_rate;
  quote.total_cost = roundToMinorUnit(quote.duration_hours * space.hourly_rate);
  quote.currency = currency_;
  return quote;
}

PriceQuote PricingCalculator::cost(const domain::SpaceId& space_id,
                                   Timestamp start, Timestamp end) const {
  return cost(registry_.at(space_id), start, end);
}

}  // namespace park
