#pragma once

#include <optional>
#include <string>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// VehicleType
// -----------------------------------------------------------------------------
// Responsibility: Classifies the vehicle reported by the detector or named in
// a booking, and the optional restriction carried by a ParkingSpace.
// Unknown spellings are rejected at the boundary (parseVehicleType).
// -----------------------------------------------------------------------------
enum class VehicleType {
  Car,
  Motorcycle,
  Truck,
  Bus,
  Bicycle,
};

inline const char* toString(VehicleType type) {
  switch (type) {
    case VehicleType::Car:        return "car";
    case VehicleType::Motorcycle: return "motorcycle";
    case VehicleType::Truck:      return "truck";
    case VehicleType::Bus:        return "bus";
    case VehicleType::Bicycle:    return "bicycle";
  }
  return "unknown";
}

// Case-sensitive, lower-case spellings as produced by toString().
inline std::optional<VehicleType> parseVehicleType(const std::string& text) {
  if (text == "car") return VehicleType::Car;
  if (text == "motorcycle") return VehicleType::Motorcycle;
  if (text == "truck") return VehicleType::Truck;
  if (text == "bus") return VehicleType::Bus;
  if (text == "bicycle") return VehicleType::Bicycle;
  return std::nullopt;
}

}  // namespace domain
}  // namespace park
