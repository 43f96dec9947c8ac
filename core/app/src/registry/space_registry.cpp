#include "park/registry/space_registry.hpp"

#include "park/common/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace park {

SpaceRegistry::SpaceRegistry(const LotLayout& layout) {
  if (layout.rows <= 0 || layout.columns <= 0) {
    throw std::invalid_argument("Lot layout needs positive rows and columns");
  }
  if (layout.default_hourly_rate < 0.0) {
    throw std::invalid_argument("Hourly rate must not be negative");
  }

  spaces_.reserve(static_cast<std::size_t>(layout.rows) *
                  static_cast<std::size_t>(layout.columns));
  int index = 1;
  for (int row = 0; row < layout.rows; ++row) {
    for (int column = 0; column < layout.columns; ++column) {
      domain::ParkingSpace space;
      space.id = spaceIdFor(index++);
      space.row = row;
      space.column = column;
      space.hourly_rate = layout.default_hourly_rate;
      spaces_.push_back(std::move(space));
    }
  }
  buildIndex();

  for (const auto& override_entry : layout.overrides) {
    auto it = index_.find(override_entry.id);
    if (it == index_.end()) {
      throw InvalidSpaceError(override_entry.id);
    }
    domain::ParkingSpace& space = spaces_[it->second];
    if (override_entry.hourly_rate) {
      if (*override_entry.hourly_rate < 0.0) {
        throw std::invalid_argument("Hourly rate must not be negative for " +
                                    space.id);
      }
      space.hourly_rate = *override_entry.hourly_rate;
    }
    if (override_entry.vehicle_restriction) {
      space.vehicle_restriction = override_entry.vehicle_restriction;
    }
  }

  std::cout << "[SpaceRegistry] Provisioned " << spaces_.size()
            << " space(s) in " << layout.rows << "x" << layout.columns
            << " grid\n";
}

SpaceRegistry::SpaceRegistry(std::vector<domain::ParkingSpace> spaces)
    : spaces_(std::move(spaces)) {
  std::sort(spaces_.begin(), spaces_.end(),
            [](const domain::ParkingSpace& a, const domain::ParkingSpace& b) {
              return a.id < b.id;
            });
  buildIndex();
  if (index_.size() != spaces_.size()) {
    throw std::invalid_argument("Duplicate parking space id in catalog");
  }
}

void SpaceRegistry::buildIndex() {
  index_.clear();
  index_.reserve(spaces_.size());
  for (std::size_t i = 0; i < spaces_.size(); ++i) {
    index_.emplace(spaces_[i].id, i);
  }
}

const domain::ParkingSpace* SpaceRegistry::find(
    const domain::SpaceId& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &spaces_[it->second];
}

const domain::ParkingSpace& SpaceRegistry::at(const domain::SpaceId& id) const {
  const domain::ParkingSpace* space = find(id);
  if (space == nullptr) {
    throw InvalidSpaceError(id);
  }
  return *space;
}

bool SpaceRegistry::contains(const domain::SpaceId& id) const {
  return index_.count(id) != 0;
}

std::vector<domain::SpaceId> SpaceRegistry::ids() const {
  std::vector<domain::SpaceId> out;
  out.reserve(spaces_.size());
  for (const auto& space : spaces_) {
    out.push_back(space.id);
  }
  return out;
}

domain::SpaceId SpaceRegistry::spaceIdFor(int index) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "P%03d", index);
  return domain::SpaceId(buf);
}

}  // namespace park
