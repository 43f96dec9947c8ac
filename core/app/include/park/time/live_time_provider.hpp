#pragma once

#include "park/time/i_time_provider.hpp"

#include <cstdint>

namespace park {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time source
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider backed by std::chrono::system_clock. Used by the
//         production binary; tests use SimulationTimeProvider.
//
// Thread model: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() = default;

  std::int64_t now_ms() const override;
};

}  // namespace park
