#pragma once

#include "park/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// ReferenceGenerator: thread-safe source of booking and payment references
// -----------------------------------------------------------------------------
//
// @brief  Produces human-readable, unique references of the form
//         <prefix><YYYYMMDDHHMMSS><seq>, e.g. "BK202503011015000A3F".
//
// @details
// The timestamp part comes from the injected ITimeProvider (UTC). The
// sequence part is an atomic counter rendered as 4 upper-case base-36
// digits, so two references minted within the same second still differ.
// The counter wraps after 36^4 (1,679,616) references; references then
// stay unique as long as fewer than that many are minted in one second.
//
// Thread model:
//   next() is safe to call concurrently from any thread. The counter uses
//   fetch_add(relaxed): uniqueness is the only requirement, there is no
//   ordering with other memory.
//
// Ownership:
//   One instance per reference family, owned by BookingEngine as value
//   members. Holds a reference to the time provider, which must outlive it.
// -----------------------------------------------------------------------------
class ReferenceGenerator {
 public:
  ReferenceGenerator(std::string prefix, const ITimeProvider& time_provider)
      : prefix_(std::move(prefix)), time_provider_(time_provider) {}

  // A second generator with the same counter would mint duplicates.
  ReferenceGenerator(const ReferenceGenerator&) = delete;
  ReferenceGenerator& operator=(const ReferenceGenerator&) = delete;
  ReferenceGenerator(ReferenceGenerator&&) = delete;
  ReferenceGenerator& operator=(ReferenceGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @brief  Returns a new reference. Never returns the same value twice for
  //         the lifetime of this generator (see wrap note above).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  std::string next();

  const std::string& prefix() const { return prefix_; }

 private:
  std::string prefix_;
  const ITimeProvider& time_provider_;
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace park
