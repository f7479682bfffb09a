#pragma once

#include "rsvp/time/i_time_provider.hpp"

#include <atomic>

namespace rsvp {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock,
//         truncated to whole seconds.
//
// @details
// Used when the service runs with `"clock": "live"`. system_clock can in
// principle be stepped backwards by the operating system; the provider
// clamps its result to the largest value it has returned so far so callers
// always observe a monotonic clock.
//
// Thread model:
//   Safe to call from any thread. The high-water mark is a std::atomic.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  domain::Seconds now_s() const override;

 private:
  mutable std::atomic<domain::Seconds> high_water_s_{0};
};

}  // namespace rsvp
