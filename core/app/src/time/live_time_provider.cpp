#include "rsvp/time/live_time_provider.hpp"

#include <chrono>

namespace rsvp {

// -----------------------------------------------------------------------------
// now_s(): delegate to system_clock, truncate to seconds, clamp to monotonic
// -----------------------------------------------------------------------------
domain::Seconds LiveTimeProvider::now_s() const {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                  now.time_since_epoch())
                  .count();
  auto wall = secs > 0 ? static_cast<domain::Seconds>(secs) : 0;

  // Raise the high-water mark if the wall clock moved forward; otherwise
  // report the mark so a backwards step is never observed.
  domain::Seconds seen = high_water_s_.load();
  while (wall > seen && !high_water_s_.compare_exchange_weak(seen, wall)) {
  }
  return wall > seen ? wall : seen;
}

}  // namespace rsvp
