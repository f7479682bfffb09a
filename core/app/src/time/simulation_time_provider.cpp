#include "rsvp/time/simulation_time_provider.hpp"

namespace rsvp {

SimulationTimeProvider::SimulationTimeProvider(domain::Seconds initial_s)
    : current_time_s_(initial_s) {}

// -----------------------------------------------------------------------------
// now_s(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
domain::Seconds SimulationTimeProvider::now_s() const {
  return current_time_s_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): forward-only atomic write
// -----------------------------------------------------------------------------
bool SimulationTimeProvider::advance_time(domain::Seconds new_time_s) {
  domain::Seconds current = current_time_s_.load();
  while (current < new_time_s) {
    // compare_exchange_weak reloads `current` on failure, so a concurrent
    // writer that moved the clock further forward ends the loop.
    if (current_time_s_.compare_exchange_weak(current, new_time_s)) {
      return true;
    }
  }
  return current == new_time_s;
}

}  // namespace rsvp
