#pragma once

#include "rsvp/time/i_time_provider.hpp"

#include <atomic>

namespace rsvp {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly rather than read from the system clock.
//
// @details
// Used by unit tests and by the service's simulation mode (ADVANCE_TIME
// command). A test can create an event with start_time=1000, duration=2000
// and then place the clock before, inside and after the window without any
// sleeping.
//
// Internal storage:
//   std::atomic<Seconds> current_time_s_
//
// Why std::atomic instead of a mutex:
//   The writer (test body or the IPC command thread) and the readers (the
//   SettlementEngine, on whichever thread calls it) only exchange a single
//   integer. A lock-free atomic gives the same visibility guarantee without
//   blocking.
//
// Monotonicity:
//   advance_time() ignores values earlier than the current time. The ledger
//   treats an ended event as permanently ended; letting the clock step back
//   would reopen check-in after the owner had already swept.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at `initial_s`; 0 means "no time has been set yet".
  explicit SimulationTimeProvider(domain::Seconds initial_s = 0);

  domain::Seconds now_s() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_s)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward to new_time_s.
  //
  // @return true if the clock moved (or already equalled new_time_s), false
  //         if new_time_s was in the past and was ignored.
  //
  // Thread-safety: Safe to call from any thread. Concurrent writers race
  //                forward; the clock ends at the largest value written.
  // -------------------------------------------------------------------------
  bool advance_time(domain::Seconds new_time_s);

 private:
  std::atomic<domain::Seconds> current_time_s_;
};

}  // namespace rsvp
