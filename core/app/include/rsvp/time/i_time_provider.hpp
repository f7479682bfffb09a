#pragma once

#include "rsvp/domain/types.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-gated rule in the ledger (check-in only inside the event window,
// sweep only after it) asks this interface for the current time. Injecting
// it instead of calling the system clock directly lets tests and the
// simulation mode move time forward explicitly:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller.
//
// Why whole seconds:
//   Event windows are registered as (start_time, duration) in seconds, the
//   same resolution an on-chain block timestamp carries. Finer resolution
//   would only add conversions at every comparison.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Writers (SimulationTimeProvider::advance_time) synchronize internally.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_s()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as whole seconds since the Unix epoch.
  //
  // @details
  // Must never go backwards between two calls observed by the same thread;
  // the ledger relies on this to keep "ended" events ended.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual domain::Seconds now_s() const = 0;
};

}  // namespace rsvp
