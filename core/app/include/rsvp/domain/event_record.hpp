#pragma once

#include "rsvp/domain/types.hpp"

#include <cstdint>
#include <string>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// EventRecord
// -----------------------------------------------------------------------------
//
// @brief  Immutable description of a registered event: who owns it, how many
//         attendees it admits, what a reservation costs, and when it runs.
//
// @details
// Created once by EventRegistry::createEvent() and never modified or deleted
// afterwards. The aggregate escrowed balance is NOT part of the record; it is
// mutable state owned by the ReservationLedger and lives alongside the record
// under the same event id.
//
// Field invariants (enforced at creation):
//   capacity   >= 1
//   price      >= 1   (no free events)
//   start_time >= 1
//   duration   >= 1
//   start_time + duration does not overflow Seconds
//   owner is non-empty (owner doubles as the existence sentinel)
//
// The event window is the half-open interval [start_time, start_time +
// duration): check-in is possible at start_time and no longer possible at
// start_time + duration, which is also the first instant the owner may sweep.
//
// Thread model:
//   Value type. The authoritative copy lives in EventRegistry and is only
//   read under the SettlementEngine lock; copies in notifications are
//   snapshots.
// -----------------------------------------------------------------------------
struct EventRecord {
  EventId id{0};             // Assigned by the registry, never reused
  ParticipantId owner;       // Creator; the only caller allowed to sweep
  std::string name;          // Display label, opaque to the engine
  std::uint32_t capacity{0}; // Max concurrent STAKED reservations
  Amount price{0};           // Minimum stake per reservation
  Seconds start_time{0};     // First second of the window
  Seconds duration{0};       // Window length in seconds
};

// -----------------------------------------------------------------------------
// windowEnd
// -----------------------------------------------------------------------------
// @brief  First second after the event window, i.e. start_time + duration.
//
// @details
// Safe from overflow for every record the registry accepted; the registry
// rejects windows whose end does not fit in Seconds.
// -----------------------------------------------------------------------------
inline Seconds windowEnd(const EventRecord& record) {
  return record.start_time + record.duration;
}

// True iff `now` lies inside [start_time, start_time + duration).
inline bool isInProgress(const EventRecord& record, Seconds now) {
  return now >= record.start_time && now < windowEnd(record);
}

// True iff the window has closed, i.e. now >= start_time + duration.
inline bool hasEnded(const EventRecord& record, Seconds now) {
  return now >= windowEnd(record);
}

// -----------------------------------------------------------------------------
// EventMetadata
// -----------------------------------------------------------------------------
// Responsibility: Result of the permissive metadata query. Both fields are
// empty for an unknown event id; callers probe existence by checking
// owner.empty().
// -----------------------------------------------------------------------------
struct EventMetadata {
  std::string name;
  ParticipantId owner;
};

}  // namespace domain
}  // namespace rsvp
