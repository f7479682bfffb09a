#pragma once

#include "rsvp/concurrent/event_id_generator.hpp"
#include "rsvp/domain/event_record.hpp"
#include "rsvp/domain/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventRegistry — creation, validation and lookup of event records
// -----------------------------------------------------------------------------
//
// @brief  Owns every EventRecord ever created, keyed by EventId.
//
// @details
// Records are inserted once by createEvent() and never modified or erased;
// the registry is the permanent history of what was registered.
//
// Two lookup surfaces with different failure behavior:
//
//   Permissive (read path):  getEventMetadata(), eventExists(), find().
//     Never throw. An unknown id yields empty metadata / false / nullptr.
//     Collaborators probe existence through these without an error path.
//
//   Strict (mutating path):  require().
//     Throws LedgerError(EventNotFound) for an unknown id. reserve(),
//     checkIn() and sweep() go through this.
//
// Existence sentinel:
//   An event exists iff an owner has been recorded for its id. createEvent()
//   refuses an empty owner, so a stored record always has a non-empty one.
//
// Thread model:
//   NOT internally synchronized. The SettlementEngine owns the registry and
//   serializes every access under its lock.
//
// Ownership:
//   Owned by SettlementEngine as a value member.
// -----------------------------------------------------------------------------
class EventRegistry {
 public:
  EventRegistry() = default;

  EventRegistry(const EventRegistry&) = delete;
  EventRegistry& operator=(const EventRegistry&) = delete;
  EventRegistry(EventRegistry&&) = delete;
  EventRegistry& operator=(EventRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // createEvent(owner, name, capacity, price, start_time, duration)
  // -------------------------------------------------------------------------
  // @brief  Validates the request, assigns the next id and stores the record.
  //
  // @return The stored record (by value), including the assigned id.
  //
  // @throws LedgerError, first failing check wins, in this order:
  //           MissingCapacity   capacity == 0
  //           MissingPrice      price == 0
  //           MissingStartTime  start_time == 0
  //           MissingDuration   duration == 0
  //           Unauthorized      owner is empty
  //           InvalidWindow     start_time + duration overflows Seconds
  //
  // @details
  // The id is allocated only after every check has passed, so rejected
  // requests never consume one. The name is stored as given; it may be empty.
  // -------------------------------------------------------------------------
  domain::EventRecord createEvent(const domain::ParticipantId& owner,
                                  const std::string& name,
                                  std::uint32_t capacity,
                                  domain::Amount price,
                                  domain::Seconds start_time,
                                  domain::Seconds duration);

  // Name and owner of the event; both empty for an unknown id.
  domain::EventMetadata getEventMetadata(domain::EventId id) const;

  // True iff an owner is recorded for the id.
  bool eventExists(domain::EventId id) const;

  // Pointer to the stored record, or nullptr. Valid until the registry is
  // destroyed (records are never erased, and unordered_map keeps element
  // addresses stable across rehashing).
  const domain::EventRecord* find(domain::EventId id) const;

  // Reference to the stored record; throws LedgerError(EventNotFound).
  const domain::EventRecord& require(domain::EventId id) const;

  // Number of registered events.
  std::size_t size() const { return events_.size(); }

  // Id the next successful createEvent() will assign.
  domain::EventId nextId() const { return id_gen_.peek(); }

 private:
  EventIdGenerator id_gen_;
  std::unordered_map<domain::EventId, domain::EventRecord> events_;
};

}  // namespace rsvp
