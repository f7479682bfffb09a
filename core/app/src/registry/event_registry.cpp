#include "rsvp/registry/event_registry.hpp"
#include "rsvp/errors/ledger_error.hpp"

#include <limits>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// createEvent: validate in fixed order, then allocate and store
// -----------------------------------------------------------------------------
domain::EventRecord EventRegistry::createEvent(
    const domain::ParticipantId& owner, const std::string& name,
    std::uint32_t capacity, domain::Amount price, domain::Seconds start_time,
    domain::Seconds duration) {
  if (capacity == 0) {
    throw LedgerError(ErrorCode::MissingCapacity,
                      "capacity must be at least 1");
  }
  if (price == 0) {
    throw LedgerError(ErrorCode::MissingPrice, "free events are not allowed");
  }
  if (start_time == 0) {
    throw LedgerError(ErrorCode::MissingStartTime, "start time is required");
  }
  if (duration == 0) {
    throw LedgerError(ErrorCode::MissingDuration, "duration is required");
  }
  if (owner.empty()) {
    throw LedgerError(ErrorCode::Unauthorized,
                      "an event needs an identified owner");
  }
  if (duration > std::numeric_limits<domain::Seconds>::max() - start_time) {
    throw LedgerError(ErrorCode::InvalidWindow,
                      "start time + duration overflows");
  }

  domain::EventRecord record;
  record.id = id_gen_.next_id();
  record.owner = owner;
  record.name = name;
  record.capacity = capacity;
  record.price = price;
  record.start_time = start_time;
  record.duration = duration;

  events_.emplace(record.id, record);
  return record;
}

// -----------------------------------------------------------------------------
// getEventMetadata: permissive read
// -----------------------------------------------------------------------------
domain::EventMetadata EventRegistry::getEventMetadata(
    domain::EventId id) const {
  const domain::EventRecord* record = find(id);
  if (record == nullptr) {
    return {};
  }
  return {record->name, record->owner};
}

// -----------------------------------------------------------------------------
// eventExists: owner is the existence sentinel
// -----------------------------------------------------------------------------
bool EventRegistry::eventExists(domain::EventId id) const {
  const domain::EventRecord* record = find(id);
  return record != nullptr && !record->owner.empty();
}

// -----------------------------------------------------------------------------
// find / require
// -----------------------------------------------------------------------------
const domain::EventRecord* EventRegistry::find(domain::EventId id) const {
  auto it = events_.find(id);
  return (it != events_.end()) ? &it->second : nullptr;
}

const domain::EventRecord& EventRegistry::require(domain::EventId id) const {
  const domain::EventRecord* record = find(id);
  if (record == nullptr || record->owner.empty()) {
    throw LedgerError(ErrorCode::EventNotFound,
                      "no event with id " + std::to_string(id));
  }
  return *record;
}

}  // namespace rsvp
