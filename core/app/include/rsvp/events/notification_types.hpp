#pragma once

#include "rsvp/domain/event_record.hpp"
#include "rsvp/domain/types.hpp"

#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// Notification structs
// -----------------------------------------------------------------------------
// Every successful mutating ledger operation publishes exactly one of these
// on the NotificationBus, after its bookkeeping and fund transfer have both
// completed. Failed operations publish nothing.
//
// Common metadata on every notification:
//   timestamp_s — ITimeProvider::now_s() at the time of the operation.
//   sequence_id — engine-wide counter, strictly increasing in commit order.
//                 Lets a subscriber on another thread restore the order in
//                 which operations were applied.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// EventCreatedNotification
// -----------------------------------------------------------------------------
// Responsibility: Announces a newly registered event. Carries the complete
// record, including the assigned id and the owner.
// -----------------------------------------------------------------------------
struct EventCreatedNotification {
  domain::EventRecord record;
  domain::Seconds timestamp_s{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ReservedNotification
// -----------------------------------------------------------------------------
// Responsibility: A participant escrowed `amount` and now holds a slot.
// `amount` is what was sent, which can exceed the event price.
// -----------------------------------------------------------------------------
struct ReservedNotification {
  domain::EventId event_id{0};
  domain::ParticipantId participant;
  domain::Amount amount{0};
  domain::Seconds timestamp_s{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CheckedInNotification
// -----------------------------------------------------------------------------
// Responsibility: A participant checked in during the window and their stake
// was returned.
// -----------------------------------------------------------------------------
struct CheckedInNotification {
  domain::EventId event_id{0};
  domain::ParticipantId participant;
  domain::Seconds timestamp_s{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// WithdrawnNotification
// -----------------------------------------------------------------------------
// Responsibility: The owner swept `amount` of forfeited stakes after the
// event ended.
// -----------------------------------------------------------------------------
struct WithdrawnNotification {
  domain::EventId event_id{0};
  domain::Amount amount{0};
  domain::Seconds timestamp_s{0};
  std::uint64_t sequence_id{0};
};

}  // namespace rsvp
