#pragma once

#include <cstdint>
#include <string>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// EventId
// -----------------------------------------------------------------------------
// Responsibility: Identifies a registered event within one ledger instance.
// Ids start at 1 and only ever increase; 0 is reserved as the "unset"
// sentinel so a default-constructed EventRecord never collides with a real
// one.
// -----------------------------------------------------------------------------
using EventId = std::uint64_t;

// -----------------------------------------------------------------------------
// ParticipantId
// -----------------------------------------------------------------------------
// Responsibility: Opaque identity of a caller (organizer or attendee).
// The ledger never interprets it beyond equality. The empty string is the
// "unset" sentinel; it is what getEventMetadata() reports as the owner of an
// unknown event.
// -----------------------------------------------------------------------------
using ParticipantId = std::string;

// -----------------------------------------------------------------------------
// Amount
// -----------------------------------------------------------------------------
// Responsibility: Quantity of the deployment's single fungible unit of value.
// Unsigned and integral: escrow arithmetic must be exact, and a negative
// balance is never a legal state.
// -----------------------------------------------------------------------------
using Amount = std::uint64_t;

// -----------------------------------------------------------------------------
// Seconds
// -----------------------------------------------------------------------------
// Responsibility: Point in time (or a duration) in whole seconds, as reported
// by the engine's ITimeProvider. Event windows are expressed in this unit.
// -----------------------------------------------------------------------------
using Seconds = std::uint64_t;

}  // namespace domain
}  // namespace rsvp
