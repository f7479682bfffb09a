#pragma once

#include "rsvp/domain/types.hpp"

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// ReservationStatus — per (event, participant) lifecycle
// -----------------------------------------------------------------------------
//
// @brief  The three states a participant can occupy for a given event.
//
// @details
// The lifecycle only moves forward:
//
//   None ──reserve──> Staked ──checkIn (inside window)──> Settled
//
// Terminal state: Settled. A participant who has checked in can neither
// reserve nor check in again for the same event.
//
// None is never stored. A participant with no entry in the ReservationLedger
// is implicitly None; the ledger materializes an entry on the first
// successful reserve.
//
// A sweep does not move anyone: no-shows stay Staked and are marked
// forfeited on their Reservation (see below).
// -----------------------------------------------------------------------------
enum class ReservationStatus {
  None,     // No reservation for this event
  Staked,   // Funds escrowed, slot held, not yet checked in
  Settled,  // Checked in during the window, stake returned; terminal
};

// "none" / "staked" / "settled"; used on the command channel.
inline const char* reservationStatusToString(ReservationStatus status) {
  switch (status) {
    case ReservationStatus::None:    return "none";
    case ReservationStatus::Staked:  return "staked";
    case ReservationStatus::Settled: return "settled";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Reservation
// -----------------------------------------------------------------------------
//
// @brief  One participant's reservation for one event.
//
// @details
// `stake` is the exact amount this participant escrowed (amount sent, which
// may exceed the event price). A check-in refunds exactly this amount; the
// refund is never derived from the event's aggregate balance.
//
// `forfeited` is set by a sweep on every reservation that was still Staked
// at the time: the stake now belongs to the organizer and no longer counts
// towards the escrowed balance. The status stays Staked.
// -----------------------------------------------------------------------------
struct Reservation {
  ReservationStatus status{ReservationStatus::None};
  Amount stake{0};
  bool forfeited{false};
};

}  // namespace domain
}  // namespace rsvp
