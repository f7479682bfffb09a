#pragma once

#include "rsvp/domain/reservation_status.hpp"
#include "rsvp/domain/types.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventBook — per-event escrow state
// -----------------------------------------------------------------------------
//
// @brief  Everything about an event that changes after creation: the
//         aggregate escrowed balance, the slot counters and the
//         per-participant reservations.
//
// @details
// Accounting invariant (checked by ReservationLedger::isBalanced):
//   escrowed_balance == Σ r.stake  over r with status Staked && !forfeited
//   staked_count     == |{ r : status Staked }|
//   settled_count    == |{ r : status Settled }|
//
// staked_count includes forfeited no-shows: they still hold their slot.
// total_swept is the lifetime sum the owner has withdrawn.
// -----------------------------------------------------------------------------
struct EventBook {
  domain::Amount escrowed_balance{0};
  std::uint32_t staked_count{0};
  std::uint32_t settled_count{0};
  domain::Amount total_swept{0};
  std::unordered_map<domain::ParticipantId, domain::Reservation> reservations;
};

// -----------------------------------------------------------------------------
// SweepReceipt
// -----------------------------------------------------------------------------
// Responsibility: What drain() took, kept so the engine can undo it if the
// payout to the owner fails.
// -----------------------------------------------------------------------------
struct SweepReceipt {
  domain::Amount amount{0};
  std::vector<domain::ParticipantId> forfeited;
};

// -----------------------------------------------------------------------------
// ReservationLedger — per-event, per-participant reservation state
// -----------------------------------------------------------------------------
//
// @brief  Owns one EventBook per registered event and applies the three
//         state changes of the escrow state machine to it.
//
// @details
// The ledger is pure bookkeeping: it neither checks time windows nor
// authorization nor capacity (the SettlementEngine does that, because the
// order in which preconditions are reported is part of the contract). It
// does refuse transitions the state machine forbids:
//
//   None   -> Staked    stake()
//   Staked -> Settled   settle()
//
// Any other transition requested through stake()/settle() is a programming
// error in the caller and throws std::logic_error without touching state.
//
// Rollback:
//   revertStake(), revertSettle() and revertDrain() undo the most recent
//   matching mutation exactly. They exist for one purpose: the engine commits
//   bookkeeping BEFORE asking the custodian to move funds, and if the
//   custodian refuses, the operation must leave no trace. They are not a
//   general "move state backwards" facility and are only called for a
//   mutation made within the same engine call.
//
// Thread model:
//   NOT internally synchronized. Accessed only under the SettlementEngine
//   lock.
// -----------------------------------------------------------------------------
class ReservationLedger {
 public:
  ReservationLedger() = default;

  ReservationLedger(const ReservationLedger&) = delete;
  ReservationLedger& operator=(const ReservationLedger&) = delete;
  ReservationLedger(ReservationLedger&&) = delete;
  ReservationLedger& operator=(ReservationLedger&&) = delete;

  // Creates an empty book for a newly registered event. Idempotent.
  void openBook(domain::EventId event_id);

  // The event's book, or nullptr if none was opened.
  const EventBook* book(domain::EventId event_id) const;

  // The participant's reservation; a default (None, stake 0) value if the
  // participant never reserved or the event has no book.
  domain::Reservation reservation(domain::EventId event_id,
                                  const domain::ParticipantId& participant)
      const;

  domain::ReservationStatus status(
      domain::EventId event_id,
      const domain::ParticipantId& participant) const;

  // -------------------------------------------------------------------------
  // stake(event_id, participant, amount)
  // -------------------------------------------------------------------------
  // @brief  None -> Staked. Records `amount` as the participant's stake,
  //         adds it to the escrowed balance, increments staked_count.
  //
  // @throws std::logic_error     participant is not None, or no book.
  //         std::overflow_error  the escrowed balance would overflow.
  //         Nothing is changed when either is thrown.
  // -------------------------------------------------------------------------
  void stake(domain::EventId event_id,
             const domain::ParticipantId& participant,
             domain::Amount amount);

  // -------------------------------------------------------------------------
  // settle(event_id, participant)
  // -------------------------------------------------------------------------
  // @brief  Staked -> Settled. Removes the participant's own stake from the
  //         escrowed balance and moves them from staked to settled count.
  //
  // @return The stake to refund, which is exactly what this participant sent.
  //
  // @throws std::logic_error  participant is not Staked, is forfeited, or no
  //                           book.
  // -------------------------------------------------------------------------
  domain::Amount settle(domain::EventId event_id,
                        const domain::ParticipantId& participant);

  // -------------------------------------------------------------------------
  // drain(event_id)
  // -------------------------------------------------------------------------
  // @brief  Zeroes the escrowed balance and marks every Staked, not yet
  //         forfeited reservation as forfeited.
  //
  // @return The amount drained and who forfeited. amount is 0 when there was
  //         nothing to drain (nothing is changed in that case).
  // -------------------------------------------------------------------------
  SweepReceipt drain(domain::EventId event_id);

  // Undo stake(): erases the reservation and its contribution.
  void revertStake(domain::EventId event_id,
                   const domain::ParticipantId& participant);

  // Undo settle(): participant back to Staked with its stake re-escrowed.
  void revertSettle(domain::EventId event_id,
                    const domain::ParticipantId& participant);

  // Undo drain(): restores the balance and clears the forfeited marks.
  void revertDrain(domain::EventId event_id, const SweepReceipt& receipt);

  // True iff the event's book satisfies the accounting invariant (see
  // EventBook). An event with no book is trivially balanced.
  bool isBalanced(domain::EventId event_id) const;

  // Σ escrowed_balance across all books: what the custodian should be
  // holding on behalf of this ledger.
  domain::Amount totalEscrowed() const;

  // -------------------------------------------------------------------------
  // isLegalTransition(from, to)
  // -------------------------------------------------------------------------
  // @brief  The escrow state machine's transition table.
  //
  // @return true only for None -> Staked and Staked -> Settled.
  // -------------------------------------------------------------------------
  static bool isLegalTransition(domain::ReservationStatus from,
                                domain::ReservationStatus to);

 private:
  EventBook& mutableBook(domain::EventId event_id);

  std::unordered_map<domain::EventId, EventBook> books_;
};

}  // namespace rsvp
