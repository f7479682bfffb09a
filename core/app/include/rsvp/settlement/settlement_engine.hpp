#pragma once

#include "rsvp/custody/i_custodian.hpp"
#include "rsvp/domain/event_record.hpp"
#include "rsvp/domain/reservation_status.hpp"
#include "rsvp/domain/types.hpp"
#include "rsvp/eventbus/notification_bus.hpp"
#include "rsvp/ledger/reservation_ledger.hpp"
#include "rsvp/registry/event_registry.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventSnapshot
// -----------------------------------------------------------------------------
// Responsibility: Point-in-time copy of an event's record and escrow state,
// returned by SettlementEngine::eventSnapshot(). Safe to hold after the
// engine lock is released.
// -----------------------------------------------------------------------------
struct EventSnapshot {
  domain::EventRecord record;
  domain::Amount escrowed_balance{0};
  std::uint32_t staked_count{0};
  std::uint32_t settled_count{0};
  domain::Amount total_swept{0};
};

// -----------------------------------------------------------------------------
// SettlementEngine — the escrow state machine
// -----------------------------------------------------------------------------
//
// @brief  Single entry point for every ledger operation. Owns the
//         EventRegistry and the ReservationLedger, checks preconditions,
//         commits bookkeeping, moves funds through the ICustodian and
//         publishes a notification per successful operation.
//
// @details
// Operation skeleton (reserve, checkIn, sweep):
//
//   1. Take the engine lock.
//   2. Check preconditions in the documented order; the first failure
//      throws LedgerError and nothing has changed.
//   3. Commit the bookkeeping change in the ReservationLedger.
//   4. Ask the custodian to move funds. This is the LAST step. If it throws
//      CustodyError, undo step 3 exactly and rethrow. If a payout throws
//      RecipientError the funds have moved, so step 3 stands.
//   5. Release the lock, then publish the notification. A RecipientError
//      from step 4 is rethrown after publishing.
//
// Committing before transferring closes the reentrancy window: a custodian
// that hands control to the recipient during a payout lets the recipient
// call back into the engine, and that nested call already sees the updated
// state. A second check-in is refused with AlreadyCheckedIn and a second
// sweep with NothingToWithdraw instead of paying twice.
//
// Time gating:
//   checkIn() requires now in [start_time, start_time + duration).
//   sweep()   requires now >= start_time + duration.
//   reserve() is not time-gated.
//
// Refund rule:
//   A participant may escrow more than the price. The full amount sent is
//   that participant's stake; check-in refunds exactly that stake, never a
//   share of the aggregate.
//
// Thread model:
//   Every public method, queries included, runs under one
//   std::recursive_mutex: operations on different events are serialized
//   too. The mutex is recursive so a nested call made from inside a
//   custodian payout on the same thread re-enters instead of deadlocking.
//   Notifications are published on the calling thread after the lock is
//   released.
//
// Ownership:
//   Borrows the clock, the custodian and the bus; all three must outlive the
//   engine. Owns the registry and the ledger.
// -----------------------------------------------------------------------------
class SettlementEngine {
 public:
  SettlementEngine(const ITimeProvider& clock, ICustodian& custodian,
                   NotificationBus& bus);

  SettlementEngine(const SettlementEngine&) = delete;
  SettlementEngine& operator=(const SettlementEngine&) = delete;
  SettlementEngine(SettlementEngine&&) = delete;
  SettlementEngine& operator=(SettlementEngine&&) = delete;

  // -------------------------------------------------------------------------
  // createEvent(caller, name, capacity, price, start_time, duration)
  // -------------------------------------------------------------------------
  // @brief  Registers an event owned by `caller` and opens its book.
  //
  // @return The assigned EventId (1 for the first event, then 2, 3, ...).
  //
  // @throws LedgerError  MissingCapacity, MissingPrice, MissingStartTime,
  //                      MissingDuration, Unauthorized, InvalidWindow (see
  //                      EventRegistry::createEvent for the order).
  //
  // Publishes: EventCreatedNotification.
  // -------------------------------------------------------------------------
  domain::EventId createEvent(const domain::ParticipantId& caller,
                              const std::string& name,
                              std::uint32_t capacity,
                              domain::Amount price,
                              domain::Seconds start_time,
                              domain::Seconds duration);

  // Name and owner; empty values for an unknown id. Never throws.
  domain::EventMetadata getEventMetadata(domain::EventId event_id) const;

  bool eventExists(domain::EventId event_id) const;

  // -------------------------------------------------------------------------
  // reserve(event_id, participant, amount_sent)
  // -------------------------------------------------------------------------
  // @brief  None -> Staked. Escrows amount_sent and takes one slot.
  //
  // @throws LedgerError, first failing check wins:
  //           EventNotFound     no such event
  //           PriceNotMet       amount_sent < price
  //           AlreadyReserved   participant is Staked
  //           AlreadyCheckedIn  participant is Settled
  //           Overbooked        staked_count == capacity
  //           Unauthorized      participant is empty
  //         CustodyError        the custodian could not collect; the
  //                             reservation has been rolled back.
  //
  // Publishes: ReservedNotification(event_id, participant, amount_sent).
  // -------------------------------------------------------------------------
  void reserve(domain::EventId event_id,
               const domain::ParticipantId& participant,
               domain::Amount amount_sent);

  // -------------------------------------------------------------------------
  // checkIn(event_id, participant)
  // -------------------------------------------------------------------------
  // @brief  Staked -> Settled. Refunds the participant's stake.
  //
  // @throws LedgerError, first failing check wins:
  //           EventNotFound        no such event
  //           AlreadyCheckedIn     participant is Settled
  //           ReservationNotFound  participant is None
  //           EventNotInProgress   now outside [start, start + duration)
  //         CustodyError           the refund could not be paid; the
  //                                check-in has been rolled back.
  //         RecipientError         the refund was paid and the recipient
  //                                then failed; the check-in stands.
  //
  // Publishes: CheckedInNotification(event_id, participant).
  // -------------------------------------------------------------------------
  void checkIn(domain::EventId event_id,
               const domain::ParticipantId& participant);

  // -------------------------------------------------------------------------
  // sweep(event_id, caller)
  // -------------------------------------------------------------------------
  // @brief  Pays everything still escrowed for the event to its owner.
  //
  // @return The amount swept (always > 0 on success).
  //
  // @throws LedgerError, first failing check wins:
  //           EventNotFound      no such event
  //           NotCreator         caller is not the owner
  //           EventNotEnded      now < start + duration
  //           NothingToWithdraw  escrowed balance is 0
  //         CustodyError         the payout failed; the sweep has been
  //                              rolled back.
  //         RecipientError       the payout was made and the owner then
  //                              failed; the sweep stands.
  //
  // Publishes: WithdrawnNotification(event_id, amount).
  // -------------------------------------------------------------------------
  domain::Amount sweep(domain::EventId event_id,
                       const domain::ParticipantId& caller);

  // Record plus escrow state, or std::nullopt for an unknown id.
  std::optional<EventSnapshot> eventSnapshot(domain::EventId event_id) const;

  // The participant's reservation; (None, 0) when there is none.
  domain::Reservation reservation(
      domain::EventId event_id,
      const domain::ParticipantId& participant) const;

  std::size_t eventCount() const;

  // Σ escrowed balance over all events.
  domain::Amount totalEscrowed() const;

  // Accounting invariant for one event (see EventBook).
  bool isBalanced(domain::EventId event_id) const;

 private:
  std::uint64_t nextSequence() { return next_sequence_++; }

  const ITimeProvider& clock_;
  ICustodian& custodian_;
  NotificationBus& bus_;

  // Guards everything below. Recursive: see the class comment.
  mutable std::recursive_mutex mutex_;

  EventRegistry registry_;
  ReservationLedger ledger_;
  std::uint64_t next_sequence_{1};
};

}  // namespace rsvp
