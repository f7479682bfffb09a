#include "rsvp/settlement/settlement_engine.hpp"
#include "rsvp/errors/ledger_error.hpp"
#include "rsvp/events/notification_types.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace rsvp {

using domain::ReservationStatus;

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SettlementEngine::SettlementEngine(const ITimeProvider& clock,
                                   ICustodian& custodian,
                                   NotificationBus& bus)
    : clock_(clock), custodian_(custodian), bus_(bus) {}

// -----------------------------------------------------------------------------
// createEvent: registry validates and stores, ledger opens the book
// -----------------------------------------------------------------------------
domain::EventId SettlementEngine::createEvent(
    const domain::ParticipantId& caller, const std::string& name,
    std::uint32_t capacity, domain::Amount price, domain::Seconds start_time,
    domain::Seconds duration) {
  EventCreatedNotification created;

  {
    std::lock_guard lock(mutex_);

    created.record = registry_.createEvent(caller, name, capacity, price,
                                           start_time, duration);
    ledger_.openBook(created.record.id);

    created.timestamp_s = clock_.now_s();
    created.sequence_id = nextSequence();
  }

  bus_.publish(created);
  return created.record.id;
}

// -----------------------------------------------------------------------------
// Permissive reads
// -----------------------------------------------------------------------------
domain::EventMetadata SettlementEngine::getEventMetadata(
    domain::EventId event_id) const {
  std::lock_guard lock(mutex_);
  return registry_.getEventMetadata(event_id);
}

bool SettlementEngine::eventExists(domain::EventId event_id) const {
  std::lock_guard lock(mutex_);
  return registry_.eventExists(event_id);
}

// -----------------------------------------------------------------------------
// reserve: None -> Staked, then collect
// -----------------------------------------------------------------------------
void SettlementEngine::reserve(domain::EventId event_id,
                               const domain::ParticipantId& participant,
                               domain::Amount amount_sent) {
  ReservedNotification reserved;

  {
    std::lock_guard lock(mutex_);

    // --- Preconditions, in contract order ---------------------------------
    const domain::EventRecord& record = registry_.require(event_id);

    if (amount_sent < record.price) {
      throw LedgerError(ErrorCode::PriceNotMet,
                        "sent " + std::to_string(amount_sent) +
                            ", price is " + std::to_string(record.price));
    }

    ReservationStatus current = ledger_.status(event_id, participant);
    if (current == ReservationStatus::Staked) {
      throw LedgerError(ErrorCode::AlreadyReserved,
                        "'" + participant + "' already holds a slot");
    }
    if (current == ReservationStatus::Settled) {
      throw LedgerError(ErrorCode::AlreadyCheckedIn,
                        "'" + participant + "' already checked in");
    }

    const EventBook* book = ledger_.book(event_id);
    if (book != nullptr && book->staked_count >= record.capacity) {
      throw LedgerError(ErrorCode::Overbooked,
                        "all " + std::to_string(record.capacity) +
                            " slots are taken");
    }

    if (participant.empty()) {
      throw LedgerError(ErrorCode::Unauthorized,
                        "a reservation needs an identified participant");
    }

    // --- Commit, then move funds ------------------------------------------
    ledger_.stake(event_id, participant, amount_sent);

    try {
      custodian_.collect(participant, amount_sent);
    } catch (const CustodyError& e) {
      ledger_.revertStake(event_id, participant);
      std::cerr << "[SettlementEngine] WARNING: collect from '" << participant
                << "' for event " << event_id << " failed (" << e.what()
                << "). Reservation rolled back.\n";
      throw;
    }

    reserved.event_id = event_id;
    reserved.participant = participant;
    reserved.amount = amount_sent;
    reserved.timestamp_s = clock_.now_s();
    reserved.sequence_id = nextSequence();
  }

  bus_.publish(reserved);
}

// -----------------------------------------------------------------------------
// checkIn: Staked -> Settled inside the window, then refund
// -----------------------------------------------------------------------------
void SettlementEngine::checkIn(domain::EventId event_id,
                               const domain::ParticipantId& participant) {
  CheckedInNotification checked_in;
  std::exception_ptr recipient_failure;

  {
    std::lock_guard lock(mutex_);

    // --- Preconditions, in contract order ---------------------------------
    const domain::EventRecord& record = registry_.require(event_id);

    domain::Reservation current = ledger_.reservation(event_id, participant);
    if (current.status == ReservationStatus::Settled) {
      throw LedgerError(ErrorCode::AlreadyCheckedIn,
                        "'" + participant + "' already checked in");
    }
    if (current.status != ReservationStatus::Staked) {
      throw LedgerError(ErrorCode::ReservationNotFound,
                        "'" + participant + "' has no reservation for event " +
                            std::to_string(event_id));
    }

    domain::Seconds now = clock_.now_s();
    if (!domain::isInProgress(record, now)) {
      throw LedgerError(ErrorCode::EventNotInProgress,
                        "now=" + std::to_string(now) + " is outside [" +
                            std::to_string(record.start_time) + ", " +
                            std::to_string(domain::windowEnd(record)) + ")");
    }

    // --- Commit, then refund ----------------------------------------------
    domain::Amount refund = ledger_.settle(event_id, participant);

    try {
      custodian_.payout(participant, refund);
    } catch (const CustodyError& e) {
      ledger_.revertSettle(event_id, participant);
      std::cerr << "[SettlementEngine] WARNING: refund of " << refund
                << " to '" << participant << "' for event " << event_id
                << " failed (" << e.what() << "). Check-in rolled back.\n";
      throw;
    } catch (const RecipientError& e) {
      std::cerr << "[SettlementEngine] WARNING: refund of " << refund
                << " to '" << participant << "' for event " << event_id
                << " was paid, then the recipient failed (" << e.what()
                << "). Check-in stands.\n";
      recipient_failure = std::current_exception();
    }

    checked_in.event_id = event_id;
    checked_in.participant = participant;
    checked_in.timestamp_s = now;
    checked_in.sequence_id = nextSequence();
  }

  bus_.publish(checked_in);
  if (recipient_failure) {
    std::rethrow_exception(recipient_failure);
  }
}

// -----------------------------------------------------------------------------
// sweep: owner-only, post-window, drain then pay
// -----------------------------------------------------------------------------
domain::Amount SettlementEngine::sweep(domain::EventId event_id,
                                       const domain::ParticipantId& caller) {
  WithdrawnNotification withdrawn;
  std::exception_ptr recipient_failure;

  {
    std::lock_guard lock(mutex_);

    // --- Preconditions, in contract order ---------------------------------
    const domain::EventRecord& record = registry_.require(event_id);

    if (caller != record.owner) {
      throw LedgerError(ErrorCode::NotCreator,
                        "only the owner of event " +
                            std::to_string(event_id) + " may sweep");
    }

    domain::Seconds now = clock_.now_s();
    if (!domain::hasEnded(record, now)) {
      throw LedgerError(ErrorCode::EventNotEnded,
                        "event ends at " +
                            std::to_string(domain::windowEnd(record)) +
                            ", now=" + std::to_string(now));
    }

    const EventBook* book = ledger_.book(event_id);
    if (book == nullptr || book->escrowed_balance == 0) {
      throw LedgerError(ErrorCode::NothingToWithdraw,
                        "event " + std::to_string(event_id) +
                            " holds no escrow");
    }

    // --- Zero the balance, then pay the owner -----------------------------
    SweepReceipt receipt = ledger_.drain(event_id);

    try {
      custodian_.payout(record.owner, receipt.amount);
    } catch (const CustodyError& e) {
      ledger_.revertDrain(event_id, receipt);
      std::cerr << "[SettlementEngine] WARNING: sweep of " << receipt.amount
                << " to '" << record.owner << "' for event " << event_id
                << " failed (" << e.what() << "). Sweep rolled back.\n";
      throw;
    } catch (const RecipientError& e) {
      std::cerr << "[SettlementEngine] WARNING: sweep of " << receipt.amount
                << " to '" << record.owner << "' for event " << event_id
                << " was paid, then the recipient failed (" << e.what()
                << "). Sweep stands.\n";
      recipient_failure = std::current_exception();
    }

    withdrawn.event_id = event_id;
    withdrawn.amount = receipt.amount;
    withdrawn.timestamp_s = now;
    withdrawn.sequence_id = nextSequence();
  }

  bus_.publish(withdrawn);
  if (recipient_failure) {
    std::rethrow_exception(recipient_failure);
  }
  return withdrawn.amount;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<EventSnapshot> SettlementEngine::eventSnapshot(
    domain::EventId event_id) const {
  std::lock_guard lock(mutex_);

  const domain::EventRecord* record = registry_.find(event_id);
  if (record == nullptr) {
    return std::nullopt;
  }

  EventSnapshot snapshot;
  snapshot.record = *record;
  if (const EventBook* book = ledger_.book(event_id)) {
    snapshot.escrowed_balance = book->escrowed_balance;
    snapshot.staked_count = book->staked_count;
    snapshot.settled_count = book->settled_count;
    snapshot.total_swept = book->total_swept;
  }
  return snapshot;
}

domain::Reservation SettlementEngine::reservation(
    domain::EventId event_id, const domain::ParticipantId& participant) const {
  std::lock_guard lock(mutex_);
  return ledger_.reservation(event_id, participant);
}

std::size_t SettlementEngine::eventCount() const {
  std::lock_guard lock(mutex_);
  return registry_.size();
}

domain::Amount SettlementEngine::totalEscrowed() const {
  std::lock_guard lock(mutex_);
  return ledger_.totalEscrowed();
}

bool SettlementEngine::isBalanced(domain::EventId event_id) const {
  std::lock_guard lock(mutex_);
  return ledger_.isBalanced(event_id);
}

}  // namespace rsvp
