#include "rsvp/ledger/reservation_ledger.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace rsvp {

using domain::ReservationStatus;

// -----------------------------------------------------------------------------
// isLegalTransition: None -> Staked -> Settled, nothing else
// -----------------------------------------------------------------------------
bool ReservationLedger::isLegalTransition(ReservationStatus from,
                                          ReservationStatus to) {
  switch (from) {
    case ReservationStatus::None:
      return to == ReservationStatus::Staked;

    case ReservationStatus::Staked:
      return to == ReservationStatus::Settled;

    case ReservationStatus::Settled:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// openBook / book / mutableBook
// -----------------------------------------------------------------------------
void ReservationLedger::openBook(domain::EventId event_id) {
  books_.try_emplace(event_id);
}

const EventBook* ReservationLedger::book(domain::EventId event_id) const {
  auto it = books_.find(event_id);
  return (it != books_.end()) ? &it->second : nullptr;
}

EventBook& ReservationLedger::mutableBook(domain::EventId event_id) {
  auto it = books_.find(event_id);
  if (it == books_.end()) {
    throw std::logic_error("no reservation book for event " +
                           std::to_string(event_id));
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// reservation / status
// -----------------------------------------------------------------------------
domain::Reservation ReservationLedger::reservation(
    domain::EventId event_id, const domain::ParticipantId& participant) const {
  const EventBook* b = book(event_id);
  if (b == nullptr) {
    return {};
  }
  auto it = b->reservations.find(participant);
  return (it != b->reservations.end()) ? it->second : domain::Reservation{};
}

ReservationStatus ReservationLedger::status(
    domain::EventId event_id, const domain::ParticipantId& participant) const {
  return reservation(event_id, participant).status;
}

// -----------------------------------------------------------------------------
// stake: None -> Staked
// -----------------------------------------------------------------------------
void ReservationLedger::stake(domain::EventId event_id,
                              const domain::ParticipantId& participant,
                              domain::Amount amount) {
  EventBook& b = mutableBook(event_id);

  ReservationStatus current = ReservationStatus::None;
  auto it = b.reservations.find(participant);
  if (it != b.reservations.end()) {
    current = it->second.status;
  }
  if (!isLegalTransition(current, ReservationStatus::Staked)) {
    throw std::logic_error("illegal transition to Staked for '" +
                           participant + "' on event " +
                           std::to_string(event_id));
  }
  if (amount > std::numeric_limits<domain::Amount>::max() -
                   b.escrowed_balance) {
    throw std::overflow_error("escrowed balance of event " +
                              std::to_string(event_id) + " would overflow");
  }

  domain::Reservation& r = b.reservations[participant];
  r.status = ReservationStatus::Staked;
  r.stake = amount;
  r.forfeited = false;

  b.escrowed_balance += amount;
  ++b.staked_count;
}

// -----------------------------------------------------------------------------
// settle: Staked -> Settled, refund exactly this participant's stake
// -----------------------------------------------------------------------------
domain::Amount ReservationLedger::settle(
    domain::EventId event_id, const domain::ParticipantId& participant) {
  EventBook& b = mutableBook(event_id);

  auto it = b.reservations.find(participant);
  if (it == b.reservations.end() ||
      !isLegalTransition(it->second.status, ReservationStatus::Settled) ||
      it->second.forfeited) {
    throw std::logic_error("illegal transition to Settled for '" +
                           participant + "' on event " +
                           std::to_string(event_id));
  }

  domain::Reservation& r = it->second;
  r.status = ReservationStatus::Settled;

  b.escrowed_balance -= r.stake;
  --b.staked_count;
  ++b.settled_count;

  return r.stake;
}

// -----------------------------------------------------------------------------
// drain: take everything still escrowed, mark the no-shows
// -----------------------------------------------------------------------------
SweepReceipt ReservationLedger::drain(domain::EventId event_id) {
  EventBook& b = mutableBook(event_id);

  SweepReceipt receipt;
  if (b.escrowed_balance == 0) {
    return receipt;
  }

  for (auto& [participant, r] : b.reservations) {
    if (r.status == ReservationStatus::Staked && !r.forfeited) {
      r.forfeited = true;
      receipt.forfeited.push_back(participant);
    }
  }

  receipt.amount = b.escrowed_balance;
  b.escrowed_balance = 0;
  b.total_swept += receipt.amount;
  return receipt;
}

// -----------------------------------------------------------------------------
// revertStake: undo stake()
// -----------------------------------------------------------------------------
void ReservationLedger::revertStake(domain::EventId event_id,
                                    const domain::ParticipantId& participant) {
  EventBook& b = mutableBook(event_id);
  auto it = b.reservations.find(participant);
  if (it == b.reservations.end() ||
      it->second.status != ReservationStatus::Staked) {
    throw std::logic_error("no stake to revert for '" + participant + "'");
  }

  b.escrowed_balance -= it->second.stake;
  --b.staked_count;
  b.reservations.erase(it);
}

// -----------------------------------------------------------------------------
// revertSettle: undo settle()
// -----------------------------------------------------------------------------
void ReservationLedger::revertSettle(
    domain::EventId event_id, const domain::ParticipantId& participant) {
  EventBook& b = mutableBook(event_id);
  auto it = b.reservations.find(participant);
  if (it == b.reservations.end() ||
      it->second.status != ReservationStatus::Settled) {
    throw std::logic_error("no settlement to revert for '" + participant +
                           "'");
  }

  it->second.status = ReservationStatus::Staked;
  b.escrowed_balance += it->second.stake;
  ++b.staked_count;
  --b.settled_count;
}

// -----------------------------------------------------------------------------
// revertDrain: undo drain()
// -----------------------------------------------------------------------------
void ReservationLedger::revertDrain(domain::EventId event_id,
                                    const SweepReceipt& receipt) {
  EventBook& b = mutableBook(event_id);
  for (const auto& participant : receipt.forfeited) {
    auto it = b.reservations.find(participant);
    if (it != b.reservations.end()) {
      it->second.forfeited = false;
    }
  }
  b.escrowed_balance += receipt.amount;
  b.total_swept -= receipt.amount;
}

// -----------------------------------------------------------------------------
// isBalanced: recompute the invariant from the reservations
// -----------------------------------------------------------------------------
bool ReservationLedger::isBalanced(domain::EventId event_id) const {
  const EventBook* b = book(event_id);
  if (b == nullptr) {
    return true;
  }

  domain::Amount escrowed = 0;
  std::uint32_t staked = 0;
  std::uint32_t settled = 0;
  for (const auto& [participant, r] : b->reservations) {
    if (r.status == ReservationStatus::Staked) {
      ++staked;
      if (!r.forfeited) {
        escrowed += r.stake;
      }
    } else if (r.status == ReservationStatus::Settled) {
      ++settled;
    }
  }

  return escrowed == b->escrowed_balance && staked == b->staked_count &&
         settled == b->settled_count;
}

// -----------------------------------------------------------------------------
// totalEscrowed
// -----------------------------------------------------------------------------
domain::Amount ReservationLedger::totalEscrowed() const {
  domain::Amount total = 0;
  for (const auto& [event_id, b] : books_) {
    total += b.escrowed_balance;
  }
  return total;
}

}  // namespace rsvp
