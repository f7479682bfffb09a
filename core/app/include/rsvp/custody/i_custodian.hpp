#pragma once

#include "rsvp/domain/types.hpp"

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// CustodyError
// -----------------------------------------------------------------------------
// Responsibility: Raised by an ICustodian when it cannot move funds
// (insufficient account funds, insufficient liquidity, a rejected transfer).
// The SettlementEngine treats it as fatal for the current operation: it rolls
// its own bookkeeping back and rethrows, so the caller sees the custodian's
// error and the ledger is unchanged.
//
// Not a LedgerError: a LedgerError means "the ledger refused";
// a CustodyError means "the ledger agreed but the money could not move".
// -----------------------------------------------------------------------------
class CustodyError : public std::runtime_error {
 public:
  explicit CustodyError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// RecipientError
// -----------------------------------------------------------------------------
// Raised by an ICustodian when payout() has already credited the recipient
// and the recipient's own code (a callback, a hook) then failed. The transfer
// stands: the SettlementEngine keeps its bookkeeping committed, publishes the
// notification, and only then rethrows.
//
// Never a CustodyError, whatever the recipient threw, so a failure after the
// credit cannot be mistaken for a refused transfer.
// -----------------------------------------------------------------------------
class RecipientError : public std::runtime_error {
 public:
  explicit RecipientError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// ICustodian — abstract fund custody interface
// -----------------------------------------------------------------------------
//
// @brief  The collaborator that actually holds value on the ledger's behalf.
//
// @details
// The ledger only does accounting. Moving value in and out of custody is
// delegated to this interface so the same SettlementEngine can sit in front
// of an in-memory book (tests, simulation), a payment processor, or a chain
// adapter.
//
//   collect(from, amount) — move `amount` from `from` into custody. Called
//                           by reserve().
//   payout(to, amount)    — move `amount` out of custody to `to`. Called by
//                           checkIn() (refund) and sweep() (proceeds).
//
// Both are all-or-nothing: a CustodyError means nothing moved. payout()
// throws CustodyError only before crediting the recipient; anything that
// goes wrong after the credit surfaces as RecipientError.
//
// Call ordering contract:
//   The SettlementEngine calls collect()/payout() as the LAST step of an
//   operation, after its own bookkeeping is committed. An implementation
//   that hands control to the recipient during payout() (a callback, a
//   hook) may see the recipient call back into the engine; the recipient
//   will observe the post-operation state, so a second refund or a second
//   sweep is refused rather than paid twice.
//
// Thread model:
//   Always invoked while the SettlementEngine lock is held, on the thread
//   that called the engine.
//
// Ownership:
//   Not owned by the engine. Must outlive it.
// -----------------------------------------------------------------------------
class ICustodian {
 public:
  virtual ~ICustodian() = default;

  virtual void collect(const domain::ParticipantId& from,
                       domain::Amount amount) = 0;

  virtual void payout(const domain::ParticipantId& to,
                      domain::Amount amount) = 0;
};

}  // namespace rsvp
