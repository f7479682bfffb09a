#pragma once

#include "rsvp/custody/i_custodian.hpp"
#include "rsvp/domain/types.hpp"

#include <functional>
#include <mutex>
#include <unordered_map>

namespace rsvp {

// -----------------------------------------------------------------------------
// InMemoryCustodian — account book plus a custody pool
// -----------------------------------------------------------------------------
//
// @brief  Deterministic ICustodian for tests and the service's default
//         wiring. Keeps a balance per account and a single custody pool.
//
// @details
// Conservation: deposit() is the only way value enters the book. collect()
// and payout() move value between an account and the pool, so
//   Σ balanceOf(account) + custodyBalance() == Σ deposits
// at every point. Tests use custodyBalance() to check that the ledger's
// escrowed balances match what is actually held.
//
// Failure modes (CustodyError, nothing moved):
//   collect() when the account holds less than `amount`.
//   payout()  when the pool holds less than `amount`.
//
// Payout hook:
//   setPayoutHook() installs a callback invoked after a payout has been
//   credited, with the recipient and amount. Tests use it to play a
//   recipient that re-enters the SettlementEngine during the transfer. The
//   hook runs without the custodian lock held. Any std::exception thrown by
//   the hook, a CustodyError from a nested engine call included, leaves
//   payout() as RecipientError because the funds have already moved. A
//   refused transfer is simulated with setFailNextPayout() instead.
//
// Thread model:
//   All methods are safe to call from any thread (internal mutex).
// -----------------------------------------------------------------------------
class InMemoryCustodian final : public ICustodian {
 public:
  using PayoutHook =
      std::function<void(const domain::ParticipantId&, domain::Amount)>;

  InMemoryCustodian() = default;

  InMemoryCustodian(const InMemoryCustodian&) = delete;
  InMemoryCustodian& operator=(const InMemoryCustodian&) = delete;

  // Credits `amount` to `account` from outside the ledger.
  void deposit(const domain::ParticipantId& account, domain::Amount amount);

  void collect(const domain::ParticipantId& from,
               domain::Amount amount) override;

  void payout(const domain::ParticipantId& to,
              domain::Amount amount) override;

  // Balance of an account; 0 for an account never seen.
  domain::Amount balanceOf(const domain::ParticipantId& account) const;

  // Value currently held in custody.
  domain::Amount custodyBalance() const;

  void setPayoutHook(PayoutHook hook);

  // The next payout() throws CustodyError without moving funds. Simulates a
  // custodian that runs out of liquidity or a recipient that rejects the
  // transfer.
  void setFailNextPayout();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<domain::ParticipantId, domain::Amount> balances_;
  domain::Amount custody_{0};
  PayoutHook payout_hook_;
  bool fail_next_payout_{false};
};

}  // namespace rsvp
