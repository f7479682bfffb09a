#include "rsvp/custody/in_memory_custodian.hpp"

#include <exception>
#include <limits>
#include <string>
#include <utility>

namespace rsvp {

// -----------------------------------------------------------------------------
// deposit(): external credit
// -----------------------------------------------------------------------------
void InMemoryCustodian::deposit(const domain::ParticipantId& account,
                                domain::Amount amount) {
  std::lock_guard lock(mutex_);
  domain::Amount& balance = balances_[account];
  if (amount > std::numeric_limits<domain::Amount>::max() - balance) {
    throw CustodyError("deposit overflows balance of '" + account + "'");
  }
  balance += amount;
}

// -----------------------------------------------------------------------------
// collect(): account -> custody pool
// -----------------------------------------------------------------------------
void InMemoryCustodian::collect(const domain::ParticipantId& from,
                                domain::Amount amount) {
  if (amount == 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  auto it = balances_.find(from);
  domain::Amount available = (it != balances_.end()) ? it->second : 0;
  if (available < amount) {
    throw CustodyError("insufficient funds: '" + from + "' holds " +
                       std::to_string(available) + ", needs " +
                       std::to_string(amount));
  }
  it->second -= amount;
  custody_ += amount;
}

// -----------------------------------------------------------------------------
// payout(): custody pool -> account, then the optional hook
// -----------------------------------------------------------------------------
void InMemoryCustodian::payout(const domain::ParticipantId& to,
                               domain::Amount amount) {
  PayoutHook hook;
  {
    std::lock_guard lock(mutex_);
    if (fail_next_payout_) {
      fail_next_payout_ = false;
      throw CustodyError("payout to '" + to + "' rejected");
    }
    if (custody_ < amount) {
      throw CustodyError("insufficient liquidity: custody holds " +
                         std::to_string(custody_) + ", needs " +
                         std::to_string(amount));
    }
    custody_ -= amount;
    balances_[to] += amount;
    hook = payout_hook_;
  }

  // The hook may call back into the SettlementEngine, which may call
  // payout() again; run it without our lock. The credit above is final.
  if (hook) {
    try {
      hook(to, amount);
    } catch (const std::exception& e) {
      throw RecipientError("recipient '" + to + "' failed after payout of " +
                           std::to_string(amount) + ": " + e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
domain::Amount InMemoryCustodian::balanceOf(
    const domain::ParticipantId& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return (it != balances_.end()) ? it->second : 0;
}

domain::Amount InMemoryCustodian::custodyBalance() const {
  std::lock_guard lock(mutex_);
  return custody_;
}

// -----------------------------------------------------------------------------
// Test controls
// -----------------------------------------------------------------------------
void InMemoryCustodian::setPayoutHook(PayoutHook hook) {
  std::lock_guard lock(mutex_);
  payout_hook_ = std::move(hook);
}

void InMemoryCustodian::setFailNextPayout() {
  std::lock_guard lock(mutex_);
  fail_next_payout_ = true;
}

}  // namespace rsvp
