// =============================================================================
// in_memory_custodian_test.cpp
// =============================================================================
// Unit tests for rsvp::InMemoryCustodian.
//
// Validates:
//   - deposit / collect / payout move value between accounts and the pool
//   - Σ balances + custody pool is conserved
//   - Refused transfers throw CustodyError and move nothing
//   - The payout hook runs after crediting, without the lock held
//   - A failing hook surfaces as RecipientError, never CustodyError
// =============================================================================

#include "rsvp/custody/in_memory_custodian.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

class InMemoryCustodianTest : public ::testing::Test {
 protected:
  void SetUp() override {
    custodian.deposit("bob", 10);
    custodian.deposit("carol", 5);
  }

  rsvp::domain::Amount total() const {
    return custodian.balanceOf("bob") + custodian.balanceOf("carol") +
           custodian.balanceOf("alice") + custodian.custodyBalance();
  }

  rsvp::InMemoryCustodian custodian;
};

// -----------------------------------------------------------------------------
// 1. collect() then payout() moves value and conserves the total.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, CollectAndPayoutConserveValue) {
  custodian.collect("bob", 4);
  EXPECT_EQ(custodian.balanceOf("bob"), 6u);
  EXPECT_EQ(custodian.custodyBalance(), 4u);
  EXPECT_EQ(total(), 15u);

  custodian.payout("alice", 3);
  EXPECT_EQ(custodian.balanceOf("alice"), 3u);
  EXPECT_EQ(custodian.custodyBalance(), 1u);
  EXPECT_EQ(total(), 15u);
}

// -----------------------------------------------------------------------------
// 2. Collecting more than the account holds is refused.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, CollectInsufficientFunds) {
  EXPECT_THROW(custodian.collect("carol", 6), rsvp::CustodyError);
  EXPECT_THROW(custodian.collect("stranger", 1), rsvp::CustodyError);
  EXPECT_EQ(custodian.balanceOf("carol"), 5u);
  EXPECT_EQ(custodian.custodyBalance(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Paying out more than the pool holds is refused.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, PayoutInsufficientLiquidity) {
  custodian.collect("bob", 2);
  EXPECT_THROW(custodian.payout("bob", 3), rsvp::CustodyError);
  EXPECT_EQ(custodian.custodyBalance(), 2u);
  EXPECT_EQ(custodian.balanceOf("bob"), 8u);
}

// -----------------------------------------------------------------------------
// 4. setFailNextPayout() refuses exactly one payout.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, FailNextPayoutIsOneShot) {
  custodian.collect("bob", 4);
  custodian.setFailNextPayout();

  EXPECT_THROW(custodian.payout("bob", 2), rsvp::CustodyError);
  EXPECT_EQ(custodian.custodyBalance(), 4u);

  custodian.payout("bob", 2);
  EXPECT_EQ(custodian.custodyBalance(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Zero-amount transfers succeed, even for unknown accounts.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, ZeroAmountTransfers) {
  EXPECT_NO_THROW(custodian.collect("stranger", 0));
  EXPECT_NO_THROW(custodian.payout("stranger", 0));
  EXPECT_EQ(custodian.balanceOf("stranger"), 0u);
}

// -----------------------------------------------------------------------------
// 6. A deposit that would overflow the account is refused.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, DepositOverflow) {
  const auto max = std::numeric_limits<rsvp::domain::Amount>::max();
  EXPECT_THROW(custodian.deposit("bob", max), rsvp::CustodyError);
  EXPECT_EQ(custodian.balanceOf("bob"), 10u);
}

// -----------------------------------------------------------------------------
// 7. The payout hook sees the credited balance and may call back in.
// Why: The engine's reentrancy tests rely on the hook running after the
//      credit and outside the custodian lock; a nested payout from inside
//      the hook would otherwise deadlock.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, PayoutHookRunsAfterCredit) {
  custodian.collect("bob", 6);

  int calls = 0;
  rsvp::domain::Amount seen_balance = 0;
  custodian.setPayoutHook(
      [&](const rsvp::domain::ParticipantId& to, rsvp::domain::Amount) {
        ++calls;
        if (calls == 1) {
          seen_balance = custodian.balanceOf(to);
          custodian.payout("carol", 1);
        }
      });

  custodian.payout("alice", 2);

  EXPECT_EQ(calls, 2);
  EXPECT_EQ(seen_balance, 2u);
  EXPECT_EQ(custodian.balanceOf("carol"), 6u);
  EXPECT_EQ(custodian.custodyBalance(), 3u);
  EXPECT_EQ(total(), 15u);
}

// -----------------------------------------------------------------------------
// 8. A hook that throws CustodyError leaves payout() as RecipientError and
//    the credit stands.
// Why: CustodyError from payout() tells the engine nothing moved. Here the
//      funds did move, so the engine must not roll back.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodianTest, HookFailureIsRecipientError) {
  custodian.collect("bob", 4);
  custodian.setPayoutHook(
      [](const rsvp::domain::ParticipantId&, rsvp::domain::Amount) {
        throw rsvp::CustodyError("nested transfer refused");
      });

  try {
    custodian.payout("carol", 3);
    FAIL() << "expected RecipientError";
  } catch (const rsvp::CustodyError&) {
    FAIL() << "a failure after the credit must not look like a refusal";
  } catch (const rsvp::RecipientError& e) {
    EXPECT_NE(std::string(e.what()).find("nested transfer refused"),
              std::string::npos);
  }

  EXPECT_EQ(custodian.balanceOf("carol"), 8u);
  EXPECT_EQ(custodian.custodyBalance(), 1u);
  EXPECT_EQ(total(), 15u);
}
