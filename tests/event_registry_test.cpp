// =============================================================================
// event_registry_test.cpp
// =============================================================================
// Unit tests for rsvp::EventRegistry.
//
// Validates:
//   - createEvent() stores every field and allocates ids 1, 2, 3, ...
//   - Validation order: capacity, price, start time, duration
//   - A rejected creation does not consume an id
//   - getEventMetadata() / eventExists() on unknown ids are permissive
//   - require() throws EventNotFound
// =============================================================================

#include "rsvp/errors/ledger_error.hpp"
#include "rsvp/registry/event_registry.hpp"

#include <gtest/gtest.h>

#include <limits>

using rsvp::ErrorCode;
using rsvp::LedgerError;

// Runs fn and returns the ErrorCode of the LedgerError it throws.
template <typename Fn>
static ErrorCode codeOf(Fn&& fn) {
  try {
    fn();
  } catch (const LedgerError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a LedgerError";
  return ErrorCode::EventNotFound;
}

class EventRegistryTest : public ::testing::Test {
 protected:
  rsvp::EventRegistry registry;
};

// -----------------------------------------------------------------------------
// 1. A valid creation stores all fields and is immediately visible.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, CreateStoresRecord) {
  auto record = registry.createEvent("alice", "yakult event", 1, 1, 1000, 2000);

  EXPECT_EQ(record.id, 1u);
  EXPECT_EQ(record.owner, "alice");
  EXPECT_EQ(record.name, "yakult event");
  EXPECT_EQ(record.capacity, 1u);
  EXPECT_EQ(record.price, 1u);
  EXPECT_EQ(record.start_time, 1000u);
  EXPECT_EQ(record.duration, 2000u);

  EXPECT_TRUE(registry.eventExists(1));
  auto meta = registry.getEventMetadata(1);
  EXPECT_EQ(meta.name, "yakult event");
  EXPECT_EQ(meta.owner, "alice");
  EXPECT_EQ(registry.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Ids start at 1 and increase by one per successful creation.
// Why: Id 0 is never issued, so clients can use it as "no event".
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, IdsAreSequentialFromOne) {
  EXPECT_EQ(registry.nextId(), 1u);
  EXPECT_EQ(registry.createEvent("a", "x", 1, 1, 1, 1).id, 1u);
  EXPECT_EQ(registry.createEvent("a", "y", 1, 1, 1, 1).id, 2u);
  EXPECT_EQ(registry.createEvent("b", "z", 1, 1, 1, 1).id, 3u);
  EXPECT_EQ(registry.nextId(), 4u);
  EXPECT_FALSE(registry.eventExists(0));
}

// -----------------------------------------------------------------------------
// 3. Each zero field is rejected with its own error code.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, RejectsZeroFields) {
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 0, 1, 1, 1); }),
            ErrorCode::MissingCapacity);
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 0, 1, 1); }),
            ErrorCode::MissingPrice);
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 1, 0, 1); }),
            ErrorCode::MissingStartTime);
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 1, 1, 0); }),
            ErrorCode::MissingDuration);
}

// -----------------------------------------------------------------------------
// 4. With several fields missing, the first check in order wins.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, ValidationOrderIsFixed) {
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 0, 0, 0, 0); }),
            ErrorCode::MissingCapacity);
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 0, 0, 0); }),
            ErrorCode::MissingPrice);
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 1, 0, 0); }),
            ErrorCode::MissingStartTime);
}

// -----------------------------------------------------------------------------
// 5. An anonymous owner and a window that overflows are refused.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, RejectsAnonymousOwnerAndOverflowingWindow) {
  EXPECT_EQ(codeOf([&] { registry.createEvent("", "n", 1, 1, 1, 1); }),
            ErrorCode::Unauthorized);

  const auto max = std::numeric_limits<rsvp::domain::Seconds>::max();
  EXPECT_EQ(codeOf([&] { registry.createEvent("a", "n", 1, 1, max, 1); }),
            ErrorCode::InvalidWindow);
}

// -----------------------------------------------------------------------------
// 6. A rejected creation leaves no trace and does not burn an id.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, FailedCreateDoesNotConsumeId) {
  EXPECT_THROW(registry.createEvent("a", "n", 0, 1, 1, 1), LedgerError);
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(registry.nextId(), 1u);

  EXPECT_EQ(registry.createEvent("a", "n", 1, 1, 1, 1).id, 1u);
}

// -----------------------------------------------------------------------------
// 7. Reads of unknown ids are permissive; require() is not.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, UnknownIdReads) {
  EXPECT_FALSE(registry.eventExists(42));
  EXPECT_EQ(registry.find(42), nullptr);

  auto meta = registry.getEventMetadata(42);
  EXPECT_TRUE(meta.name.empty());
  EXPECT_TRUE(meta.owner.empty());

  EXPECT_EQ(codeOf([&] { registry.require(42); }), ErrorCode::EventNotFound);
}

// -----------------------------------------------------------------------------
// 8. Empty names are allowed; names are stored verbatim.
// -----------------------------------------------------------------------------
TEST_F(EventRegistryTest, EmptyNameIsAllowed) {
  auto record = registry.createEvent("alice", "", 5, 3, 10, 10);
  EXPECT_TRUE(registry.eventExists(record.id));
  EXPECT_EQ(registry.getEventMetadata(record.id).name, "");
}
