#pragma once

#include "rsvp/domain/types.hpp"

#include <atomic>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventIdGenerator — monotonically increasing event id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out event ids 1, 2, 3, ... Each call to next_id() returns a
//         value never returned before by this instance.
//
// @details
// Id 0 is reserved as the "unset" sentinel. The registry only calls
// next_id() once a creation request has passed validation, so a rejected
// createEvent() never burns an id; accepted ids are therefore contiguous.
//
// peek() reports the id the next successful creation will receive without
// consuming it.
//
// Thread model:
//   next_id() is safe to call concurrently. In practice the only caller is
//   EventRegistry under the SettlementEngine lock; the atomic keeps the
//   generator correct if a second registry ever shares it.
//
// Ownership:
//   Owned by EventRegistry as a value member.
// -----------------------------------------------------------------------------
class EventIdGenerator {
 public:
  EventIdGenerator() = default;

  // Copying a generator would create two sources producing duplicate ids.
  EventIdGenerator(const EventIdGenerator&) = delete;
  EventIdGenerator& operator=(const EventIdGenerator&) = delete;
  EventIdGenerator(EventIdGenerator&&) = delete;
  EventIdGenerator& operator=(EventIdGenerator&&) = delete;

  domain::EventId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  domain::EventId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::EventId> next_id_{1};
};

}  // namespace rsvp
