#pragma once

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ErrorCode — every way a mutating ledger operation can be refused
// -----------------------------------------------------------------------------
//
// @brief  One enumerator per distinct precondition failure.
//
// @details
// All of these are local, synchronous, non-retryable validation failures.
// None of them is transient: retrying the same call against the same state
// fails the same way. The caller decides what to tell the user.
//
// Each operation checks its preconditions in a fixed order and reports the
// first one that fails; errors are never aggregated.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  // Not-found
  EventNotFound,
  ReservationNotFound,

  // Validation
  MissingCapacity,
  MissingPrice,
  MissingStartTime,
  MissingDuration,
  InvalidWindow,
  PriceNotMet,

  // State-conflict
  AlreadyReserved,
  AlreadyCheckedIn,
  Overbooked,

  // Time-window
  EventNotInProgress,
  EventNotEnded,

  // Authorization
  NotCreator,
  Unauthorized,

  // Accounting
  NothingToWithdraw,
};

// -----------------------------------------------------------------------------
// ErrorCategory
// -----------------------------------------------------------------------------
// Responsibility: Coarse grouping of ErrorCode values, used by the command
// channel so clients can branch on the kind of failure without enumerating
// every code.
// -----------------------------------------------------------------------------
enum class ErrorCategory {
  NotFound,
  Validation,
  StateConflict,
  TimeWindow,
  Authorization,
  Accounting,
};

// Maps a code to its category.
ErrorCategory errorCategory(ErrorCode code);

// Stable name of the code ("EventNotFound", "Overbooked", ...). Used on the
// wire and in log lines; never changes once published.
const char* errorCodeToString(ErrorCode code);

// Stable snake_case name of the category ("not_found", "time_window", ...).
const char* errorCategoryToString(ErrorCategory category);

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown when a mutating operation is refused.
//
// @details
// Thrown before any state is changed, or after the operation has rolled its
// own bookkeeping back; either way the ledger is exactly as it was before
// the call. what() combines the code name with a short human-readable detail.
//
// Read-only queries (getEventMetadata, eventExists, snapshots) never throw
// LedgerError.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& detail);

  ErrorCode code() const noexcept { return code_; }
  ErrorCategory category() const noexcept { return errorCategory(code_); }

 private:
  ErrorCode code_;
};

}  // namespace rsvp
