#include "rsvp/errors/ledger_error.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// errorCategory()
// -----------------------------------------------------------------------------
ErrorCategory errorCategory(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::EventNotFound:
    case C::ReservationNotFound:
      return ErrorCategory::NotFound;

    case C::MissingCapacity:
    case C::MissingPrice:
    case C::MissingStartTime:
    case C::MissingDuration:
    case C::InvalidWindow:
    case C::PriceNotMet:
      return ErrorCategory::Validation;

    case C::AlreadyReserved:
    case C::AlreadyCheckedIn:
    case C::Overbooked:
      return ErrorCategory::StateConflict;

    case C::EventNotInProgress:
    case C::EventNotEnded:
      return ErrorCategory::TimeWindow;

    case C::NotCreator:
    case C::Unauthorized:
      return ErrorCategory::Authorization;

    case C::NothingToWithdraw:
      return ErrorCategory::Accounting;
  }
  return ErrorCategory::Validation;
}

// -----------------------------------------------------------------------------
// errorCodeToString()
// -----------------------------------------------------------------------------
const char* errorCodeToString(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::EventNotFound:        return "EventNotFound";
    case C::ReservationNotFound:  return "ReservationNotFound";
    case C::MissingCapacity:      return "MissingCapacity";
    case C::MissingPrice:         return "MissingPrice";
    case C::MissingStartTime:     return "MissingStartTime";
    case C::MissingDuration:      return "MissingDuration";
    case C::InvalidWindow:        return "InvalidWindow";
    case C::PriceNotMet:          return "PriceNotMet";
    case C::AlreadyReserved:      return "AlreadyReserved";
    case C::AlreadyCheckedIn:     return "AlreadyCheckedIn";
    case C::Overbooked:           return "Overbooked";
    case C::EventNotInProgress:   return "EventNotInProgress";
    case C::EventNotEnded:        return "EventNotEnded";
    case C::NotCreator:           return "NotCreator";
    case C::Unauthorized:         return "Unauthorized";
    case C::NothingToWithdraw:    return "NothingToWithdraw";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// errorCategoryToString()
// -----------------------------------------------------------------------------
const char* errorCategoryToString(ErrorCategory category) {
  using C = ErrorCategory;
  switch (category) {
    case C::NotFound:       return "not_found";
    case C::Validation:     return "validation";
    case C::StateConflict:  return "state_conflict";
    case C::TimeWindow:     return "time_window";
    case C::Authorization:  return "authorization";
    case C::Accounting:     return "accounting";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + detail),
      code_(code) {}

}  // namespace rsvp
