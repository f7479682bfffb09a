#pragma once

#include "rsvp/events/notification_types.hpp"

#include <variant>

namespace rsvp {

// -----------------------------------------------------------------------------
// Notification (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything the ledger
// announces. One NotificationBus carries every kind without void* or
// inheritance.
//
// Why std::variant:
// - Value semantics: notifications can be queued and copied across threads
//   (IpcServer telemetry queue) without heap ownership questions.
// - Type-safe dispatch via std::get_if / std::visit; adding a kind makes the
//   compiler point at every visit site that needs updating.
// -----------------------------------------------------------------------------
using Notification = std::variant<
    EventCreatedNotification,
    ReservedNotification,
    CheckedInNotification,
    WithdrawnNotification>;

}  // namespace rsvp
