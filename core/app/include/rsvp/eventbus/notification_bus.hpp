#pragma once

#include "rsvp/events/notification.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// NotificationBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for ledger notifications. The
// SettlementEngine publishes; loggers, the IPC telemetry bridge and tests
// subscribe.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish(), with no bus lock held.
// -----------------------------------------------------------------------------
class NotificationBus {
 public:
  // Callback for every notification kind.
  using GenericCallback = std::function<void(const Notification&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  NotificationBus() = default;

  // Non-copyable: the bus owns subscriber state.
  NotificationBus(const NotificationBus&) = delete;
  NotificationBus& operator=(const NotificationBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published notification.
  // Output: Non-zero SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<NotificationType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published variant holds
  // a NotificationType (e.g. ReservedNotification).
  // -------------------------------------------------------------------------
  template <typename NotificationType>
  SubscriptionId subscribe(
      std::function<void(const NotificationType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. A publish() already in progress may
  // still invoke the callback once; later publishes will not. Unknown ids
  // are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(notification)
  // -------------------------------------------------------------------------
  // What: Invokes every registered callback, in subscription order, before
  // returning. The subscriber list is copied under the lock and the
  // callbacks run without it, so a callback may publish or unsubscribe
  // without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const Notification& notification);

  // Number of live subscriptions.
  std::size_t subscriberCount() const;

 private:
  struct Subscription {
    SubscriptionId id;
    GenericCallback callback;
  };

  mutable std::mutex mutex_;      // Protects subscriptions_ and next_id_
  SubscriptionId next_id_{1};     // 0 is never issued
  std::vector<Subscription> subscriptions_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that checks the variant with
// std::get_if and ignores every other alternative.
// -----------------------------------------------------------------------------
template <typename NotificationType>
NotificationBus::SubscriptionId NotificationBus::subscribe(
    std::function<void(const NotificationType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const Notification& notification) {
    if (const auto* ptr = std::get_if<NotificationType>(&notification)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace rsvp
