#include "rsvp/eventbus/notification_bus.hpp"

#include <algorithm>
#include <utility>

namespace rsvp {

NotificationBus::SubscriptionId NotificationBus::subscribe(
    GenericCallback callback) {
  std::lock_guard guard(mutex_);
  const SubscriptionId id = next_id_++;
  subscriptions_.push_back(Subscription{id, std::move(callback)});
  return id;
}

void NotificationBus::unsubscribe(SubscriptionId id) {
  std::lock_guard guard(mutex_);
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const Subscription& s) { return s.id == id; });
  if (it != subscriptions_.end()) {
    subscriptions_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(): snapshot under the lock, deliver without it
// -----------------------------------------------------------------------------
// A subscription added during delivery first sees the next notification.
// -----------------------------------------------------------------------------
void NotificationBus::publish(const Notification& notification) {
  std::vector<Subscription> snapshot;
  {
    std::lock_guard guard(mutex_);
    snapshot = subscriptions_;
  }

  for (const Subscription& s : snapshot) {
    s.callback(notification);
  }
}

std::size_t NotificationBus::subscriberCount() const {
  std::lock_guard guard(mutex_);
  return subscriptions_.size();
}

}  // namespace rsvp
