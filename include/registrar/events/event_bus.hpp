#pragma once

#include <registrar/events/account_event.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace registrar::events {

using subscriber_t = std::function<void(const account_event_t&)>;
using subscription_id_t = uint64_t;

/// Asynchronous publish/subscribe channel for account events.
///
/// `post` never blocks on subscribers: events are queued and delivered in
/// post order by a single dispatcher thread. Subscribers may read or write
/// account state from their callback.
class event_bus final {
 public:
  event_bus();
  ~event_bus();

  event_bus(const event_bus&) = delete;
  event_bus& operator=(const event_bus&) = delete;
  event_bus(event_bus&&) = delete;
  event_bus& operator=(event_bus&&) = delete;

  subscription_id_t subscribe(subscriber_t subscriber);

  /// No delivery starts after this returns. A callback already running on
  /// the dispatcher thread finishes.
  void unsubscribe(subscription_id_t id);

  void post(account_event_t event);

  /// Block until every event posted before this call has been delivered.
  /// Must not be called from a subscriber.
  void flush();

 private:
  void run();

  mutable std::mutex mutex_;
  std::condition_variable queue_changed_;
  std::condition_variable delivered_;
  std::deque<account_event_t> queue_;
  std::map<subscription_id_t, subscriber_t> subscribers_;
  subscription_id_t next_subscription_id_{1};
  uint64_t posted_{0};
  uint64_t delivered_count_{0};
  bool stopping_{false};
  std::thread dispatcher_;
};

}  // namespace registrar::events
