#include <registrar/events/event_bus.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iterator>
#include <utility>
#include <vector>

namespace registrar::events {

event_bus::event_bus() : dispatcher_{[this] { run(); }} {}

event_bus::~event_bus() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  queue_changed_.notify_all();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

subscription_id_t event_bus::subscribe(subscriber_t subscriber) {
  auto lock = std::scoped_lock{mutex_};
  auto id = next_subscription_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void event_bus::unsubscribe(const subscription_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  subscribers_.erase(id);
}

void event_bus::post(account_event_t event) {
  {
    auto lock = std::scoped_lock{mutex_};
    spdlog::debug("Posting {}", to_string(event));
    queue_.push_back(std::move(event));
    ++posted_;
  }
  queue_changed_.notify_one();
}

void event_bus::flush() {
  auto lock = std::unique_lock{mutex_};
  auto target = posted_;
  delivered_.wait(lock, [&] { return delivered_count_ >= target || stopping_; });
}

void event_bus::run() {
  auto lock = std::unique_lock{mutex_};
  while (true) {
    queue_changed_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
    // Pending events are still delivered on shutdown.
    if (queue_.empty()) {
      break;
    }

    auto event = std::move(queue_.front());
    queue_.pop_front();
    auto subscribers =
        std::vector<std::pair<subscription_id_t, subscriber_t>>{
            std::begin(subscribers_), std::end(subscribers_)};

    for (const auto& [id, subscriber] : subscribers) {
      // An earlier callback may have unsubscribed this one.
      if (!subscribers_.contains(id)) {
        continue;
      }
      lock.unlock();
      try {
        subscriber(event);
      } catch (const std::exception& ex) {
        spdlog::error("Subscriber failed handling {}: {}", to_string(event),
                      ex.what());
      }
      lock.lock();
    }

    ++delivered_count_;
    delivered_.notify_all();
  }
  delivered_.notify_all();
}

}  // namespace registrar::events
