/**
 * @file event_channel.hpp
 * @brief Outbound events published by the refresh supervisor.
 *
 * Consumers either register callbacks, invoked on the supervisor thread, or
 * pull events from a bounded queue.
 */

#ifndef USAGEMONITOR_EVENT_CHANNEL_HPP
#define USAGEMONITOR_EVENT_CHANNEL_HPP

#include "usage_fetcher.hpp"
#include "usage_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace umon {

/// Published after every successful fetch.
struct UsageUpdatedEvent {
  UsageSnapshot snapshot;
  /// Unix milliseconds of the next scheduled fetch, absent when disabled.
  std::optional<std::int64_t> next_refresh_at_ms;

  /// `{"usage": ..., "nextRefreshAt": ...}`.
  nlohmann::json to_json() const;
};

/// Published after a failed fetch that the user should see.
struct UsageErrorEvent {
  FetchError kind;
  std::string message;

  /// `{"error": ..., "kind": ...}`.
  nlohmann::json to_json() const;
};

using RefreshEvent = std::variant<UsageUpdatedEvent, UsageErrorEvent>;

/**
 * Thread-safe FIFO of events with blocking and non-blocking pops.
 *
 * When full, the oldest event is discarded to make room.
 */
template <typename T> class EventQueue {
public:
  explicit EventQueue(std::size_t capacity = 256) : capacity_(capacity) {}

  void push(T event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ > 0 && queue_.size() >= capacity_) {
      queue_.pop_front();
    }
    queue_.push_back(std::move(event));
    cv_.notify_one();
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  /// Wait up to @p timeout for an event.
  template <typename Rep, typename Period>
  std::optional<T> wait_pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  std::size_t capacity_;
};

/**
 * Fan-out of supervisor events to callbacks and a pull queue.
 */
class EventChannel {
public:
  using UsageCallback = std::function<void(const UsageUpdatedEvent &)>;
  using ErrorCallback = std::function<void(const UsageErrorEvent &)>;

  explicit EventChannel(std::size_t queue_capacity = 256)
      : queue_(queue_capacity) {}

  /// Register a callback for usage updates.
  void on_usage_updated(UsageCallback callback);

  /// Register a callback for usage errors.
  void on_usage_error(ErrorCallback callback);

  /**
   * Deliver @p event to callbacks, then queue it. Callback exceptions are
   * logged and do not prevent delivery to other subscribers.
   */
  void publish(const UsageUpdatedEvent &event);
  void publish(const UsageErrorEvent &event);

  /// Pull-style access to published events in publication order.
  EventQueue<RefreshEvent> &queue() { return queue_; }

private:
  std::mutex mutex_;
  std::vector<UsageCallback> usage_callbacks_;
  std::vector<ErrorCallback> error_callbacks_;
  EventQueue<RefreshEvent> queue_;
};

} // namespace umon

#endif // USAGEMONITOR_EVENT_CHANNEL_HPP
