#include "event_channel.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> events_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("supervisor");
  }();
  return logger;
}

template <typename Callback, typename Event>
void dispatch(const std::vector<Callback> &callbacks, const Event &event) {
  for (const auto &callback : callbacks) {
    try {
      callback(event);
    } catch (const std::exception &e) {
      events_log()->error("Event subscriber failed: {}", e.what());
    }
  }
}

} // namespace

nlohmann::json UsageUpdatedEvent::to_json() const {
  nlohmann::json j;
  j["usage"] = snapshot.to_json();
  if (next_refresh_at_ms) {
    j["nextRefreshAt"] = *next_refresh_at_ms;
  } else {
    j["nextRefreshAt"] = nullptr;
  }
  return j;
}

nlohmann::json UsageErrorEvent::to_json() const {
  return {{"error", message}, {"kind", to_string(kind)}};
}

void EventChannel::on_usage_updated(UsageCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  usage_callbacks_.push_back(std::move(callback));
}

void EventChannel::on_usage_error(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_callbacks_.push_back(std::move(callback));
}

void EventChannel::publish(const UsageUpdatedEvent &event) {
  std::vector<UsageCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = usage_callbacks_;
  }
  dispatch(callbacks, event);
  queue_.push(event);
}

void EventChannel::publish(const UsageErrorEvent &event) {
  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = error_callbacks_;
  }
  dispatch(callbacks, event);
  queue_.push(event);
}

} // namespace umon
