/**
 * @file notification_rules.hpp
 * @brief Usage notification rules and the evaluator that applies them.
 *
 * Evaluation is a pure function of the snapshot, the user's settings, the
 * previously fired state and the current time.
 */

#ifndef USAGEMONITOR_NOTIFICATION_RULES_HPP
#define USAGEMONITOR_NOTIFICATION_RULES_HPP

#include "usage_types.hpp"

#include <array>
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace umon {

/// Utilization drop, in percentage points, treated as a quota rollover.
constexpr double kResetDropThreshold = 20.0;

/// Alert rules for one usage dimension.
struct NotificationRule {
  bool interval_enabled{false};
  int interval_percent{10};
  bool threshold_enabled{true};
  std::set<int> thresholds{80, 90};
  bool time_remaining_enabled{false};
  std::set<int> time_remaining_minutes{30, 60};

  bool operator==(const NotificationRule &other) const;
  bool operator!=(const NotificationRule &other) const {
    return !(*this == other);
  }
};

/// User notification preferences.
struct NotificationSettings {
  bool enabled{true};
  std::array<NotificationRule, 4> rules{};

  const NotificationRule &rule(UsageDimension dim) const {
    return rules[dimension_index(dim)];
  }
  NotificationRule &rule(UsageDimension dim) {
    return rules[dimension_index(dim)];
  }

  bool operator==(const NotificationSettings &other) const {
    return enabled == other.enabled && rules == other.rules;
  }
  bool operator!=(const NotificationSettings &other) const {
    return !(*this == other);
  }
};

/**
 * What has already been observed and notified.
 *
 * Fired keys use the forms `<dimension>:<threshold>` and
 * `<dimension>:time:<minutes>`.
 */
struct NotificationState {
  std::array<double, 4> last_utilization{};
  std::set<std::string> fired_thresholds;
  std::set<std::string> fired_time_remaining;

  double last(UsageDimension dim) const {
    return last_utilization[dimension_index(dim)];
  }
  void set_last(UsageDimension dim, double value) {
    last_utilization[dimension_index(dim)] = value;
  }

  bool operator==(const NotificationState &other) const {
    return last_utilization == other.last_utilization &&
           fired_thresholds == other.fired_thresholds &&
           fired_time_remaining == other.fired_time_remaining;
  }
  bool operator!=(const NotificationState &other) const {
    return !(*this == other);
  }
};

/// Fired key for a threshold alert.
std::string threshold_key(UsageDimension dim, int threshold);

/// Fired key for a time-remaining alert.
std::string time_remaining_key(UsageDimension dim, int minutes);

/// Reason an alert was raised.
struct NotificationTrigger {
  enum class Kind { Interval, Threshold, TimeRemaining };

  Kind kind;
  int value; ///< Level, threshold or minutes depending on @ref kind

  /// Phrase used in the notification body, e.g. `crossed 80% threshold`.
  std::string describe() const;
};

/// One coalesced alert for a dimension.
struct NotificationEvent {
  UsageDimension dimension;
  double utilization;
  std::vector<NotificationTrigger> triggers;

  /// `"<Label> Usage Alert"`.
  std::string title() const;

  /// `"Usage <trigger> and <trigger> (<n>% used)"`.
  std::string body() const;
};

/// Alerts to raise plus the state to carry into the next cycle.
struct EvaluationResult {
  std::vector<NotificationEvent> events;
  NotificationState state;
};

/**
 * Evaluate a snapshot against the notification rules.
 *
 * For each present dimension, in order: reset detection (a drop of more
 * than 20 points clears the dimension's fired keys and last utilization),
 * interval crossing, thresholds in ascending order, time remaining before
 * reset, then recording the observed utilization. Triggers for one
 * dimension are coalesced into a single event.
 *
 * @param snapshot Freshly fetched usage.
 * @param settings Notification preferences. When disabled the input state is
 *        returned untouched and no events are produced.
 * @param state State from the previous evaluation.
 * @param now Current time used for time-remaining checks.
 * @return Events to deliver and the updated state.
 */
EvaluationResult evaluate(const UsageSnapshot &snapshot,
                          const NotificationSettings &settings,
                          const NotificationState &state,
                          std::chrono::system_clock::time_point now);

} // namespace umon

#endif // USAGEMONITOR_NOTIFICATION_RULES_HPP
