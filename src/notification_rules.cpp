#include "notification_rules.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "util/time.hpp"

#include <cmath>
#include <cstdio>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> evaluator_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("evaluator");
  }();
  return logger;
}

int level_for(double utilization, int percent) {
  return static_cast<int>(std::floor(utilization / percent)) * percent;
}

/**
 * Remove every fired key belonging to @p dim from @p keys.
 */
void purge_dimension(std::set<std::string> &keys, UsageDimension dim) {
  const std::string prefix = std::string(dimension_key(dim)) + ":";
  for (auto it = keys.begin(); it != keys.end();) {
    if (it->compare(0, prefix.size(), prefix) == 0) {
      it = keys.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<long> minutes_until(const std::string &resets_at,
                                  std::chrono::system_clock::time_point now) {
  auto reset = parse_rfc3339(resets_at);
  if (!reset) {
    evaluator_log()->debug("Ignoring unparseable resets_at '{}'", resets_at);
    return std::nullopt;
  }
  if (*reset <= now) {
    return std::nullopt;
  }
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::minutes>(*reset - now).count());
}

} // namespace

bool NotificationRule::operator==(const NotificationRule &other) const {
  return interval_enabled == other.interval_enabled &&
         interval_percent == other.interval_percent &&
         threshold_enabled == other.threshold_enabled &&
         thresholds == other.thresholds &&
         time_remaining_enabled == other.time_remaining_enabled &&
         time_remaining_minutes == other.time_remaining_minutes;
}

std::string threshold_key(UsageDimension dim, int threshold) {
  return std::string(dimension_key(dim)) + ":" + std::to_string(threshold);
}

std::string time_remaining_key(UsageDimension dim, int minutes) {
  return std::string(dimension_key(dim)) + ":time:" + std::to_string(minutes);
}

std::string NotificationTrigger::describe() const {
  switch (kind) {
  case Kind::Interval:
    return "reached " + std::to_string(value) + "%";
  case Kind::Threshold:
    return "crossed " + std::to_string(value) + "% threshold";
  case Kind::TimeRemaining:
    return "resets in < " + format_minutes(value);
  }
  return {};
}

std::string NotificationEvent::title() const {
  return std::string(dimension_label(dimension)) + " Usage Alert";
}

std::string NotificationEvent::body() const {
  std::string joined;
  for (const auto &trigger : triggers) {
    if (!joined.empty()) {
      joined += " and ";
    }
    joined += trigger.describe();
  }
  char used[32];
  std::snprintf(used, sizeof(used), "%.0f", utilization);
  return "Usage " + joined + " (" + used + "% used)";
}

EvaluationResult evaluate(const UsageSnapshot &snapshot,
                          const NotificationSettings &settings,
                          const NotificationState &state,
                          std::chrono::system_clock::time_point now) {
  EvaluationResult result{{}, state};
  if (!settings.enabled) {
    return result;
  }
  NotificationState &next = result.state;

  for (auto dim : kAllDimensions) {
    const auto &period = snapshot.period(dim);
    if (!period) {
      continue;
    }
    const NotificationRule &rule = settings.rule(dim);
    const double utilization = period->utilization;

    if (next.last(dim) - utilization > kResetDropThreshold) {
      evaluator_log()->info("{} usage dropped from {:.1f}% to {:.1f}%; "
                            "resetting notification state",
                            dimension_key(dim), next.last(dim), utilization);
      next.set_last(dim, 0.0);
      purge_dimension(next.fired_thresholds, dim);
      purge_dimension(next.fired_time_remaining, dim);
    }
    const double last = next.last(dim);

    NotificationEvent event{dim, utilization, {}};

    if (rule.interval_enabled && rule.interval_percent > 0) {
      int current_level = level_for(utilization, rule.interval_percent);
      int last_level = level_for(last, rule.interval_percent);
      if (current_level > last_level && current_level > 0) {
        event.triggers.push_back(
            {NotificationTrigger::Kind::Interval, current_level});
      }
    }

    if (rule.threshold_enabled) {
      for (int threshold : rule.thresholds) {
        if (utilization >= threshold && last < threshold) {
          auto inserted = next.fired_thresholds.insert(threshold_key(dim, threshold));
          if (inserted.second) {
            event.triggers.push_back(
                {NotificationTrigger::Kind::Threshold, threshold});
          }
        }
      }
    }

    if (rule.time_remaining_enabled && period->resets_at) {
      if (auto remaining = minutes_until(*period->resets_at, now)) {
        for (int minutes : rule.time_remaining_minutes) {
          if (*remaining > minutes) {
            continue;
          }
          auto inserted =
              next.fired_time_remaining.insert(time_remaining_key(dim, minutes));
          if (inserted.second) {
            event.triggers.push_back(
                {NotificationTrigger::Kind::TimeRemaining, minutes});
          }
        }
      }
    }

    next.set_last(dim, utilization);
    if (!event.triggers.empty()) {
      evaluator_log()->debug("{}: {}", event.title(), event.body());
      result.events.push_back(std::move(event));
    }
  }
  return result;
}

} // namespace umon
