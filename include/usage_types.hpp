/**
 * @file usage_types.hpp
 * @brief Usage snapshot data model.
 *
 * A snapshot carries up to four independently metered usage windows. Any
 * window the API omits stays absent rather than defaulting to zero.
 */

#ifndef USAGEMONITOR_USAGE_TYPES_HPP
#define USAGEMONITOR_USAGE_TYPES_HPP

#include <array>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace umon {

/// Metered usage windows reported by the usage API.
enum class UsageDimension { FiveHour, SevenDay, SevenDaySonnet, SevenDayOpus };

/// All dimensions in reporting order.
constexpr std::array<UsageDimension, 4> kAllDimensions = {
    UsageDimension::FiveHour, UsageDimension::SevenDay,
    UsageDimension::SevenDaySonnet, UsageDimension::SevenDayOpus};

/// Position of @p dim inside per-dimension arrays.
constexpr std::size_t dimension_index(UsageDimension dim) {
  return static_cast<std::size_t>(dim);
}

/// JSON key of a dimension (`five_hour`, `seven_day`, ...).
const char *dimension_key(UsageDimension dim);

/// Human readable label used in notification titles (`5 Hour`, ...).
const char *dimension_label(UsageDimension dim);

/// Look up a dimension by its JSON key.
std::optional<UsageDimension> dimension_from_key(const std::string &key);

/// Utilization of one metering window.
struct UsagePeriod {
  double utilization{0.0};              ///< Percentage of quota consumed
  std::optional<std::string> resets_at; ///< RFC 3339 reset time when known

  bool operator==(const UsagePeriod &other) const {
    return utilization == other.utilization && resets_at == other.resets_at;
  }
  bool operator!=(const UsagePeriod &other) const { return !(*this == other); }
};

/**
 * Immutable result of one successful usage fetch.
 */
class UsageSnapshot {
public:
  UsageSnapshot() = default;

  /**
   * Construct a snapshot from its four optional periods.
   */
  UsageSnapshot(std::optional<UsagePeriod> five_hour,
                std::optional<UsagePeriod> seven_day,
                std::optional<UsagePeriod> seven_day_sonnet,
                std::optional<UsagePeriod> seven_day_opus);

  /// Period for @p dim, empty when the API did not report it.
  const std::optional<UsagePeriod> &period(UsageDimension dim) const {
    return periods_[dimension_index(dim)];
  }

  const std::optional<UsagePeriod> &five_hour() const {
    return period(UsageDimension::FiveHour);
  }
  const std::optional<UsagePeriod> &seven_day() const {
    return period(UsageDimension::SevenDay);
  }
  const std::optional<UsagePeriod> &seven_day_sonnet() const {
    return period(UsageDimension::SevenDaySonnet);
  }
  const std::optional<UsagePeriod> &seven_day_opus() const {
    return period(UsageDimension::SevenDayOpus);
  }

  /**
   * Parse the usage API payload.
   *
   * Unknown keys are ignored. A dimension that is missing or `null` stays
   * absent.
   *
   * @param j Decoded response document.
   * @return Parsed snapshot.
   * @throws std::invalid_argument When the document is not an object or a
   *         present period lacks a numeric `utilization`.
   */
  static UsageSnapshot from_json(const nlohmann::json &j);

  /**
   * Serialise to the same shape the API returns; absent periods are
   * written as `null`.
   */
  nlohmann::json to_json() const;

  bool operator==(const UsageSnapshot &other) const {
    return periods_ == other.periods_;
  }
  bool operator!=(const UsageSnapshot &other) const {
    return !(*this == other);
  }

private:
  std::array<std::optional<UsagePeriod>, 4> periods_{};
};

} // namespace umon

#endif // USAGEMONITOR_USAGE_TYPES_HPP
