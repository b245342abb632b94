#include "usage_types.hpp"

#include <stdexcept>
#include <utility>

namespace umon {

namespace {

std::optional<UsagePeriod> parse_period(const nlohmann::json &j,
                                        const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string("'") + key +
                                "' must be an object");
  }
  auto util = it->find("utilization");
  if (util == it->end() || !util->is_number()) {
    throw std::invalid_argument(std::string("'") + key +
                                "' is missing a numeric utilization");
  }
  UsagePeriod period;
  period.utilization = util->get<double>();
  auto resets = it->find("resets_at");
  if (resets != it->end() && !resets->is_null()) {
    if (!resets->is_string()) {
      throw std::invalid_argument(std::string("'") + key +
                                  ".resets_at' must be a string");
    }
    period.resets_at = resets->get<std::string>();
  }
  return period;
}

} // namespace

const char *dimension_key(UsageDimension dim) {
  switch (dim) {
  case UsageDimension::FiveHour:
    return "five_hour";
  case UsageDimension::SevenDay:
    return "seven_day";
  case UsageDimension::SevenDaySonnet:
    return "seven_day_sonnet";
  case UsageDimension::SevenDayOpus:
    return "seven_day_opus";
  }
  return "unknown";
}

const char *dimension_label(UsageDimension dim) {
  switch (dim) {
  case UsageDimension::FiveHour:
    return "5 Hour";
  case UsageDimension::SevenDay:
    return "7 Day";
  case UsageDimension::SevenDaySonnet:
    return "Sonnet (7 Day)";
  case UsageDimension::SevenDayOpus:
    return "Opus (7 Day)";
  }
  return "Unknown";
}

std::optional<UsageDimension> dimension_from_key(const std::string &key) {
  for (auto dim : kAllDimensions) {
    if (key == dimension_key(dim)) {
      return dim;
    }
  }
  return std::nullopt;
}

UsageSnapshot::UsageSnapshot(std::optional<UsagePeriod> five_hour,
                             std::optional<UsagePeriod> seven_day,
                             std::optional<UsagePeriod> seven_day_sonnet,
                             std::optional<UsagePeriod> seven_day_opus)
    : periods_{std::move(five_hour), std::move(seven_day),
               std::move(seven_day_sonnet), std::move(seven_day_opus)} {}

UsageSnapshot UsageSnapshot::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("usage payload must be a JSON object");
  }
  UsageSnapshot snapshot;
  for (auto dim : kAllDimensions) {
    snapshot.periods_[dimension_index(dim)] =
        parse_period(j, dimension_key(dim));
  }
  return snapshot;
}

nlohmann::json UsageSnapshot::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (auto dim : kAllDimensions) {
    const auto &p = period(dim);
    if (!p) {
      j[dimension_key(dim)] = nullptr;
      continue;
    }
    nlohmann::json item;
    item["utilization"] = p->utilization;
    if (p->resets_at) {
      item["resets_at"] = *p->resets_at;
    } else {
      item["resets_at"] = nullptr;
    }
    j[dimension_key(dim)] = std::move(item);
  }
  return j;
}

} // namespace umon
