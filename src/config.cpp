#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "refresh_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Scalars keep their boolean or numeric type where the text allows it.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::invalid_argument &) {
      return s;
    } catch (const std::out_of_range &) {
      return s;
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * files expose the same flat keys as legacy flat configurations.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"core", "refresh", "network", "logging", "storage", "notifications"}) {
    merge_section(section);
  }

  return normalized;
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  auto assign_raw = [&assign_category](const std::string &raw) {
    auto pos = raw.find('=');
    assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                    pos == std::string::npos ? std::string{"debug"}
                                             : raw.substr(pos + 1));
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign_category(key, v.get<std::string>());
      } else if (v.is_null()) {
        assign_category(key, "debug");
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        assign_raw(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    assign_raw(value.get<std::string>());
  }
  return categories;
}

} // namespace

void Config::set_interval_minutes(int minutes) {
  if (minutes <= 0) {
    throw ValidationError("interval_minutes",
                          "interval_minutes must be greater than zero");
  }
  if (minutes > kMaxIntervalMinutes) {
    throw ValidationError("interval_minutes",
                          "interval_minutes must not exceed " +
                              std::to_string(kMaxIntervalMinutes));
  }
  interval_minutes_ = minutes;
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 * @throws ValidationError When a value is out of range.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("interval_minutes")) {
    auto minutes = std::clamp<long long>(
        cfg["interval_minutes"].get<long long>(), 0,
        static_cast<long long>(kMaxIntervalMinutes) + 1);
    set_interval_minutes(static_cast<int>(minutes));
  }
  if (cfg.contains("enabled")) {
    set_auto_refresh(cfg["enabled"].get<bool>());
  }
  if (cfg.contains("hourly_refresh")) {
    set_hourly_refresh(cfg["hourly_refresh"].get<bool>());
  }
  if (cfg.contains("backoff_initial_seconds")) {
    set_backoff_initial_seconds(cfg["backoff_initial_seconds"].get<int>());
  }
  if (cfg.contains("backoff_max_seconds")) {
    set_backoff_max_seconds(cfg["backoff_max_seconds"].get<int>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("user_agent")) {
    set_user_agent(cfg["user_agent"].get<std::string>());
  }
  if (cfg.contains("settings_file")) {
    set_settings_file(cfg["settings_file"].get<std::string>());
  }
  if (cfg.contains("credentials_file")) {
    set_credentials_file(cfg["credentials_file"].get<std::string>());
  }
  if (cfg.contains("history_db")) {
    set_history_db(cfg["history_db"].get<std::string>());
  }
  if (cfg.contains("history_retention_days")) {
    set_history_retention_days(cfg["history_retention_days"].get<int>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
  if (cfg.contains("desktop_notifications")) {
    set_desktop_notifications(cfg["desktop_notifications"].get<bool>());
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

std::string default_data_dir() {
#ifdef _WIN32
  if (const char *appdata = std::getenv("APPDATA")) {
    return std::string(appdata) + "\\usagemonitor";
  }
#else
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME")) {
    if (*xdg) {
      return std::string(xdg) + "/usagemonitor";
    }
  }
  if (const char *home = std::getenv("HOME")) {
    return std::string(home) + "/.config/usagemonitor";
  }
#endif
  return ".";
}

} // namespace umon
