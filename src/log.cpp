#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char *kRootLoggerName = "umon";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

namespace fs = std::filesystem;

/**
 * Compute the path of a rotated log file (`monitor.log` -> `monitor.2.log`).
 *
 * @param base Base log file path.
 * @param index Rotation index, zero being the active file.
 * @return Filesystem path pointing to the rotated file.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  std::string rotated =
      stem.string() + "." + std::to_string(index) + ext.string();
  return base_path.has_parent_path() ? base_path.parent_path() / rotated
                                     : fs::path(rotated);
}

/**
 * Shift gzip archives one slot up, dropping the oldest.
 *
 * @param base Base log file path.
 * @param max_files Maximum number of archives to retain.
 */
void shift_archives(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  auto log = umon::category_logger("logging");
  log->debug("Shifting compressed logs for '{}' (max {})", base, max_files);
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
    if (ec) {
      log->warn("Failed to rename {} -> {}: {}", from.string(), to.string(),
                ec.message());
    }
  }
}

/**
 * Gzip a rotated log file and remove the plain copy.
 *
 * @param path Log file to compress.
 * @return `true` if compression succeeded.
 */
bool gzip_file(const std::string &path) {
  auto log = umon::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path);
    return false;
  }
  const std::string target = path + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", target);
    return false;
  }
  std::vector<char> buffer(16 * 1024);
  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = input.gcount();
    if (read <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer.data(), static_cast<unsigned>(read));
    if (written != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path, msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(target, ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log->warn("Failed to remove {} after compression: {}", path, ec.message());
  }
  log->debug("Compressed rotated log '{}'", target);
  return true;
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), pool,
      spdlog::async_overflow_policy::block);
}

} // namespace

namespace umon {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
      if (rotate_files > 0) {
        spdlog::file_event_handlers handlers;
        if (compress_rotations) {
          handlers.before_open = [rotate_files](
                                     const spdlog::filename_t &filename) {
            const auto base = spdlog::details::os::filename_to_str(filename);
            shift_archives(base, rotate_files);
            fs::path newest = rotated_path(base, 1);
            std::error_code ec;
            if (fs::exists(newest, ec)) {
              gzip_file(newest.string());
            }
          };
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, kMaxLogFileSize, rotate_files, false, handlers));
      } else {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
      }
    }
    logger = make_async_logger(kRootLoggerName, sinks);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug(
      "Logger initialised (level={}, file='{}', rotate={}, compress={})",
      spdlog::level::to_string_view(level), file, rotate_files,
      compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto logger = make_async_logger(name, sinks);
  logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  category_logger("logging")->info("Applied {} log category override(s)",
                                   overrides.size());
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "warning") {
    lower = "warn";
  }
  auto level = spdlog::level::from_str(lower);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && lower != "off") {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

std::string mask_secret(const std::string &secret) {
  if (secret.size() <= 4) {
    return std::string(secret.size(), '*');
  }
  return "****" + secret.substr(secret.size() - 4);
}

} // namespace umon
