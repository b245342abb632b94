#include "credential_store.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> credentials_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("credentials");
  }();
  return logger;
}

enum class FileFormat { Json, Yaml, Toml };

FileFormat format_for(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (ext == ".yaml" || ext == ".yml") {
    return FileFormat::Yaml;
  }
  if (ext == ".toml" || ext == ".tml") {
    return FileFormat::Toml;
  }
  return FileFormat::Json;
}

std::optional<Credentials> make_credentials(std::optional<std::string> org,
                                            std::optional<std::string> token) {
  if (!org || !token || org->empty() || token->empty()) {
    return std::nullopt;
  }
  return Credentials{std::move(*org), std::move(*token)};
}

std::optional<Credentials> read_credentials(const std::string &path) {
  switch (format_for(path)) {
  case FileFormat::Yaml: {
    YAML::Node node = YAML::LoadFile(path);
    std::optional<std::string> org;
    std::optional<std::string> token;
    if (node["organization_id"]) {
      org = node["organization_id"].as<std::string>();
    }
    if (node["session_token"]) {
      token = node["session_token"].as<std::string>();
    }
    return make_credentials(std::move(org), std::move(token));
  }
  case FileFormat::Toml: {
    toml::table tbl = toml::parse_file(path);
    return make_credentials(tbl["organization_id"].value<std::string>(),
                            tbl["session_token"].value<std::string>());
  }
  case FileFormat::Json:
    break;
  }
  std::ifstream f(path);
  if (!f) {
    throw StorageError("Failed to open credential file");
  }
  nlohmann::json j;
  f >> j;
  std::optional<std::string> org;
  std::optional<std::string> token;
  if (j.contains("organization_id")) {
    org = j["organization_id"].get<std::string>();
  }
  if (j.contains("session_token")) {
    token = j["session_token"].get<std::string>();
  }
  return make_credentials(std::move(org), std::move(token));
}

std::string render_credentials(const std::string &path,
                               const Credentials &credentials) {
  std::ostringstream out;
  switch (format_for(path)) {
  case FileFormat::Yaml: {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "organization_id" << YAML::Value
            << credentials.organization_id;
    emitter << YAML::Key << "session_token" << YAML::Value
            << credentials.session_token;
    emitter << YAML::EndMap;
    out << emitter.c_str() << '\n';
    break;
  }
  case FileFormat::Toml: {
    toml::table tbl{{"organization_id", credentials.organization_id},
                    {"session_token", credentials.session_token}};
    out << tbl << '\n';
    break;
  }
  case FileFormat::Json: {
    nlohmann::json j{{"organization_id", credentials.organization_id},
                     {"session_token", credentials.session_token}};
    out << j.dump(2) << '\n';
    break;
  }
  }
  return out.str();
}

} // namespace

FileCredentialStore::FileCredentialStore(std::string path)
    : path_(std::move(path)) {}

std::optional<Credentials> FileCredentialStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    credentials_log()->debug("No credential file at {}", path_);
    return std::nullopt;
  }
  try {
    auto credentials = read_credentials(path_);
    if (!credentials) {
      credentials_log()->warn("Credential file {} is incomplete", path_);
    }
    return credentials;
  } catch (const std::exception &e) {
    credentials_log()->warn("Failed to read credential file {}: {}", path_,
                            e.what());
    return std::nullopt;
  }
}

/**
 * Write credentials to disk with owner-only permissions.
 *
 * @param credentials Organization id and session token to store.
 * @throws StorageError When the directory or file cannot be written.
 */
void FileCredentialStore::save(const Credentials &credentials) {
  namespace fs = std::filesystem;
  fs::path path(path_);
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      credentials_log()->error("Failed to create directories for {}: {}",
                               path_, ec.message());
      throw StorageError("Failed to create credential directory: " +
                         ec.message());
    }
  }
  const std::string contents = render_credentials(path_, credentials);
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    credentials_log()->error("Failed to open {} for writing", path_);
    throw StorageError("Failed to open credential file for writing");
  }
#ifndef _WIN32
  ::chmod(path.c_str(), S_IRUSR | S_IWUSR);
#endif
  out << contents;
  out.close();
  if (!out) {
    credentials_log()->error("Failed to write credentials to {}", path_);
    throw StorageError("Failed to write credential file");
  }
  credentials_log()->info("Saved credentials for org {} (token {}) to {}",
                          credentials.organization_id,
                          mask_secret(credentials.session_token), path_);
}

void FileCredentialStore::remove() {
  std::error_code ec;
  bool removed = std::filesystem::remove(path_, ec);
  if (ec) {
    credentials_log()->error("Failed to delete {}: {}", path_, ec.message());
    throw StorageError("Failed to delete credential file: " + ec.message());
  }
  if (removed) {
    credentials_log()->info("Deleted credential file {}", path_);
  }
}

std::optional<Credentials> MemoryCredentialStore::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return credentials_;
}

void MemoryCredentialStore::save(const Credentials &credentials) {
  std::lock_guard<std::mutex> lock(mutex_);
  credentials_ = credentials;
}

void MemoryCredentialStore::remove() {
  std::lock_guard<std::mutex> lock(mutex_);
  credentials_.reset();
}

} // namespace umon
