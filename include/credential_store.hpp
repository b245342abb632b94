/**
 * @file credential_store.hpp
 * @brief Persistent storage for the organization id and session token.
 */

#ifndef USAGEMONITOR_CREDENTIAL_STORE_HPP
#define USAGEMONITOR_CREDENTIAL_STORE_HPP

#include "refresh_config.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace umon {

/**
 * Opaque credential storage.
 */
class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  /**
   * Load stored credentials.
   *
   * @return Credentials, or `std::nullopt` when none are stored or the stored
   *         record is unreadable.
   */
  virtual std::optional<Credentials> load() const = 0;

  /**
   * Persist credentials, replacing any previous record.
   *
   * @throws StorageError When the record cannot be written.
   */
  virtual void save(const Credentials &credentials) = 0;

  /**
   * Delete stored credentials. Removing an absent record succeeds.
   *
   * @throws StorageError When an existing record cannot be removed.
   */
  virtual void remove() = 0;
};

/**
 * Credentials kept in a JSON, YAML or TOML file selected by extension.
 *
 * The file holds `organization_id` and `session_token` keys and is
 * restricted to its owner on POSIX systems.
 */
class FileCredentialStore : public CredentialStore {
public:
  explicit FileCredentialStore(std::string path);

  std::optional<Credentials> load() const override;
  void save(const Credentials &credentials) override;
  void remove() override;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/// In-process credential store for embedding and tests.
class MemoryCredentialStore : public CredentialStore {
public:
  std::optional<Credentials> load() const override;
  void save(const Credentials &credentials) override;
  void remove() override;

private:
  mutable std::mutex mutex_;
  std::optional<Credentials> credentials_;
};

} // namespace umon

#endif // USAGEMONITOR_CREDENTIAL_STORE_HPP
