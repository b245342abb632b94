/**
 * @file usage_fetcher.hpp
 * @brief Single-shot retrieval of the organization usage document.
 *
 * The fetcher performs exactly one request per call and classifies the
 * outcome. Retry and backoff decisions belong to the refresh supervisor.
 */

#ifndef USAGEMONITOR_USAGE_FETCHER_HPP
#define USAGEMONITOR_USAGE_FETCHER_HPP

#include "http_client.hpp"
#include "usage_types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace umon {

/// Classified failure of a usage fetch.
enum class FetchError {
  Unauthorized, ///< HTTP 401, the session expired
  RateLimited,  ///< HTTP 429
  ServerError,  ///< Any other non-2xx status
  Network,      ///< No response received
  ParseError    ///< 2xx with a body that is not a usage document
};

/// Stable identifier such as `rate_limited`.
const char *to_string(FetchError error);

/// Whether retrying later may succeed without user action.
bool is_retryable(FetchError error);

/**
 * User-facing classification message.
 *
 * @param error Failure kind.
 * @param status HTTP status, only used for ServerError.
 */
std::string describe(FetchError error, long status = 0);

/**
 * Result of one fetch: either a snapshot or a classified error.
 */
class FetchOutcome {
public:
  /// Successful outcome carrying @p snapshot.
  static FetchOutcome success(UsageSnapshot snapshot);

  /**
   * Failed outcome.
   *
   * @param error Failure kind.
   * @param status HTTP status when one was received, otherwise 0.
   * @param detail Diagnostic text for logs.
   */
  static FetchOutcome failure(FetchError error, long status = 0,
                              std::string detail = {});

  bool ok() const { return snapshot_.has_value(); }

  /// Snapshot of a successful outcome; undefined for failures.
  const UsageSnapshot &snapshot() const { return *snapshot_; }

  /// Failure kind; meaningful only when `ok()` is false.
  FetchError error() const { return error_; }

  long status() const { return status_; }
  const std::string &detail() const { return detail_; }

  /// User-facing message for a failed outcome.
  std::string message() const { return describe(error_, status_); }

private:
  FetchOutcome() = default;

  std::optional<UsageSnapshot> snapshot_;
  FetchError error_{FetchError::Network};
  long status_{0};
  std::string detail_;
};

/**
 * Source of usage snapshots for the refresh supervisor.
 */
class UsageSource {
public:
  virtual ~UsageSource() = default;

  /**
   * Fetch the current usage for an organization. Never throws.
   *
   * @param organization_id Validated organization id.
   * @param session_token Validated session token.
   */
  virtual FetchOutcome fetch(const std::string &organization_id,
                             const std::string &session_token) = 0;
};

/**
 * Usage source backed by the `/api/organizations/{id}/usage` endpoint.
 */
class UsageFetcher : public UsageSource {
public:
  /**
   * @param http Transport used for requests.
   * @param api_base Scheme and host of the API, without trailing slash.
   * @param user_agent Client identifier sent with every request.
   */
  UsageFetcher(std::unique_ptr<HttpClient> http, std::string api_base,
               std::string user_agent);

  FetchOutcome fetch(const std::string &organization_id,
                     const std::string &session_token) override;

  /// URL of the usage document for @p organization_id.
  std::string usage_url(const std::string &organization_id) const;

private:
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  std::string user_agent_;
};

} // namespace umon

#endif // USAGEMONITOR_USAGE_FETCHER_HPP
