/**
 * @file errors.hpp
 * @brief Exception types shared across usagemonitor components.
 */

#ifndef USAGEMONITOR_ERRORS_HPP
#define USAGEMONITOR_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace umon {

/// Transport level failure (DNS, connect, TLS, timeout).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-success HTTP status returned by a remote endpoint.
class HttpStatusError : public std::runtime_error {
public:
  /**
   * @param status HTTP status code reported by the server.
   * @param message Human readable description.
   */
  HttpStatusError(int status, const std::string &message)
      : std::runtime_error(message), status(status) {}

  int status; ///< HTTP status code
};

/// Rejected user input such as a malformed organization id.
class ValidationError : public std::runtime_error {
public:
  /**
   * @param field Name of the offending input field.
   * @param message Description of the problem.
   */
  ValidationError(std::string field, const std::string &message)
      : std::runtime_error(message), field_(std::move(field)) {}

  /// Name of the field that failed validation.
  const std::string &field() const noexcept { return field_; }

private:
  std::string field_;
};

/// Failure reading or writing a persistent store.
class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace umon

#endif // USAGEMONITOR_ERRORS_HPP
