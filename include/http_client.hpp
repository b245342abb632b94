/**
 * @file http_client.hpp
 * @brief Minimal HTTP transport used by the usage fetcher.
 */

#ifndef USAGEMONITOR_HTTP_CLIENT_HPP
#define USAGEMONITOR_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <string>
#include <vector>

namespace umon {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * Any status code the server answers with is returned to the caller;
   * interpreting it is the caller's job.
   *
   * @param url Absolute request URL.
   * @param headers Request headers expressed as `Header: value` strings.
   * @return Response body, headers and status code.
   * @throws TransientNetworkError When no response was received (DNS,
   *         connect, TLS, timeout).
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note Not thread-safe; the refresh supervisor issues one request at a time.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Connect and total timeout per request in milliseconds.
   * @param http_proxy Proxy URL for plain HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests; falls back to
   *        @p http_proxy when empty.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {});

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

  /**
   * Proxy that would be used for @p url.
   *
   * @return Proxy URL, or an empty string for a direct connection.
   */
  std::string proxy_for(const std::string &url) const;

private:
  CurlHandle curl_;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
};

} // namespace umon

#endif // USAGEMONITOR_HTTP_CLIENT_HPP
