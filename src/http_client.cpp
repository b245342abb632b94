#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <utility>

namespace umon {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  if (!line.empty()) {
    static_cast<std::vector<std::string> *>(userdata)->push_back(line);
  }
  return total;
}

std::string describe_curl_error(const std::string &url, CURLcode code,
                                const char *errbuf) {
  std::string msg = "GET " + url + " failed: " + curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    msg += " (";
    msg += errbuf;
    msg += ")";
  }
  return msg;
}

} // namespace

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

std::string CurlHttpClient::proxy_for(const std::string &url) const {
  if (url.rfind("https://", 0) == 0) {
    return !https_proxy_.empty() ? https_proxy_ : http_proxy_;
  }
  if (url.rfind("http://", 0) == 0) {
    return http_proxy_;
  }
  return {};
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  std::string proxy = proxy_for(url);
  if (!proxy.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL,
                     url.rfind("https://", 0) == 0 ? 1L : 0L);
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = describe_curl_error(url, res, errbuf);
    http_log()->warn(msg);
    throw TransientNetworkError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  http_log()->debug("GET {} -> HTTP {} ({} bytes)", url, response.status_code,
                    response.body.size());
  return response;
}

} // namespace umon
