#ifndef OCTOCLIENT_HTTP_CLIENT_HPP
#define OCTOCLIENT_HTTP_CLIENT_HPP

#include "request.hpp"
#include <curl/curl.h>
#include <optional>
#include <string>
#include <vector>

namespace octo {

/// Status, header lines and body of one HTTP exchange.
struct HttpResponse {
  std::string body;
  std::vector<std::string> headers; ///< Raw `Name: value` lines
  long status_code{0};

  /// Case-insensitive lookup of the last header named @p name.
  std::optional<std::string> header(const std::string &name) const;

  /// Whether the status is in the 2xx range.
  bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/// Transport seam; tests substitute scripted implementations.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP request and return the response for any status code.
   *
   * Redirects are never followed by the transport; 3xx responses are
   * returned to the caller so authorization can be re-derived per hop.
   *
   * @param request Fully assembled request including headers and body.
   * @return The response, whatever its status code.
   * @throws TransientNetworkError On DNS, connect, TLS or timeout failures.
   */
  virtual HttpResponse perform(const Request &request) = 0;
};

/// Owned libcurl easy handle. The first instance runs curl_global_init.
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * libcurl transport.
 *
 * Every call to perform() uses its own easy handle, so one instance may be
 * shared by concurrent dispatches.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Connect and total transfer timeout.
   * @param download_limit Receive rate cap in bytes/s, 0 for none.
   * @param upload_limit Send rate cap in bytes/s, 0 for none.
   * @param http_proxy Proxy for `http://` targets, and for `https://` ones
   *        when @p https_proxy is empty.
   * @param https_proxy Proxy for `https://` targets.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, curl_off_t download_limit = 0,
                          curl_off_t upload_limit = 0, std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::perform()
  HttpResponse perform(const Request &request) override;

private:
  void apply_proxy(CURL *curl, const std::string &url) const;
  long timeout_ms_;
  curl_off_t download_limit_;
  curl_off_t upload_limit_;
  std::string http_proxy_;
  std::string https_proxy_;
};

} // namespace octo

#endif // OCTOCLIENT_HTTP_CLIENT_HPP
