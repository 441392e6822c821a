/**
 * @file http_client.cpp
 * @brief libcurl transport used by the dispatcher.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/spdlog.h>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string trim_blanks(const std::string &value) {
  auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

bool same_name(const std::string &line, std::size_t len, const std::string &name) {
  if (len != name.size()) {
    return false;
  }
  for (std::size_t i = 0; i < len; ++i) {
    if (std::tolower(static_cast<unsigned char>(line[i])) !=
        std::tolower(static_cast<unsigned char>(name[i]))) {
      return false;
    }
  }
  return true;
}

/// Owns the `curl_slist` handed to CURLOPT_HTTPHEADER.
class HeaderSlist {
public:
  HeaderSlist() = default;
  ~HeaderSlist() { curl_slist_free_all(head_); }
  HeaderSlist(const HeaderSlist &) = delete;
  HeaderSlist &operator=(const HeaderSlist &) = delete;

  void add(const std::string &line) {
    curl_slist *next = curl_slist_append(head_, line.c_str());
    if (next == nullptr) {
      throw TransientNetworkError("Out of memory building request headers");
    }
    head_ = next;
  }

  curl_slist *get() const { return head_; }

private:
  curl_slist *head_{nullptr};
};

size_t on_body(void *data, size_t size, size_t count, void *target) {
  const size_t bytes = size * count;
  static_cast<std::string *>(target)->append(static_cast<const char *>(data),
                                             bytes);
  return bytes;
}

/// Keeps `Name: value` lines; status lines and the blank terminator are
/// dropped. Interim responses (100 Continue) reset the collected lines.
size_t on_header(char *data, size_t size, size_t count, void *target) {
  const size_t bytes = size * count;
  auto *lines = static_cast<std::vector<std::string> *>(target);
  std::string line(data, bytes);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  if (line.rfind("HTTP/", 0) == 0) {
    lines->clear();
  } else if (!line.empty()) {
    lines->push_back(std::move(line));
  }
  return bytes;
}

bool sends_body(Method method) {
  return method == Method::Post || method == Method::Put ||
         method == Method::Patch;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  std::optional<std::string> value;
  for (const auto &line : headers) {
    auto colon = line.find(':');
    if (colon != std::string::npos && same_name(line, colon, name)) {
      value = trim_blanks(line.substr(colon + 1));
    }
  }
  return value;
}

CurlHandle::CurlHandle() {
  static std::once_flag global_init;
  std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (handle_ == nullptr) {
    throw TransientNetworkError("curl_easy_init failed");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, curl_off_t download_limit,
                               curl_off_t upload_limit, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), download_limit_(download_limit),
      upload_limit_(upload_limit), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

/**
 * Select the proxy for @p url. HTTPS targets prefer the HTTPS proxy and fall
 * back to the HTTP one, tunnelling through it with CONNECT.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const bool secure = url.rfind("https://", 0) == 0;
  const std::string &proxy =
      secure && !https_proxy_.empty() ? https_proxy_ : http_proxy_;
  if (proxy.empty()) {
    return;
  }
  curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, secure ? 1L : 0L);
}

HttpResponse CurlHttpClient::perform(const Request &request) {
  CurlHandle handle;
  CURL *curl = handle.get();
  const char *verb = to_string(request.method);
  HttpResponse response;

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  apply_proxy(curl, request.url);
  if (request.method == Method::Get) {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else if (request.method == Method::Head) {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb);
  }
  if (request.body || sends_body(request.method)) {
    const std::string &payload = request.body ? *request.body : std::string{};
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, payload.c_str());
  }

  HeaderSlist headers;
  for (const auto &[name, value] : request.headers) {
    headers.add(name + ": " + value);
  }
  headers.add("Expect:");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  if (download_limit_ > 0) {
    curl_easy_setopt(curl, CURLOPT_MAX_RECV_SPEED_LARGE, download_limit_);
  }
  if (upload_limit_ > 0) {
    curl_easy_setopt(curl, CURLOPT_MAX_SEND_SPEED_LARGE, upload_limit_);
  }
  char detail[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, detail);

  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    std::string msg = std::string(verb) + " " + request.url + ": " +
                      curl_easy_strerror(rc);
    if (detail[0] != '\0') {
      msg += " (" + std::string(detail) + ")";
    }
    http_log()->warn("Transport failure: {}", msg);
    throw TransientNetworkError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  http_log()->debug("{} {} -> {} ({} bytes)", verb, request.url,
                    response.status_code, response.body.size());
  return response;
}

} // namespace octo
