#ifndef OCTOCLIENT_TESTS_SCRIPTED_HTTP_CLIENT_HPP
#define OCTOCLIENT_TESTS_SCRIPTED_HTTP_CLIENT_HPP

#include "errors.hpp"
#include "http_client.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace octo::testing {

/// Build a response with optional `Name: value` header lines.
inline HttpResponse make_response(long status, std::string body = {},
                                  std::vector<std::string> headers = {}) {
  HttpResponse res;
  res.status_code = status;
  res.body = std::move(body);
  res.headers = std::move(headers);
  return res;
}

/**
 * Transport returning canned responses in order and recording every request.
 *
 * A handler, when set, answers instead of the queue. Running out of scripted
 * responses raises a TransientNetworkError.
 */
class ScriptedHttpClient : public HttpClient {
public:
  using Handler = std::function<HttpResponse(const Request &)>;

  void push(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.emplace_back(std::move(response));
  }

  void push_network_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.emplace_back(std::nullopt);
  }

  void set_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  HttpResponse perform(const Request &request) override {
    Handler handler;
    std::optional<HttpResponse> next;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      handler = handler_;
      if (!handler) {
        if (script_.empty()) {
          throw TransientNetworkError("no scripted response for " +
                                      request.url);
        }
        next = std::move(script_.front());
        script_.pop_front();
        if (!next) {
          throw TransientNetworkError("connection reset");
        }
      }
    }
    if (handler) {
      return handler(request);
    }
    return *next;
  }

  std::vector<Request> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::size_t request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

private:
  mutable std::mutex mutex_;
  std::deque<std::optional<HttpResponse>> script_;
  std::vector<Request> requests_;
  Handler handler_;
};

} // namespace octo::testing

#endif // OCTOCLIENT_TESTS_SCRIPTED_HTTP_CLIENT_HPP
