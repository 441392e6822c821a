/**
 * @file github_client.hpp
 * @brief Authenticated dispatcher for the GitHub REST and GraphQL API.
 *
 * GitHubClient attaches credentials, applies the retry policy, classifies
 * responses into Outcome values and walks paginated results. Resource
 * specific handlers build on send() and next_page().
 */
#ifndef OCTOCLIENT_GITHUB_CLIENT_HPP
#define OCTOCLIENT_GITHUB_CLIENT_HPP

#include "cancellation.hpp"
#include "config.hpp"
#include "credential.hpp"
#include "errors.hpp"
#include "http_cache.hpp"
#include "http_client.hpp"
#include "page.hpp"
#include "request.hpp"
#include "response.hpp"
#include "retry.hpp"
#include "token_cache.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace octo {

/// Rate limit window reported by GitHub.
struct RateLimit {
  long limit{0};
  long remaining{0};
  long used{0};
  std::chrono::system_clock::time_point reset{};
};

/// Parse `X-RateLimit-*` headers; no value when they are absent.
std::optional<RateLimit> rate_limit_from_headers(const HttpResponse &response);

/// Maximum number of `Location` hops followed by follow_location_to_data().
inline constexpr int kMaxRedirects = 10;

/**
 * Client dispatching requests to the GitHub API.
 *
 * Instances are safe to share between threads.
 */
class GitHubClient {
public:
  /**
   * Observer invoked before each backoff wait with the zero based retry
   * index, the chosen delay and the error being retried.
   */
  using RetryObserver = std::function<void(int, std::chrono::milliseconds,
                                           const Error &)>;

  /**
   * Construct a client.
   *
   * @param config Base URLs, credential, retry and cache settings.
   * @param http Transport; a CurlHttpClient built from @p config is used when
   *        null.
   * @throws ConfigError When the configuration is inconsistent.
   */
  explicit GitHubClient(const ClientConfig &config = ClientConfig{},
                        std::unique_ptr<HttpClient> http = nullptr);

  /// Drains queued asynchronous dispatches and persists the response cache.
  ~GitHubClient();

  GitHubClient(const GitHubClient &) = delete;
  GitHubClient &operator=(const GitHubClient &) = delete;

  /// Assemble a request against the API base.
  Request build(Method method, const std::string &route,
                const QueryParams &query = {},
                const std::optional<nlohmann::json> &body = std::nullopt) const {
    return builder_.build(method, route, query, body);
  }

  /// Resolve @p route against the API base.
  std::string absolute_url(const std::string &route) const {
    return builder_.absolute_url(route);
  }

  const RequestBuilder &builder() const { return builder_; }

  /**
   * `Authorization` value for a request to @p url.
   *
   * Relative routes and URLs on the API or GraphQL origin receive the
   * credential's header. Any other origin, including the same host over a
   * different scheme, receives none.
   *
   * @throws AuthError When the credential cannot produce a header.
   */
  std::optional<std::string> derive_auth_header(const std::string &url) const;

  /**
   * Dispatch @p request and classify the response without decoding it.
   *
   * Retries transient failures according to the retry policy. Redirects are
   * returned as successes only when `request.follow_redirects` is set.
   *
   * @param request Request to send; consumed.
   * @param cancel Token that aborts pending backoff waits.
   * @return The response, or the classified error of the last attempt.
   */
  Outcome<HttpResponse> send_raw(Request request,
                                 const CancellationToken &cancel = {});

  /**
   * Dispatch @p request and decode a successful body as @p T.
   *
   * `204` and `205` responses yield a default constructed @p T without
   * reading the body.
   */
  template <typename T>
  Outcome<T> send(Request request, const CancellationToken &cancel = {}) {
    Outcome<HttpResponse> raw = send_raw(std::move(request), cancel);
    if (!raw) {
      return raw.error();
    }
    return decode<T>(raw.value());
  }

  /// Run send() on the worker pool.
  template <typename T>
  std::future<Outcome<T>> send_async(Request request,
                                     CancellationToken cancel = {}) {
    return workers_->submit(
        [this, request = std::move(request), cancel]() mutable {
          return send<T>(std::move(request), cancel);
        });
  }

  template <typename T = nlohmann::json>
  Outcome<T> get(const std::string &route, const QueryParams &query = {}) {
    return send<T>(build(Method::Get, route, query));
  }

  template <typename T = nlohmann::json>
  Outcome<T> post(const std::string &route,
                  const std::optional<nlohmann::json> &body = std::nullopt) {
    return send<T>(build(Method::Post, route, {}, body));
  }

  template <typename T = nlohmann::json>
  Outcome<T> put(const std::string &route,
                 const std::optional<nlohmann::json> &body = std::nullopt) {
    return send<T>(build(Method::Put, route, {}, body));
  }

  template <typename T = nlohmann::json>
  Outcome<T> patch(const std::string &route,
                   const std::optional<nlohmann::json> &body = std::nullopt) {
    return send<T>(build(Method::Patch, route, {}, body));
  }

  template <typename T = Empty> Outcome<T> del(const std::string &route) {
    return send<T>(build(Method::Delete, route));
  }

  /**
   * POST a GraphQL document to `<graphql_base>/graphql`.
   *
   * @param body Complete request body, e.g. `{"query": ..., "variables": ...}`.
   */
  template <typename T = nlohmann::json>
  Outcome<T> graphql(const nlohmann::json &body) {
    return send<T>(graphql_builder_.build(Method::Post, "/graphql", {}, body));
  }

  /// Fetch the first page of a list endpoint.
  template <typename T>
  Outcome<Page<T>> get_page(const std::string &route,
                            const QueryParams &query = {}) {
    return send<Page<T>>(build(Method::Get, route, query));
  }

  /**
   * Fetch the page after @p page.
   *
   * @return No page when @p page has no `next` link.
   */
  template <typename T>
  Outcome<std::optional<Page<T>>> next_page(const Page<T> &page) {
    if (!page.next) {
      return std::optional<Page<T>>{};
    }
    Outcome<Page<T>> next = send<Page<T>>(build(Method::Get, *page.next));
    if (!next) {
      return next.error();
    }
    return std::optional<Page<T>>(std::move(next).value());
  }

  /**
   * Collect the items of @p first and every following page.
   *
   * Stops at the first error, when no `next` link remains, when a `next`
   * link repeats, or once @p limit items were collected.
   */
  template <typename T>
  Outcome<std::vector<T>>
  all_pages(Page<T> first,
            std::size_t limit = std::numeric_limits<std::size_t>::max()) {
    std::vector<T> items;
    std::unordered_set<std::string> visited;
    Page<T> page = std::move(first);
    while (true) {
      for (auto &item : page.take_items()) {
        if (items.size() >= limit) {
          break;
        }
        items.push_back(std::move(item));
      }
      if (items.size() >= limit || !page.next) {
        break;
      }
      if (!visited.insert(*page.next).second) {
        log_pagination_loop(*page.next);
        break;
      }
      auto next = next_page(page);
      if (!next) {
        return next.error();
      }
      page = std::move(*std::move(next).value());
    }
    return Outcome<std::vector<T>>(std::move(items));
  }

  /**
   * Download the body behind @p url, following `Location` redirects.
   *
   * Authorization is derived again for each hop, so it is dropped when a
   * redirect leaves the API origin. Relative `Location` values resolve
   * against the URL of the hop that returned them.
   */
  Outcome<std::string>
  follow_location_to_data(const std::string &url,
                          const CancellationToken &cancel = {});

  /// Query `GET /rate_limit` for the core rate limit.
  Outcome<RateLimit> rate_limit();

  /// Rate limit reported by the most recent response, if any.
  std::optional<RateLimit> last_rate_limit() const;

  /// Install an observer for retry decisions.
  void set_retry_observer(RetryObserver observer);

  const RetryPolicy &retry_policy() const { return retry_; }

  const Credential &credential() const { return auth_.credential(); }

  const std::shared_ptr<TokenCache> &token_cache() const {
    return auth_.token_cache();
  }

  /// Conditional request cache; null when caching is disabled.
  const std::shared_ptr<ResponseCache> &response_cache() const {
    return cache_;
  }

  WorkerPool &workers() { return *workers_; }

private:
  template <typename T> static Outcome<T> decode(const HttpResponse &response) {
    if constexpr (std::is_default_constructible_v<T>) {
      if (response.status_code == 204 || response.status_code == 205) {
        return T{};
      }
    }
    try {
      return FromResponse<T>::decode(response);
    } catch (const std::exception &e) {
      return decode_error(response, e.what());
    }
  }

  Outcome<HttpResponse> perform_once(const Request &request,
                                     const std::optional<CachedResponse> &cached);
  std::chrono::milliseconds retry_delay(const Error &error, int attempt) const;
  void record_rate_limit(const HttpResponse &response);
  InstallationToken exchange_installation_token(std::uint64_t installation_id,
                                                const std::string &jwt);
  void log_pagination_loop(const std::string &url) const;

  RequestBuilder builder_;
  RequestBuilder graphql_builder_;
  std::string origin_;
  std::string graphql_origin_;
  RetryPolicy retry_;
  std::unique_ptr<HttpClient> http_;
  Authenticator auth_;
  std::shared_ptr<ResponseCache> cache_;
  mutable std::mutex state_mutex_;
  std::optional<RateLimit> last_rate_limit_;
  RetryObserver retry_observer_;
  std::unique_ptr<WorkerPool> workers_;
};

} // namespace octo

#endif // OCTOCLIENT_GITHUB_CLIENT_HPP
