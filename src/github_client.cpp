#include "github_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <random>
#include <spdlog/spdlog.h>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::optional<long> header_long(const HttpResponse &response,
                                const std::string &name) {
  auto value = response.header(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    long parsed = std::stol(*value, &idx);
    if (idx != value->size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

double jitter_sample() {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng);
}

bool is_redirect(long status) { return status >= 300 && status < 400; }

/// Resolve a `Location` header value against the URL that returned it.
std::string resolve_location(const std::string &current,
                             const std::string &location) {
  if (is_absolute_url(location)) {
    return location;
  }
  const std::string origin = url_origin(current);
  if (location.rfind("//", 0) == 0) {
    return origin.substr(0, origin.find("://") + 1) + location;
  }
  if (location.front() == '/') {
    return origin + location;
  }
  std::string path = current.substr(0, current.find_first_of("?#"));
  if (location.front() == '?') {
    return path + location;
  }
  if (path.find('/', path.find("://") + 3) == std::string::npos) {
    return path + "/" + location;
  }
  return path.substr(0, path.rfind('/') + 1) + location;
}

} // namespace

std::optional<RateLimit> rate_limit_from_headers(const HttpResponse &response) {
  auto limit = header_long(response, "X-RateLimit-Limit");
  auto remaining = header_long(response, "X-RateLimit-Remaining");
  if (!limit || !remaining) {
    return std::nullopt;
  }
  RateLimit rate;
  rate.limit = *limit;
  rate.remaining = *remaining;
  rate.used = header_long(response, "X-RateLimit-Used").value_or(*limit - *remaining);
  if (auto reset = header_long(response, "X-RateLimit-Reset")) {
    // Clamped to the year 9999 so the epoch fits system_clock's precision.
    rate.reset = std::chrono::system_clock::time_point(
        std::chrono::seconds(std::clamp(*reset, 0L, 253402300799L)));
  }
  return rate;
}

GitHubClient::GitHubClient(const ClientConfig &config,
                           std::unique_ptr<HttpClient> http)
    : builder_(config.api_base(), config.user_agent(), config.previews(),
               config.api_version()),
      graphql_builder_(config.graphql_base(), config.user_agent(),
                       config.previews(), config.api_version()),
      origin_(builder_.origin()), graphql_origin_(graphql_builder_.origin()),
      retry_(config.retry()),
      http_(http ? std::move(http)
                 : std::make_unique<CurlHttpClient>(
                       static_cast<long>(config.timeout().count()),
                       static_cast<curl_off_t>(config.download_limit()),
                       static_cast<curl_off_t>(config.upload_limit()),
                       config.http_proxy(), config.https_proxy())),
      auth_(config.credential(),
            std::make_shared<TokenCache>(config.token_safety_margin()),
            [this](std::uint64_t id, const std::string &jwt) {
              return exchange_installation_token(id, jwt);
            }),
      workers_(std::make_unique<WorkerPool>(config.workers())) {
  if (config.cache_enabled()) {
    cache_ = std::make_shared<InMemoryResponseCache>(config.cache_file());
  }
  workers_->start();
  github_client_log()->debug(
      "Client ready (base={}, credential={}, retry={}, attempts={})",
      builder_.base_url(), credential_kind(auth_.credential()),
      retry_.enabled ? "on" : "off", retry_.max_attempts);
}

GitHubClient::~GitHubClient() { workers_->stop(); }

std::optional<std::string>
GitHubClient::derive_auth_header(const std::string &url) const {
  if (is_absolute_url(url)) {
    const std::string target = url_origin(url);
    if (target != origin_ && target != graphql_origin_) {
      github_client_log()->debug(
          "Withholding credentials from foreign origin {}", target);
      return std::nullopt;
    }
  }
  return auth_.header();
}

InstallationToken
GitHubClient::exchange_installation_token(std::uint64_t installation_id,
                                          const std::string &jwt) {
  Request request = build(Method::Post, "/app/installations/" +
                                            std::to_string(installation_id) +
                                            "/access_tokens");
  request.set_header("Authorization", "Bearer " + jwt);
  request.idempotent = true;
  Outcome<HttpResponse> outcome = send_raw(std::move(request));
  if (!outcome) {
    throw AuthError("Installation token exchange failed: " +
                    outcome.error().describe());
  }
  return parse_installation_token(outcome.value().body,
                                  std::chrono::system_clock::now());
}

Outcome<HttpResponse> GitHubClient::send_raw(Request request,
                                             const CancellationToken &cancel) {
  std::optional<std::string> derived_auth;
  if (!request.has_header("Authorization")) {
    try {
      derived_auth = derive_auth_header(request.url);
      if (derived_auth) {
        request.set_header("Authorization", *derived_auth);
      }
    } catch (const AuthError &e) {
      github_client_log()->error("{} {}: {}", to_string(request.method),
                                 request.url, e.what());
      return auth_error(e.what());
    }
  }

  std::optional<CachedResponse> cached;
  if (cache_ && request.method == Method::Get &&
      !request.has_header("If-None-Match") &&
      !request.has_header("If-Modified-Since")) {
    cached = cache_->lookup(request.url);
    if (cached && !cached->etag.empty()) {
      request.set_header("If-None-Match", cached->etag);
    } else if (cached && !cached->last_modified.empty()) {
      request.set_header("If-Modified-Since", cached->last_modified);
    }
  }

  const bool may_retry =
      retry_.enabled && (is_idempotent(request.method) || request.idempotent);
  const int max_attempts = may_retry ? std::max(1, retry_.max_attempts) : 1;
  RetryObserver observer;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    observer = retry_observer_;
  }

  for (int attempt = 0;; ++attempt) {
    Outcome<HttpResponse> outcome = perform_once(request, cached);
    if (outcome.ok()) {
      return outcome;
    }
    const Error &error = outcome.error();
    if (error.status == 401 && derived_auth) {
      auth_.invalidate(*derived_auth);
    }
    if (!error.is_retryable() || attempt + 1 >= max_attempts) {
      if (error.is_retryable() && max_attempts > 1) {
        github_client_log()->warn("{} {} failed after {} attempts: {}",
                                  to_string(request.method), request.url,
                                  attempt + 1, error.describe());
      }
      return outcome;
    }
    const auto delay = retry_delay(error, attempt);
    github_client_log()->warn("{} {} attempt {} failed ({}); retrying in {} ms",
                              to_string(request.method), request.url,
                              attempt + 1, error.describe(), delay.count());
    if (observer) {
      observer(attempt, delay, error);
    }
    if (cancel.wait_for(delay)) {
      github_client_log()->info("{} {} cancelled during backoff",
                                to_string(request.method), request.url);
      return outcome;
    }
  }
}

Outcome<HttpResponse>
GitHubClient::perform_once(const Request &request,
                           const std::optional<CachedResponse> &cached) {
  HttpResponse response;
  try {
    response = http_->perform(request);
  } catch (const TransientNetworkError &e) {
    return transport_error(e.what());
  }
  record_rate_limit(response);
  if (response.status_code == 304 && cached) {
    github_client_log()->debug("Cache hit for {}", request.url);
    HttpResponse hit;
    hit.body = cached->body;
    hit.headers = cached->headers;
    hit.status_code = 200;
    return hit;
  }
  if (response.is_success()) {
    if (cache_ && request.method == Method::Get) {
      if (auto entry = cacheable_response(response)) {
        cache_->store(request.url, std::move(*entry));
      }
    }
    return response;
  }
  if (is_redirect(response.status_code) && request.follow_redirects) {
    return response;
  }
  return error_from_response(response);
}

std::chrono::milliseconds GitHubClient::retry_delay(const Error &error,
                                                    int attempt) const {
  if (error.retry_after) {
    return std::min(*error.retry_after, retry_.max_rate_limit_wait);
  }
  return backoff_delay(retry_, attempt, jitter_sample());
}

void GitHubClient::record_rate_limit(const HttpResponse &response) {
  auto rate = rate_limit_from_headers(response);
  if (!rate) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  last_rate_limit_ = rate;
}

std::optional<RateLimit> GitHubClient::last_rate_limit() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_rate_limit_;
}

void GitHubClient::set_retry_observer(RetryObserver observer) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  retry_observer_ = std::move(observer);
}

void GitHubClient::log_pagination_loop(const std::string &url) const {
  category_logger("pagination")
      ->warn("Stopping pagination: next link {} was already visited", url);
}

Outcome<std::string>
GitHubClient::follow_location_to_data(const std::string &url,
                                      const CancellationToken &cancel) {
  std::string current = absolute_url(url);
  for (int hop = 0; hop <= kMaxRedirects; ++hop) {
    Request request = build(Method::Get, current);
    request.follow_redirects = true;
    Outcome<HttpResponse> outcome = send_raw(std::move(request), cancel);
    if (!outcome) {
      return outcome.error();
    }
    const HttpResponse &response = outcome.value();
    if (!is_redirect(response.status_code)) {
      return response.body;
    }
    auto location = response.header("Location");
    if (!location || location->empty()) {
      Error error;
      error.kind = ErrorKind::Client;
      error.status = response.status_code;
      error.message = "Redirect without a Location header";
      error.body = response.body;
      return error;
    }
    current = resolve_location(current, *location);
    github_client_log()->debug("Following redirect to {}", current);
  }
  Error error;
  error.kind = ErrorKind::Client;
  error.message = "Too many redirects (more than " +
                  std::to_string(kMaxRedirects) + ")";
  return error;
}

Outcome<RateLimit> GitHubClient::rate_limit() {
  Outcome<HttpResponse> outcome = send_raw(build(Method::Get, "/rate_limit"));
  if (!outcome) {
    return outcome.error();
  }
  const HttpResponse &response = outcome.value();
  nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
  const nlohmann::json *core = nullptr;
  if (j.is_object() && j.contains("resources") && j["resources"].is_object()) {
    const auto &resources = j["resources"];
    if (resources.contains("core") && resources["core"].is_object()) {
      core = &resources["core"];
    }
  }
  if (!core && j.is_object() && j.contains("rate") && j["rate"].is_object()) {
    core = &j["rate"];
  }
  if (!core) {
    return decode_error(response, "unexpected rate limit payload");
  }
  try {
    RateLimit rate;
    rate.limit = core->value("limit", 0L);
    rate.remaining = core->value("remaining", 0L);
    rate.used = core->value("used", rate.limit - rate.remaining);
    rate.reset = std::chrono::system_clock::time_point(
        std::chrono::seconds(core->value("reset", 0L)));
    return rate;
  } catch (const nlohmann::json::exception &e) {
    return decode_error(response, e.what());
  }
}

} // namespace octo
