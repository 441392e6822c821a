#ifndef OCTOCLIENT_CONFIG_HPP
#define OCTOCLIENT_CONFIG_HPP

#include "credential.hpp"
#include "log.hpp"
#include "retry.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace octo {

/// Client configuration loaded from a YAML, TOML, or JSON file.
class ClientConfig {
public:
  /// Base URL for the REST API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the REST API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Base URL for GraphQL; falls back to the REST base when unset.
  const std::string &graphql_base() const {
    return graphql_base_.empty() ? api_base_ : graphql_base_;
  }

  /// Set base URL for GraphQL.
  void set_graphql_base(const std::string &base) { graphql_base_ = base; }

  /// Value of the `User-Agent` header.
  const std::string &user_agent() const { return user_agent_; }

  /// Set value of the `User-Agent` header.
  void set_user_agent(const std::string &agent) { user_agent_ = agent; }

  /// Value of `X-GitHub-Api-Version`; empty omits the header.
  const std::string &api_version() const { return api_version_; }

  /// Set value of `X-GitHub-Api-Version`.
  void set_api_version(const std::string &version) { api_version_ = version; }

  /// Preview names sent as additional `Accept` media types.
  const std::vector<std::string> &previews() const { return previews_; }

  /// Set enabled previews.
  void set_previews(const std::vector<std::string> &previews) {
    previews_ = previews;
  }

  /// Personal access token.
  const std::string &token() const { return token_; }

  /// Set personal access token.
  void set_token(const std::string &token) { token_ = token; }

  /// OAuth app token.
  const std::string &oauth_token() const { return oauth_token_; }

  /// Set OAuth app token.
  void set_oauth_token(const std::string &token) { oauth_token_ = token; }

  /// User for basic authentication.
  const std::string &basic_user() const { return basic_user_; }

  /// Password for basic authentication.
  const std::string &basic_password() const { return basic_password_; }

  /// Set basic authentication user and password.
  void set_basic_auth(const std::string &user, const std::string &password) {
    basic_user_ = user;
    basic_password_ = password;
  }

  /// GitHub App identifier.
  const std::string &app_id() const { return app_id_; }

  /// Set GitHub App identifier.
  void set_app_id(const std::string &id) { app_id_ = id; }

  /// PEM encoded GitHub App private key.
  const std::string &private_key() const { return private_key_; }

  /// Set PEM encoded GitHub App private key.
  void set_private_key(const std::string &key) { private_key_ = key; }

  /// Installation to act as (0 = authenticate as the app itself).
  std::uint64_t installation_id() const { return installation_id_; }

  /// Set installation to act as.
  void set_installation_id(std::uint64_t id) { installation_id_ = id; }

  /**
   * Credential described by the authentication settings.
   *
   * @throws ConfigError When settings of several credential kinds are mixed
   *         or a kind is incomplete.
   */
  Credential credential() const;

  /// Request timeout.
  std::chrono::milliseconds timeout() const { return timeout_; }

  /// Set request timeout.
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

  /// Retry policy applied by the dispatcher.
  const RetryPolicy &retry() const { return retry_; }

  /// Set retry policy.
  void set_retry(const RetryPolicy &policy) { retry_ = policy; }

  /// Installation tokens expiring within this window are refreshed.
  std::chrono::seconds token_safety_margin() const {
    return token_safety_margin_;
  }

  /// Set installation token safety margin.
  void set_token_safety_margin(std::chrono::seconds margin) {
    token_safety_margin_ = margin;
  }

  /// Whether conditional GET requests are used.
  bool cache_enabled() const { return cache_enabled_; }

  /// Enable or disable conditional GET requests.
  void set_cache_enabled(bool enabled) { cache_enabled_ = enabled; }

  /// File persisting the conditional request cache (empty = memory only).
  const std::string &cache_file() const { return cache_file_; }

  /// Set file persisting the conditional request cache.
  void set_cache_file(const std::string &file) { cache_file_ = file; }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Download rate limit in bytes per second (0 = unlimited).
  long long download_limit() const { return download_limit_; }

  /// Set download rate limit.
  void set_download_limit(long long limit) { download_limit_ = limit; }

  /// Upload rate limit in bytes per second (0 = unlimited).
  long long upload_limit() const { return upload_limit_; }

  /// Set upload rate limit.
  void set_upload_limit(long long limit) { upload_limit_ = limit; }

  /// Number of worker threads used by send_async().
  int workers() const { return workers_; }

  /// Set worker thread count (minimum 1).
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int rotate) { log_rotate_ = rotate < 0 ? 0 : rotate; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable gzip compression of rotated logs.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /**
   * Logger settings derived from the logging options.
   *
   * @throws ConfigError When the level name is invalid.
   */
  LogOptions log_options() const;

  /// Load configuration from a YAML, TOML, or JSON file.
  static ClientConfig from_file(const std::string &path);

  /// Create a configuration from a parsed document.
  static ClientConfig from_json(const nlohmann::json &j);

  /// Apply the values present in @p j on top of the current settings.
  void load_json(const nlohmann::json &j);

private:
  std::string api_base_{"https://api.github.com"};
  std::string graphql_base_;
  std::string user_agent_{"octoclient"};
  std::string api_version_;
  std::vector<std::string> previews_;
  std::string token_;
  std::string oauth_token_;
  std::string basic_user_;
  std::string basic_password_;
  std::string app_id_;
  std::string private_key_;
  std::uint64_t installation_id_{0};
  std::chrono::milliseconds timeout_{30000};
  RetryPolicy retry_;
  std::chrono::seconds token_safety_margin_{60};
  bool cache_enabled_{false};
  std::string cache_file_;
  std::string http_proxy_;
  std::string https_proxy_;
  long long download_limit_{0};
  long long upload_limit_{0};
  int workers_{4};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace octo

#endif // OCTOCLIENT_CONFIG_HPP
