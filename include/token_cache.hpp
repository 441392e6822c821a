/**
 * @file token_cache.hpp
 * @brief Cache of installation access tokens keyed by installation id.
 */
#ifndef OCTOCLIENT_TOKEN_CACHE_HPP
#define OCTOCLIENT_TOKEN_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace octo {

/// Installation access token returned by the token exchange.
struct InstallationToken {
  std::string token;
  std::chrono::system_clock::time_point expires_at;
};

/**
 * Parse an ISO 8601 UTC timestamp such as `2016-07-11T22:14:10Z`.
 *
 * @return Parsed time point, or no value for malformed input.
 */
std::optional<std::chrono::system_clock::time_point>
parse_github_timestamp(const std::string &value);

/**
 * Decode the body of `POST /app/installations/{id}/access_tokens`.
 *
 * A missing `expires_at` is treated as one hour after @p now, the lifetime
 * GitHub documents for installation tokens.
 *
 * @throws AuthError When the body has no `token`.
 */
InstallationToken
parse_installation_token(const std::string &body,
                         std::chrono::system_clock::time_point now);

/**
 * Installation tokens shared by every request of a client.
 *
 * Each installation has its own guard. A stale token is refreshed by exactly
 * one caller while concurrent callers for the same installation wait and then
 * observe the refreshed token. Callers for other installations never block on
 * that refresh.
 */
class TokenCache {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using Refresh = std::function<InstallationToken(std::uint64_t)>;

  /**
   * @param safety_margin Tokens expiring within this window count as stale.
   * @param clock Time source; defaults to the system clock.
   */
  explicit TokenCache(
      std::chrono::seconds safety_margin = std::chrono::seconds(60),
      Clock clock = {});

  /**
   * Return a fresh token for @p installation_id, running @p refresh when the
   * cached token is missing or stale.
   *
   * Exceptions thrown by @p refresh propagate and leave the entry empty.
   */
  std::string get(std::uint64_t installation_id, const Refresh &refresh);

  /// Cached token for @p installation_id without refreshing.
  std::optional<InstallationToken> peek(std::uint64_t installation_id) const;

  /// Forget the token of one installation.
  void invalidate(std::uint64_t installation_id);

  /**
   * Forget the token of @p installation_id only while it is still
   * @p rejected. A token another caller already refreshed is kept.
   *
   * @return Whether an entry was dropped.
   */
  bool invalidate_if(std::uint64_t installation_id, const std::string &rejected);

  /// Number of installations holding a token.
  std::size_t size() const;

  std::chrono::seconds safety_margin() const { return safety_margin_; }

private:
  struct Entry {
    std::mutex mutex;
    std::optional<InstallationToken> token;
  };

  std::shared_ptr<Entry> entry(std::uint64_t installation_id);
  std::shared_ptr<Entry> find(std::uint64_t installation_id) const;
  bool is_fresh(const InstallationToken &token) const;

  std::chrono::seconds safety_margin_;
  Clock clock_;
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Entry>> entries_;
};

} // namespace octo

#endif // OCTOCLIENT_TOKEN_CACHE_HPP
