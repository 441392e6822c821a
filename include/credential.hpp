/**
 * @file credential.hpp
 * @brief Authentication strategies and derivation of `Authorization` headers.
 */
#ifndef OCTOCLIENT_CREDENTIAL_HPP
#define OCTOCLIENT_CREDENTIAL_HPP

#include "token_cache.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace octo {

/// Anonymous access.
struct NoAuth {};

/// Personal access token sent as `Bearer <token>`.
struct BearerToken {
  std::string token;
};

/// User name and password (or token) sent as HTTP basic auth.
struct BasicAuth {
  std::string user;
  std::string password;
};

/// Token issued to an OAuth app on behalf of a user.
struct OAuthAppToken {
  std::string token;
};

/// GitHub App authenticating as itself with a signed JWT.
struct GitHubApp {
  std::string app_id;
  std::string private_key; ///< PEM encoded RSA key
};

/// GitHub App acting as one of its installations.
struct Installation {
  GitHubApp app;
  std::uint64_t installation_id{0};
};

/// The closed set of supported credentials.
using Credential = std::variant<NoAuth, BearerToken, BasicAuth, OAuthAppToken,
                                GitHubApp, Installation>;

/// Short name of the credential kind, safe to log.
const char *credential_kind(const Credential &credential);

/// `Basic base64(user:password)`
std::string basic_auth_header(const std::string &user,
                              const std::string &password);

/**
 * Turns the configured credential into an `Authorization` header value.
 *
 * Installation tokens are obtained through @ref TokenExchange and kept in the
 * shared TokenCache. The exchange is injected so the authenticator never
 * talks to the network itself.
 */
class Authenticator {
public:
  /**
   * Obtain a fresh installation token.
   *
   * Receives the installation id and an app JWT to authenticate the
   * exchange. Must throw AuthError on failure.
   */
  using TokenExchange =
      std::function<InstallationToken(std::uint64_t, const std::string &)>;

  Authenticator(Credential credential, std::shared_ptr<TokenCache> cache,
                TokenExchange exchange, TokenCache::Clock clock = {});

  /**
   * Header value for a request to the API origin.
   *
   * @return `Bearer ...`/`Basic ...`, or no value for NoAuth.
   * @throws AuthError When a JWT cannot be signed or the installation token
   *         exchange fails.
   */
  std::optional<std::string> header() const;

  /// Drop the cached installation token so the next call re-exchanges.
  void invalidate() const;

  /**
   * Drop the cached installation token if it is the one carried by
   * @p rejected_header, the `Authorization` value the server refused.
   */
  void invalidate(const std::string &rejected_header) const;

  const Credential &credential() const { return credential_; }
  const std::shared_ptr<TokenCache> &token_cache() const { return cache_; }

private:
  std::string installation_token(const Installation &installation) const;

  Credential credential_;
  std::shared_ptr<TokenCache> cache_;
  TokenExchange exchange_;
  TokenCache::Clock clock_;
};

} // namespace octo

#endif // OCTOCLIENT_CREDENTIAL_HPP
