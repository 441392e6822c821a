#include "credential.hpp"
#include "errors.hpp"
#include "jwt.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>
#include <type_traits>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

template <class> inline constexpr bool always_false_v = false;

} // namespace

const char *credential_kind(const Credential &credential) {
  return std::visit(
      [](const auto &c) -> const char * {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, NoAuth>) {
          return "none";
        } else if constexpr (std::is_same_v<T, BearerToken>) {
          return "bearer";
        } else if constexpr (std::is_same_v<T, BasicAuth>) {
          return "basic";
        } else if constexpr (std::is_same_v<T, OAuthAppToken>) {
          return "oauth";
        } else if constexpr (std::is_same_v<T, GitHubApp>) {
          return "app";
        } else if constexpr (std::is_same_v<T, Installation>) {
          return "installation";
        } else {
          static_assert(always_false_v<T>, "unhandled credential");
        }
      },
      credential);
}

std::string basic_auth_header(const std::string &user,
                              const std::string &password) {
  return "Basic " + base64_encode(user + ":" + password);
}

Authenticator::Authenticator(Credential credential,
                             std::shared_ptr<TokenCache> cache,
                             TokenExchange exchange, TokenCache::Clock clock)
    : credential_(std::move(credential)), cache_(std::move(cache)),
      exchange_(std::move(exchange)), clock_(std::move(clock)) {
  if (!cache_) {
    cache_ = std::make_shared<TokenCache>();
  }
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
  auth_log()->debug("Authenticator configured with {} credential",
                    credential_kind(credential_));
}

std::optional<std::string> Authenticator::header() const {
  return std::visit(
      [this](const auto &c) -> std::optional<std::string> {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, NoAuth>) {
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, BearerToken> ||
                             std::is_same_v<T, OAuthAppToken>) {
          return "Bearer " + c.token;
        } else if constexpr (std::is_same_v<T, BasicAuth>) {
          return basic_auth_header(c.user, c.password);
        } else if constexpr (std::is_same_v<T, GitHubApp>) {
          return "Bearer " + create_app_jwt(c.app_id, c.private_key, clock_());
        } else if constexpr (std::is_same_v<T, Installation>) {
          return "Bearer " + installation_token(c);
        } else {
          static_assert(always_false_v<T>, "unhandled credential");
        }
      },
      credential_);
}

std::string
Authenticator::installation_token(const Installation &installation) const {
  if (!exchange_) {
    throw AuthError("No installation token exchange configured");
  }
  return cache_->get(installation.installation_id, [&](std::uint64_t id) {
    std::string jwt = create_app_jwt(installation.app.app_id,
                                     installation.app.private_key, clock_());
    auth_log()->debug("Exchanging app JWT for installation {} token", id);
    return exchange_(id, jwt);
  });
}

void Authenticator::invalidate() const {
  if (const auto *installation = std::get_if<Installation>(&credential_)) {
    cache_->invalidate(installation->installation_id);
  }
}

void Authenticator::invalidate(const std::string &rejected_header) const {
  const auto *installation = std::get_if<Installation>(&credential_);
  if (installation == nullptr) {
    return;
  }
  const std::string prefix = "Bearer ";
  if (rejected_header.rfind(prefix, 0) != 0) {
    return;
  }
  cache_->invalidate_if(installation->installation_id,
                        rejected_header.substr(prefix.size()));
}

} // namespace octo
