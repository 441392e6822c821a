/**
 * @file jwt.hpp
 * @brief GitHub App JSON Web Token minting and base64 helpers.
 */
#ifndef OCTOCLIENT_JWT_HPP
#define OCTOCLIENT_JWT_HPP

#include <chrono>
#include <string>

namespace octo {

/// Seconds subtracted from `iat` to tolerate clock drift.
inline constexpr std::chrono::seconds kJwtBackdate{60};

/// Validity window of an app JWT; GitHub rejects anything above 10 minutes.
inline constexpr std::chrono::seconds kJwtValidity{9 * 60};

/// Standard base64 with padding.
std::string base64_encode(const std::string &data);

/// URL-safe base64 without padding, as used by JWS.
std::string base64url_encode(const std::string &data);

/**
 * Create a JSON Web Token that authenticates as a GitHub App.
 *
 * The token carries `iat` (backdated by kJwtBackdate), `exp` (`now` plus
 * kJwtValidity) and `iss` set to the app id, and is signed with RS256.
 *
 * @param app_id GitHub App identifier used as the issuer.
 * @param private_key_pem PEM encoded RSA private key of the app.
 * @param now Time the token is minted at.
 * @return Compact serialized JWT.
 * @throws AuthError When the key cannot be parsed or signing fails.
 */
std::string create_app_jwt(const std::string &app_id,
                           const std::string &private_key_pem,
                           std::chrono::system_clock::time_point now =
                               std::chrono::system_clock::now());

} // namespace octo

#endif // OCTOCLIENT_JWT_HPP
