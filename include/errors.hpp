/**
 * @file errors.hpp
 * @brief Error taxonomy and the Outcome result type used by the dispatcher.
 *
 * Declares the exceptions raised below the dispatch boundary, the decoded
 * GitHub error envelope, and the tagged Outcome<T> returned to callers.
 */
#ifndef OCTOCLIENT_ERRORS_HPP
#define OCTOCLIENT_ERRORS_HPP

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace octo {

struct HttpResponse;

/// Raised by transports on DNS, TCP, or TLS level failures.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised when a credential cannot produce authorization material.
class AuthError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised for invalid or inconsistent configuration values.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Classification of a failed call.
enum class ErrorKind {
  Auth,        ///< Credential could not be derived or was rejected.
  Transport,   ///< Connection level failure before a response arrived.
  RateLimited, ///< 403/429 carrying rate-limit headers.
  Server,      ///< 5xx response.
  Client,      ///< Any other non-2xx response.
  Decode       ///< Body did not match the expected shape.
};

/// Human readable name of an error kind.
const char *to_string(ErrorKind kind);

/**
 * Error envelope returned by GitHub for non-2xx responses.
 *
 * Mirrors `{ message, documentation_url?, errors? }` together with the HTTP
 * status of the response that carried it.
 */
struct GitHubError {
  std::string message;                              ///< `message` field
  std::optional<std::string> documentation_url;     ///< `documentation_url`
  std::optional<std::vector<nlohmann::json>> errors; ///< `errors[]` entries
  long status_code{0};                              ///< HTTP status

  /// Render the envelope the way it is shown to users.
  std::string to_string() const;
};

/**
 * Decode a GitHub error envelope from a response body.
 *
 * Bodies that are not a JSON object still yield an envelope whose message is
 * the raw body (or the status line when the body is empty).
 *
 * @param status_code HTTP status of the response.
 * @param body Raw response body.
 * @return Populated envelope.
 */
GitHubError parse_github_error(long status_code, const std::string &body);

/// Structured failure carried by a failed Outcome.
struct Error {
  ErrorKind kind{ErrorKind::Client};
  long status{0};        ///< HTTP status, 0 when no response was received.
  std::string message;   ///< Short description of the failure.
  std::optional<GitHubError> github; ///< Decoded envelope for HTTP failures.
  std::string body;      ///< Raw response body, kept for diagnosis.
  std::optional<std::chrono::milliseconds>
      retry_after; ///< Server provided wait before the next attempt.

  /// Whether the failure is worth another attempt (transport, 5xx, limits).
  bool is_retryable() const;

  /// Whether the caller's request or decode target is at fault.
  bool is_user_error() const;

  /// Whether the credential is at fault.
  bool is_auth_error() const { return kind == ErrorKind::Auth; }

  /// One line summary including kind and status.
  std::string describe() const;
};

/**
 * Classify a non-2xx response into an Error.
 *
 * 5xx maps to Server; 403/429 with `Retry-After` or an exhausted
 * `X-RateLimit-Remaining` maps to RateLimited with a retry hint; everything
 * else maps to Client. The envelope is decoded in every case.
 */
Error error_from_response(const HttpResponse &response);

/// Decode failure carrying the status and raw body of @p response.
Error decode_error(const HttpResponse &response, const std::string &what);

/// Connection level failure without a response.
Error transport_error(const std::string &what);

/// Credential derivation failure.
Error auth_error(const std::string &what);

/// Exception thrown when the value of a failed Outcome is requested.
class RequestError : public std::runtime_error {
public:
  explicit RequestError(Error error)
      : std::runtime_error(error.describe()), error_(std::move(error)) {}

  const Error &error() const noexcept { return error_; }

private:
  Error error_;
};

/**
 * Tagged result of a dispatched call: either a decoded value or an Error.
 */
template <typename T> class Outcome {
public:
  Outcome(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  Outcome(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return data_.index() == 0; }
  explicit operator bool() const { return ok(); }

  /// Access the value; throws RequestError when the call failed.
  T &value() & {
    if (!ok()) {
      throw RequestError(std::get<1>(data_));
    }
    return std::get<0>(data_);
  }

  const T &value() const & {
    if (!ok()) {
      throw RequestError(std::get<1>(data_));
    }
    return std::get<0>(data_);
  }

  T &&value() && {
    if (!ok()) {
      throw RequestError(std::get<1>(data_));
    }
    return std::move(std::get<0>(data_));
  }

  /// Access the failure; throws std::logic_error on a successful outcome.
  const Error &error() const {
    if (ok()) {
      throw std::logic_error("Outcome holds a value, not an error");
    }
    return std::get<1>(data_);
  }

  T value_or(T fallback) const {
    return ok() ? std::get<0>(data_) : std::move(fallback);
  }

private:
  std::variant<T, Error> data_;
};

} // namespace octo

#endif // OCTOCLIENT_ERRORS_HPP
