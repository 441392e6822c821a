#include "errors.hpp"
#include "http_client.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace octo {

namespace {

std::optional<long> header_as_long(const HttpResponse &response,
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

// Longest wait representable in milliseconds, in whole seconds.
constexpr long kMaxWaitSeconds = static_cast<long>(
    std::numeric_limits<std::chrono::milliseconds::rep>::max() / 1000);

std::chrono::milliseconds wait_seconds(long seconds) {
  return std::chrono::seconds(std::clamp(seconds, 0L, kMaxWaitSeconds));
}

bool limit_exhausted(const HttpResponse &response) {
  auto remaining = header_as_long(response, "X-RateLimit-Remaining");
  return remaining && *remaining == 0;
}

/**
 * Wait requested by the server. `Retry-After` takes precedence over the
 * `X-RateLimit-Reset` epoch, which only counts once the limit is exhausted.
 */
std::optional<std::chrono::milliseconds>
rate_limit_wait(const HttpResponse &response) {
  if (auto retry_after = header_as_long(response, "Retry-After")) {
    return wait_seconds(*retry_after);
  }
  auto reset = header_as_long(response, "X-RateLimit-Reset");
  if (!reset || !limit_exhausted(response)) {
    return std::nullopt;
  }
  const long now = static_cast<long>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (*reset <= now) {
    return std::chrono::milliseconds(0);
  }
  return wait_seconds(*reset - now);
}

} // namespace

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Auth:
    return "auth";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::RateLimited:
    return "rate-limited";
  case ErrorKind::Server:
    return "server";
  case ErrorKind::Client:
    return "client";
  case ErrorKind::Decode:
    return "decode";
  }
  return "unknown";
}

std::string GitHubError::to_string() const {
  std::ostringstream oss;
  oss << message;
  if (documentation_url) {
    oss << "\nDocumentation URL: " << *documentation_url;
  }
  if (errors && !errors->empty()) {
    oss << "\nErrors:";
    for (const auto &error : *errors) {
      oss << "\n- " << error.dump();
    }
  }
  return oss.str();
}

GitHubError parse_github_error(long status_code, const std::string &body) {
  GitHubError error;
  error.status_code = status_code;
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    error.message = body.empty() ? "HTTP " + std::to_string(status_code) : body;
    return error;
  }
  if (j.contains("message") && j["message"].is_string()) {
    error.message = j["message"].get<std::string>();
  } else {
    error.message = "HTTP " + std::to_string(status_code);
  }
  if (j.contains("documentation_url") && j["documentation_url"].is_string()) {
    error.documentation_url = j["documentation_url"].get<std::string>();
  }
  if (j.contains("errors") && j["errors"].is_array()) {
    error.errors = j["errors"].get<std::vector<nlohmann::json>>();
  }
  return error;
}

bool Error::is_retryable() const {
  return kind == ErrorKind::Transport || kind == ErrorKind::Server ||
         kind == ErrorKind::RateLimited;
}

bool Error::is_user_error() const {
  return kind == ErrorKind::Client || kind == ErrorKind::Decode;
}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << octo::to_string(kind) << " error";
  if (status != 0) {
    oss << " (HTTP " << status << ")";
  }
  if (github) {
    oss << ": " << github->message;
  } else if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

Error error_from_response(const HttpResponse &response) {
  Error error;
  error.status = response.status_code;
  error.body = response.body;
  error.github = parse_github_error(response.status_code, response.body);
  error.message = error.github->message;
  if (response.status_code >= 500 && response.status_code < 600) {
    error.kind = ErrorKind::Server;
  } else if (response.status_code == 403 || response.status_code == 429) {
    error.retry_after = rate_limit_wait(response);
    const bool limited = response.header("Retry-After").has_value() ||
                         limit_exhausted(response);
    error.kind = limited ? ErrorKind::RateLimited : ErrorKind::Client;
  } else {
    error.kind = ErrorKind::Client;
  }
  return error;
}

Error decode_error(const HttpResponse &response, const std::string &what) {
  Error error;
  error.kind = ErrorKind::Decode;
  error.status = response.status_code;
  error.message = "Failed to decode response: " + what;
  error.body = response.body;
  return error;
}

Error transport_error(const std::string &what) {
  Error error;
  error.kind = ErrorKind::Transport;
  error.message = what;
  return error;
}

Error auth_error(const std::string &what) {
  Error error;
  error.kind = ErrorKind::Auth;
  error.message = what;
  return error;
}

} // namespace octo
