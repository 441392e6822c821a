/**
 * @file response.hpp
 * @brief Decoding of successful responses into caller types.
 *
 * Specialize FromResponse<T> to decode types that are not nlohmann
 * deserializable, or that need headers as well as the body.
 */
#ifndef OCTOCLIENT_RESPONSE_HPP
#define OCTOCLIENT_RESPONSE_HPP

#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace octo {

/// Result type for endpoints that return no content.
struct Empty {};

/**
 * Decode the body of a 2xx response as @p T.
 *
 * The primary template parses the body as JSON and converts it with the
 * type's nlohmann `from_json`. Decoding failures are reported by throwing.
 */
template <typename T> struct FromResponse {
  static T decode(const HttpResponse &response) {
    return nlohmann::json::parse(response.body).template get<T>();
  }
};

template <> struct FromResponse<Empty> {
  static Empty decode(const HttpResponse &) { return {}; }
};

template <> struct FromResponse<std::string> {
  static std::string decode(const HttpResponse &response) {
    return response.body;
  }
};

template <> struct FromResponse<nlohmann::json> {
  static nlohmann::json decode(const HttpResponse &response) {
    if (response.body.empty()) {
      return nullptr;
    }
    return nlohmann::json::parse(response.body);
  }
};

template <> struct FromResponse<HttpResponse> {
  static HttpResponse decode(const HttpResponse &response) { return response; }
};

} // namespace octo

#endif // OCTOCLIENT_RESPONSE_HPP
