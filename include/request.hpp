/**
 * @file request.hpp
 * @brief Request description and the builder that assembles it.
 *
 * The builder resolves routes against the configured base URL, serializes
 * query parameters in caller order, and attaches the default GitHub headers.
 * Assembly is pure; nothing here touches the network.
 */
#ifndef OCTOCLIENT_REQUEST_HPP
#define OCTOCLIENT_REQUEST_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace octo {

/// HTTP verbs issued against the API.
enum class Method { Get, Head, Post, Put, Patch, Delete };

/// Upper-case verb name (e.g. "PATCH").
const char *to_string(Method method);

/// Whether repeating the verb has no additional side effect.
bool is_idempotent(Method method);

/// Ordered query parameters; order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Ordered header multimap.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Default `Accept` media type for the REST API.
inline constexpr const char *kDefaultAccept = "application/vnd.github+json";

/**
 * A single HTTP request. Built once and consumed by one dispatch.
 */
struct Request {
  Method method{Method::Get};
  std::string url;                 ///< Absolute URL
  HeaderList headers;              ///< Headers in send order
  std::optional<std::string> body; ///< Serialized body
  std::string content_type;        ///< Content type of @ref body
  bool idempotent{false};   ///< Caller vouches that a POST may be repeated
  bool follow_redirects{false}; ///< Return 3xx responses to the caller

  /// Case-insensitive lookup of the first header named @p name.
  std::optional<std::string> header(const std::string &name) const;

  /// Whether a header named @p name is present.
  bool has_header(const std::string &name) const;

  /// Replace every header named @p name with a single entry.
  void set_header(const std::string &name, const std::string &value);

  /// Append a header, keeping existing entries with the same name.
  void add_header(const std::string &name, const std::string &value);

  /// Remove every header named @p name.
  void remove_header(const std::string &name);
};

/**
 * Assembles requests relative to a base URL with the default headers.
 */
class RequestBuilder {
public:
  /**
   * @param base_url API base, e.g. `https://api.github.com` or an enterprise
   *        URL with a path prefix such as `https://ghe.example.com/api/v3`.
   * @param user_agent Value of the `User-Agent` header.
   * @param previews Preview names appended as extra `Accept` entries.
   * @param api_version Value for `X-GitHub-Api-Version`; empty omits it.
   */
  explicit RequestBuilder(std::string base_url = "https://api.github.com",
                          std::string user_agent = "octoclient",
                          std::vector<std::string> previews = {},
                          std::string api_version = {});

  /**
   * Build a request with an optional JSON body.
   *
   * @param method HTTP verb.
   * @param route Path relative to the base URL or an absolute URL.
   * @param query Query parameters, serialized in the given order.
   * @param body JSON body serialized as `application/json`.
   * @return Request ready for dispatch.
   */
  Request build(Method method, const std::string &route,
                const QueryParams &query = {},
                const std::optional<nlohmann::json> &body = std::nullopt) const;

  /// Build a request carrying raw bytes with an explicit content type.
  Request build_raw(Method method, const std::string &route,
                    const QueryParams &query, std::string body,
                    std::string content_type) const;

  /**
   * Resolve @p route against the base URL. Absolute URLs are returned
   * unchanged; relative paths keep the base path prefix and have unsafe
   * characters percent-encoded.
   */
  std::string absolute_url(const std::string &route) const;

  /// Normalized authority (`host[:port]`) of the base URL.
  std::string authority() const;

  /// Normalized origin (`scheme://host[:port]`) of the base URL.
  std::string origin() const;

  const std::string &base_url() const { return base_url_; }
  const std::string &user_agent() const { return user_agent_; }

private:
  Request assemble(Method method, const std::string &route,
                   const QueryParams &query) const;

  std::string base_url_;
  std::string user_agent_;
  std::vector<std::string> previews_;
  std::string api_version_;
};

/// Whether @p url starts with `http://` or `https://`.
bool is_absolute_url(const std::string &url);

/**
 * Extract the normalized authority of an absolute URL.
 *
 * The host is lower-cased, user info is dropped and the scheme's default port
 * is removed so `https://API.github.com:443/x` yields `api.github.com`.
 *
 * @return Authority or an empty string for relative URLs.
 */
std::string url_authority(const std::string &url);

/**
 * Lower-cased scheme joined to url_authority(), e.g. `https://api.github.com`.
 * Two URLs share an origin only when both scheme and authority match.
 *
 * @return Origin or an empty string for relative URLs.
 */
std::string url_origin(const std::string &url);

/// Percent-encode a query component.
std::string url_encode(const std::string &value);

/// Append query parameters to @p url in order.
std::string append_query(const std::string &url, const QueryParams &query);

/// `application/vnd.github.<name>-preview`
std::string format_preview(const std::string &name);

/**
 * `application/vnd.github.v3.<name>`, with a `+json` suffix for the `raw`,
 * `text`, `html` and `full` media types.
 */
std::string format_media_type(const std::string &name);

} // namespace octo

#endif // OCTOCLIENT_REQUEST_HPP
