#include "request.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <curl/curl.h>
#include <stdexcept>

namespace octo {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

bool is_path_char(unsigned char c) {
  if (std::isalnum(c)) {
    return true;
  }
  switch (c) {
  case '-':
  case '.':
  case '_':
  case '~':
  case '/':
  case ':':
  case '@':
  case '!':
  case '$':
  case '&':
  case '\'':
  case '(':
  case ')':
  case '*':
  case '+':
  case ',':
  case ';':
  case '=':
  case '%':
    return true;
  default:
    return false;
  }
}

/**
 * Percent-encode characters that may not appear in a URL path. Existing
 * escapes are left alone so pre-encoded routes are not double encoded.
 */
std::string encode_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (is_path_char(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string strip_trailing_slash(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

} // namespace

const char *to_string(Method method) {
  switch (method) {
  case Method::Get:
    return "GET";
  case Method::Head:
    return "HEAD";
  case Method::Post:
    return "POST";
  case Method::Put:
    return "PUT";
  case Method::Patch:
    return "PATCH";
  case Method::Delete:
    return "DELETE";
  }
  return "GET";
}

bool is_idempotent(Method method) { return method != Method::Post; }

std::optional<std::string> Request::header(const std::string &name) const {
  auto it = std::find_if(headers.begin(), headers.end(), [&](const auto &h) {
    return iequals(h.first, name);
  });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Request::has_header(const std::string &name) const {
  return header(name).has_value();
}

void Request::set_header(const std::string &name, const std::string &value) {
  remove_header(name);
  headers.emplace_back(name, value);
}

void Request::add_header(const std::string &name, const std::string &value) {
  headers.emplace_back(name, value);
}

void Request::remove_header(const std::string &name) {
  headers.erase(std::remove_if(headers.begin(), headers.end(),
                               [&](const auto &h) { return iequals(h.first, name); }),
                headers.end());
}

RequestBuilder::RequestBuilder(std::string base_url, std::string user_agent,
                               std::vector<std::string> previews,
                               std::string api_version)
    : base_url_(strip_trailing_slash(std::move(base_url))),
      user_agent_(std::move(user_agent)), previews_(std::move(previews)),
      api_version_(std::move(api_version)) {
  if (!is_absolute_url(base_url_)) {
    throw ConfigError("API base URL must be absolute: " + base_url_);
  }
}

std::string RequestBuilder::absolute_url(const std::string &route) const {
  if (is_absolute_url(route)) {
    return route;
  }
  std::string path = route;
  std::string query;
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    query = path.substr(qpos);
    path.erase(qpos);
  }
  if (path.empty() || path.front() != '/') {
    path.insert(path.begin(), '/');
  }
  return base_url_ + encode_path(path) + query;
}

std::string RequestBuilder::authority() const { return url_authority(base_url_); }

std::string RequestBuilder::origin() const { return url_origin(base_url_); }

Request RequestBuilder::assemble(Method method, const std::string &route,
                                 const QueryParams &query) const {
  Request req;
  req.method = method;
  req.url = append_query(absolute_url(route), query);
  req.headers.emplace_back("User-Agent", user_agent_);
  req.headers.emplace_back("Accept", kDefaultAccept);
  for (const auto &preview : previews_) {
    req.headers.emplace_back("Accept", format_preview(preview));
  }
  if (!api_version_.empty()) {
    req.headers.emplace_back("X-GitHub-Api-Version", api_version_);
  }
  return req;
}

Request RequestBuilder::build(Method method, const std::string &route,
                              const QueryParams &query,
                              const std::optional<nlohmann::json> &body) const {
  if (body) {
    return build_raw(method, route, query, body->dump(), "application/json");
  }
  Request req = assemble(method, route, query);
  if (method == Method::Post || method == Method::Put ||
      method == Method::Patch) {
    // GitHub rejects some bodiless writes without an explicit length.
    req.headers.emplace_back("Content-Length", "0");
  }
  return req;
}

Request RequestBuilder::build_raw(Method method, const std::string &route,
                                  const QueryParams &query, std::string body,
                                  std::string content_type) const {
  Request req = assemble(method, route, query);
  req.headers.emplace_back("Content-Type", content_type);
  req.headers.emplace_back("Content-Length", std::to_string(body.size()));
  req.content_type = std::move(content_type);
  req.body = std::move(body);
  return req;
}

bool is_absolute_url(const std::string &url) {
  std::string lower = to_lower_copy(url.substr(0, 8));
  return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

std::string url_authority(const std::string &url) {
  if (!is_absolute_url(url)) {
    return {};
  }
  auto scheme_end = url.find("://");
  std::string scheme = to_lower_copy(url.substr(0, scheme_end));
  auto start = scheme_end + 3;
  auto end = url.find_first_of("/?#", start);
  std::string authority =
      url.substr(start, end == std::string::npos ? std::string::npos : end - start);
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority.erase(0, at + 1);
  }
  authority = to_lower_copy(authority);
  const std::string default_port = scheme == "https" ? ":443" : ":80";
  if (authority.size() > default_port.size() &&
      authority.compare(authority.size() - default_port.size(),
                        default_port.size(), default_port) == 0) {
    authority.erase(authority.size() - default_port.size());
  }
  return authority;
}

std::string url_origin(const std::string &url) {
  if (!is_absolute_url(url)) {
    return {};
  }
  return to_lower_copy(url.substr(0, url.find("://"))) + "://" +
         url_authority(url);
}

std::string url_encode(const std::string &value) {
  if (value.empty()) {
    return value;
  }
  thread_local CurlHandle curl;
  char *escaped = curl_easy_escape(curl.get(), value.c_str(),
                                   static_cast<int>(value.size()));
  if (escaped == nullptr) {
    throw std::runtime_error("Failed to percent-encode query component");
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

std::string append_query(const std::string &url, const QueryParams &query) {
  if (query.empty()) {
    return url;
  }
  std::string out = url;
  char sep = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto &[key, value] : query) {
    out += sep;
    out += url_encode(key);
    out += '=';
    out += url_encode(value);
    sep = '&';
  }
  return out;
}

std::string format_preview(const std::string &name) {
  return "application/vnd.github." + name + "-preview";
}

std::string format_media_type(const std::string &name) {
  const bool json_suffix =
      name == "raw" || name == "text" || name == "html" || name == "full";
  return "application/vnd.github.v3." + name + (json_suffix ? "+json" : "");
}

} // namespace octo
