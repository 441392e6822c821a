#include "page.hpp"
#include "log.hpp"
#include "request.hpp"

#include <array>
#include <spdlog/spdlog.h>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> pagination_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pagination");
  }();
  return logger;
}

std::string trim(const std::string &value) {
  auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

/// Extract `name` from `rel="name"` (quotes optional).
std::optional<std::string> rel_of(const std::string &params) {
  auto pos = params.find("rel=");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  std::string rel = trim(params.substr(pos + 4));
  auto end = rel.find(';');
  if (end != std::string::npos) {
    rel = trim(rel.substr(0, end));
  }
  if (rel.size() >= 2 && rel.front() == '"' && rel.back() == '"') {
    rel = rel.substr(1, rel.size() - 2);
  }
  if (rel.empty()) {
    return std::nullopt;
  }
  return rel;
}

} // namespace

Links parse_link_header(const std::string &value) {
  Links links;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    std::string part = trim(value.substr(
        start, comma == std::string::npos ? std::string::npos : comma - start));
    start = comma == std::string::npos ? value.size() + 1 : comma + 1;
    if (part.empty()) {
      continue;
    }
    auto lt = part.find('<');
    auto gt = part.find('>');
    if (lt != 0 || gt == std::string::npos) {
      pagination_log()->debug("Skipping malformed Link entry '{}'", part);
      continue;
    }
    std::string url = part.substr(1, gt - 1);
    if (url.empty() || !is_absolute_url(url)) {
      pagination_log()->debug("Skipping Link entry with bad URL '{}'", part);
      continue;
    }
    auto rel = rel_of(part.substr(gt + 1));
    if (!rel) {
      pagination_log()->debug("Skipping Link entry without rel '{}'", part);
      continue;
    }
    if (*rel == "next") {
      links.next = url;
    } else if (*rel == "prev") {
      links.prev = url;
    } else if (*rel == "first") {
      links.first = url;
    } else if (*rel == "last") {
      links.last = url;
    } else {
      pagination_log()->debug("Ignoring Link relation '{}'", *rel);
    }
  }
  return links;
}

std::optional<std::string> query_param(const std::string &url,
                                       const std::string &name) {
  auto q = url.find('?');
  if (q == std::string::npos) {
    return std::nullopt;
  }
  auto end = url.find('#', q);
  std::string query =
      url.substr(q + 1, end == std::string::npos ? std::string::npos : end - q - 1);
  std::size_t start = 0;
  while (start <= query.size()) {
    auto amp = query.find('&', start);
    std::string pair = query.substr(
        start, amp == std::string::npos ? std::string::npos : amp - start);
    auto eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      return eq == std::string::npos ? std::string{} : pair.substr(eq + 1);
    }
    if (amp == std::string::npos) {
      break;
    }
    start = amp + 1;
  }
  return std::nullopt;
}

const nlohmann::json *page_items(const nlohmann::json &body) {
  if (body.is_array()) {
    return &body;
  }
  if (!body.is_object()) {
    return nullptr;
  }
  static const std::array<const char *, 8> keys = {
      "items",        "workflows",    "workflow_runs", "jobs",
      "artifacts",    "repositories", "installations", "runners"};
  for (const char *key : keys) {
    auto it = body.find(key);
    if (it != body.end() && it->is_array()) {
      return &*it;
    }
  }
  return nullptr;
}

} // namespace octo
