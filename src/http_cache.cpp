#include "http_cache.hpp"
#include "log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> cache_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

} // namespace

std::optional<CachedResponse> cacheable_response(const HttpResponse &response) {
  CachedResponse entry;
  entry.etag = response.header("ETag").value_or("");
  entry.last_modified = response.header("Last-Modified").value_or("");
  if (entry.etag.empty() && entry.last_modified.empty()) {
    return std::nullopt;
  }
  entry.body = response.body;
  entry.headers = response.headers;
  return entry;
}

InMemoryResponseCache::InMemoryResponseCache(std::string cache_file)
    : cache_file_(std::move(cache_file)) {
  std::scoped_lock lock(mutex_);
  load_locked();
}

InMemoryResponseCache::~InMemoryResponseCache() {
  std::scoped_lock lock(mutex_);
  save_locked();
}

std::optional<CachedResponse>
InMemoryResponseCache::lookup(const std::string &url) {
  std::scoped_lock lock(mutex_);
  auto it = entries_.find(url);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryResponseCache::store(const std::string &url,
                                  CachedResponse entry) {
  std::scoped_lock lock(mutex_);
  entries_[url] = std::move(entry);
}

void InMemoryResponseCache::flush() {
  std::scoped_lock lock(mutex_);
  save_locked();
}

std::size_t InMemoryResponseCache::size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

/**
 * Load cached responses from disk. A missing or unreadable file starts an
 * empty cache; entries with fields of the wrong type are skipped.
 */
void InMemoryResponseCache::load_locked() {
  if (cache_file_.empty())
    return;
  std::ifstream in(cache_file_);
  if (!in)
    return;
  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    cache_log()->warn("Ignoring unreadable response cache {}", cache_file_);
    return;
  }
  for (auto &[url, item] : j.items()) {
    if (!item.is_object()) {
      cache_log()->warn("Skipping malformed cache entry for {}", url);
      continue;
    }
    CachedResponse c;
    try {
      c.etag = item.value("etag", "");
      c.last_modified = item.value("last_modified", "");
      c.body = item.value("body", "");
      c.headers = item.value("headers", std::vector<std::string>{});
    } catch (const nlohmann::json::exception &e) {
      cache_log()->warn("Skipping malformed cache entry for {}: {}", url,
                        e.what());
      continue;
    }
    entries_[url] = std::move(c);
  }
  cache_log()->debug("Loaded {} cached responses from {}", entries_.size(),
                     cache_file_);
}

/**
 * Serialize cached responses to disk.
 */
void InMemoryResponseCache::save_locked() const {
  if (cache_file_.empty())
    return;
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[url, c] : entries_) {
    j[url] = {{"etag", c.etag},
              {"last_modified", c.last_modified},
              {"body", c.body},
              {"headers", c.headers}};
  }
  std::ofstream out(cache_file_);
  if (!out) {
    cache_log()->warn("Failed to write response cache {}", cache_file_);
    return;
  }
  out << j.dump();
}

} // namespace octo
