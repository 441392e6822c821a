/**
 * @file http_cache.hpp
 * @brief Conditional request cache keyed by URL.
 */
#ifndef OCTOCLIENT_HTTP_CACHE_HPP
#define OCTOCLIENT_HTTP_CACHE_HPP

#include "http_client.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace octo {

/// Validators and payload of a cached 2xx GET response.
struct CachedResponse {
  std::string etag;
  std::string last_modified;
  std::string body;
  std::vector<std::string> headers;
};

/**
 * Build a cache entry from a successful response.
 *
 * @return No value when the response carries neither `ETag` nor
 *         `Last-Modified`.
 */
std::optional<CachedResponse> cacheable_response(const HttpResponse &response);

/** Storage for conditional request validators. */
class ResponseCache {
public:
  virtual ~ResponseCache() = default;

  /// Entry stored for @p url, if any.
  virtual std::optional<CachedResponse> lookup(const std::string &url) = 0;

  /// Store or replace the entry for @p url.
  virtual void store(const std::string &url, CachedResponse entry) = 0;
};

/**
 * In-memory cache with optional JSON file persistence.
 *
 * When a file is given, entries are loaded on construction and written back
 * by flush() and on destruction.
 */
class InMemoryResponseCache : public ResponseCache {
public:
  explicit InMemoryResponseCache(std::string cache_file = {});
  ~InMemoryResponseCache() override;

  std::optional<CachedResponse> lookup(const std::string &url) override;
  void store(const std::string &url, CachedResponse entry) override;

  /// Persist entries to the cache file, if configured.
  void flush();

  std::size_t size() const;

private:
  void load_locked();
  void save_locked() const;

  std::string cache_file_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CachedResponse> entries_;
};

} // namespace octo

#endif // OCTOCLIENT_HTTP_CACHE_HPP
