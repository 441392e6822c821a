#include "http_cache.hpp"
#include "scripted_http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <optional>

using namespace octo;
using octo::testing::make_response;

TEST_CASE("only validated responses are cacheable") {
  CHECK_FALSE(cacheable_response(make_response(200, "[]")));
  auto etag = cacheable_response(make_response(200, "[]", {"ETag: W/\"abc\""}));
  REQUIRE(etag);
  CHECK(etag->etag == "W/\"abc\"");
  CHECK(etag->body == "[]");
  auto modified = cacheable_response(make_response(
      200, "{}", {"Last-Modified: Tue, 07 Nov 2023 10:00:00 GMT"}));
  REQUIRE(modified);
  CHECK(modified->etag.empty());
  CHECK(modified->last_modified == "Tue, 07 Nov 2023 10:00:00 GMT");
}

TEST_CASE("in memory cache stores by url") {
  InMemoryResponseCache cache;
  CHECK_FALSE(cache.lookup("https://api.github.com/a"));
  cache.store("https://api.github.com/a", CachedResponse{"\"1\"", "", "one", {}});
  cache.store("https://api.github.com/a", CachedResponse{"\"2\"", "", "two", {}});
  auto hit = cache.lookup("https://api.github.com/a");
  REQUIRE(hit);
  CHECK(hit->etag == "\"2\"");
  CHECK(hit->body == "two");
  CHECK(cache.size() == 1);
}

TEST_CASE("cache entries persist to a file") {
  const char *path = "response_cache_test.json";
  std::remove(path);
  {
    InMemoryResponseCache cache(path);
    cache.store("https://api.github.com/user",
                CachedResponse{"\"e\"", "", R"({"login":"me"})",
                               {"ETag: \"e\""}});
    cache.flush();
  }
  InMemoryResponseCache reloaded(path);
  auto hit = reloaded.lookup("https://api.github.com/user");
  REQUIRE(hit);
  CHECK(hit->body == R"({"login":"me"})");
  REQUIRE(hit->headers.size() == 1);
  CHECK(hit->headers[0] == "ETag: \"e\"");
  std::remove(path);
}

TEST_CASE("unreadable cache files start empty") {
  const char *path = "response_cache_broken.json";
  {
    std::FILE *f = std::fopen(path, "w");
    REQUIRE(f != nullptr);
    std::fputs("not json", f);
    std::fclose(f);
  }
  {
    InMemoryResponseCache cache(path);
    CHECK(cache.size() == 0);
  }
  std::remove(path);
}

TEST_CASE("mistyped cache entries are skipped") {
  const char *path = "response_cache_mistyped.json";
  {
    std::FILE *f = std::fopen(path, "w");
    REQUIRE(f != nullptr);
    std::fputs(R"({"https://api.github.com/x":{"etag":5},)"
               R"("https://api.github.com/y":{"etag":"\"ok\"","body":"[]",)"
               R"("headers":"ETag"},)"
               R"("https://api.github.com/z":{"etag":"\"z\"","body":"{}"},)"
               R"("https://api.github.com/w":[1,2]})",
               f);
    std::fclose(f);
  }
  {
    std::optional<InMemoryResponseCache> cache;
    REQUIRE_NOTHROW(cache.emplace(path));
    CHECK(cache->size() == 1);
    CHECK_FALSE(cache->lookup("https://api.github.com/x"));
    CHECK_FALSE(cache->lookup("https://api.github.com/y"));
    auto hit = cache->lookup("https://api.github.com/z");
    REQUIRE(hit);
    CHECK(hit->body == "{}");
  }
  std::remove(path);
}
