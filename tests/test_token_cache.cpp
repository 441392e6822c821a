#include "errors.hpp"
#include "token_cache.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace octo;
using namespace std::chrono;

namespace {

system_clock::time_point at(long long epoch) {
  return system_clock::time_point(seconds(epoch));
}

} // namespace

TEST_CASE("fresh installation token is reused") {
  auto now = at(1000);
  TokenCache cache(seconds(60), [&] { return now; });
  int refreshes = 0;
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    return InstallationToken{"tok-" + std::to_string(refreshes), at(1000 + 3600)};
  };
  CHECK(cache.get(7, refresh) == "tok-1");
  now = at(1000 + 1800);
  CHECK(cache.get(7, refresh) == "tok-1");
  CHECK(refreshes == 1);
  CHECK(cache.size() == 1);
}

TEST_CASE("expired installation token is refreshed") {
  auto now = at(1000);
  TokenCache cache(seconds(60), [&] { return now; });
  int refreshes = 0;
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    return InstallationToken{"tok-" + std::to_string(refreshes), now + hours(1)};
  };
  CHECK(cache.get(7, refresh) == "tok-1");
  now = at(1000 + 3600 + 1);
  CHECK(cache.get(7, refresh) == "tok-2");
  CHECK(refreshes == 2);
}

TEST_CASE("token inside the safety margin counts as stale") {
  auto now = at(1000);
  TokenCache cache(seconds(60), [&] { return now; });
  int refreshes = 0;
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    return InstallationToken{"tok", at(2000)};
  };
  cache.get(1, refresh);
  now = at(2000 - 61);
  cache.get(1, refresh);
  CHECK(refreshes == 1);
  now = at(2000 - 60);
  cache.get(1, refresh);
  CHECK(refreshes == 2);
}

TEST_CASE("concurrent cold cache performs a single exchange") {
  TokenCache cache;
  std::atomic<int> refreshes{0};
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    std::this_thread::sleep_for(milliseconds(50));
    return InstallationToken{"shared", system_clock::now() + hours(1)};
  };
  std::vector<std::future<std::string>> results;
  for (int i = 0; i < 8; ++i) {
    results.push_back(std::async(std::launch::async,
                                 [&] { return cache.get(99, refresh); }));
  }
  for (auto &result : results) {
    CHECK(result.get() == "shared");
  }
  CHECK(refreshes.load() == 1);
}

TEST_CASE("failed refresh is not cached") {
  TokenCache cache;
  int calls = 0;
  auto failing = [&](std::uint64_t) -> InstallationToken {
    ++calls;
    throw AuthError("exchange rejected");
  };
  CHECK_THROWS_AS(cache.get(3, failing), AuthError);
  CHECK_FALSE(cache.peek(3).has_value());
  CHECK_THROWS_AS(cache.get(3, failing), AuthError);
  CHECK(calls == 2);
  auto working = [](std::uint64_t) {
    return InstallationToken{"ok", system_clock::now() + hours(1)};
  };
  CHECK(cache.get(3, working) == "ok");
}

TEST_CASE("installations refresh independently") {
  TokenCache cache;
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> entered;
  auto slow = [&](std::uint64_t) {
    entered.set_value();
    gate.wait();
    return InstallationToken{"slow", system_clock::now() + hours(1)};
  };
  auto blocked = std::async(std::launch::async, [&] { return cache.get(1, slow); });
  entered.get_future().wait();
  auto quick = [](std::uint64_t) {
    return InstallationToken{"quick", system_clock::now() + hours(1)};
  };
  CHECK(cache.get(2, quick) == "quick");
  release.set_value();
  CHECK(blocked.get() == "slow");
}

TEST_CASE("invalidate forces the next exchange") {
  TokenCache cache;
  int refreshes = 0;
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    return InstallationToken{"t", system_clock::now() + hours(1)};
  };
  cache.get(5, refresh);
  cache.invalidate(5);
  cache.invalidate(6);
  cache.get(5, refresh);
  CHECK(refreshes == 2);
}

TEST_CASE("stale rejection keeps a token refreshed by another caller") {
  TokenCache cache;
  int refreshes = 0;
  auto refresh = [&](std::uint64_t) {
    ++refreshes;
    return InstallationToken{"t" + std::to_string(refreshes),
                             system_clock::now() + hours(1)};
  };
  CHECK(cache.get(5, refresh) == "t1");
  CHECK(cache.invalidate_if(5, "t1"));
  CHECK(cache.get(5, refresh) == "t2");

  CHECK_FALSE(cache.invalidate_if(5, "t1"));
  CHECK(cache.get(5, refresh) == "t2");
  CHECK(refreshes == 2);
  CHECK_FALSE(cache.invalidate_if(9, "t2"));
}

TEST_CASE("installation token responses are decoded") {
  auto now = at(1000);
  auto token = parse_installation_token(
      R"({"token":"ghs_abc","expires_at":"2016-07-11T22:14:10Z"})", now);
  CHECK(token.token == "ghs_abc");
  CHECK(token.expires_at == at(1468275250));

  auto no_expiry = parse_installation_token(R"({"token":"ghs_x"})", now);
  CHECK(no_expiry.expires_at == now + hours(1));

  CHECK_THROWS_AS(parse_installation_token(R"({"message":"Bad"})", now),
                  AuthError);
  CHECK_THROWS_AS(parse_installation_token("not json", now), AuthError);
  CHECK_FALSE(parse_github_timestamp("yesterday").has_value());
}
