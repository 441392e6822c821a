#include "github_client.hpp"
#include "scripted_http_client.hpp"
#include "test_keys.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace octo;
using octo::testing::make_response;
using octo::testing::ScriptedHttpClient;

namespace {

ClientConfig fast_retry_config(int attempts = 4) {
  ClientConfig config;
  config.set_token("ghp_test");
  RetryPolicy policy;
  policy.max_attempts = attempts;
  policy.base_delay = std::chrono::milliseconds(5);
  policy.max_delay = std::chrono::milliseconds(1000);
  policy.jitter = 0.25;
  config.set_retry(policy);
  config.set_workers(1);
  return config;
}

struct Harness {
  explicit Harness(const ClientConfig &config = fast_retry_config()) {
    auto http = std::make_unique<ScriptedHttpClient>();
    transport = http.get();
    client = std::make_unique<GitHubClient>(config, std::move(http));
  }
  ScriptedHttpClient *transport{nullptr};
  std::unique_ptr<GitHubClient> client;
};

} // namespace

TEST_CASE("server errors retry with growing delays") {
  Harness h;
  for (int i = 0; i < 4; ++i) {
    h.transport->push(make_response(502, R"({"message":"Bad Gateway"})"));
  }
  std::vector<std::chrono::milliseconds> delays;
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds delay, const Error &error) {
        CHECK(error.kind == ErrorKind::Server);
        delays.push_back(delay);
      });

  auto result = h.client->get("/repos/o/r");
  REQUIRE_FALSE(result);
  CHECK(h.transport->request_count() == 4);
  REQUIRE(delays.size() == 3);
  CHECK(delays[0] < delays[1]);
  CHECK(delays[1] < delays[2]);
  CHECK(delays[2] <= std::chrono::milliseconds(1000));
  CHECK(result.error().status == 502);
  CHECK(result.error().message == "Bad Gateway");
  CHECK(result.error().body == R"({"message":"Bad Gateway"})");
}

TEST_CASE("server error recovers on a later attempt") {
  Harness h;
  h.transport->push(make_response(500));
  h.transport->push(make_response(200, R"({"id":1})"));
  auto result = h.client->get("/repos/o/r");
  REQUIRE(result);
  CHECK(result.value()["id"] == 1);
  CHECK(h.transport->request_count() == 2);
}

TEST_CASE("client errors are returned without retry") {
  Harness h;
  h.transport->push(make_response(
      422, R"({"message":"Validation Failed","errors":[{"code":"missing"}],)"
           R"("documentation_url":"https://docs.github.com/rest"})"));
  auto result = h.client->get("/repos/o/r");
  REQUIRE_FALSE(result);
  CHECK(h.transport->request_count() == 1);
  const Error &error = result.error();
  CHECK(error.kind == ErrorKind::Client);
  CHECK(error.is_user_error());
  REQUIRE(error.github);
  CHECK(error.github->message == "Validation Failed");
  REQUIRE(error.github->errors);
  CHECK(error.github->errors->size() == 1);
  CHECK(error.github->documentation_url == "https://docs.github.com/rest");
}

TEST_CASE("post is not retried unless marked idempotent") {
  Harness h;
  h.transport->push(make_response(503));
  auto result = h.client->post("/repos/o/r/issues", nlohmann::json{{"t", 1}});
  REQUIRE_FALSE(result);
  CHECK(h.transport->request_count() == 1);

  Request request = h.client->build(Method::Post, "/repos/o/r/dispatches");
  request.idempotent = true;
  h.transport->push(make_response(503));
  h.transport->push(make_response(204));
  auto retried = h.client->send<Empty>(std::move(request));
  CHECK(retried);
  CHECK(h.transport->request_count() == 3);
}

TEST_CASE("transport failures are retried") {
  Harness h;
  h.transport->push_network_error();
  h.transport->push(make_response(200, "[]"));
  std::vector<ErrorKind> seen;
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds, const Error &error) {
        seen.push_back(error.kind);
      });
  auto result = h.client->get("/user/repos");
  REQUIRE(result);
  CHECK(result.value().is_array());
  REQUIRE(seen.size() == 1);
  CHECK(seen[0] == ErrorKind::Transport);
}

TEST_CASE("rate limited responses wait for the server") {
  Harness h;
  h.transport->push(make_response(
      403, R"({"message":"API rate limit exceeded"})",
      {"Retry-After: 0", "X-RateLimit-Limit: 60", "X-RateLimit-Remaining: 0"}));
  h.transport->push(make_response(200, "{}",
                                  {"X-RateLimit-Limit: 60",
                                   "X-RateLimit-Remaining: 59"}));
  std::chrono::milliseconds waited{-1};
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds delay, const Error &error) {
        CHECK(error.kind == ErrorKind::RateLimited);
        waited = delay;
      });
  auto result = h.client->get("/repos/o/r");
  REQUIRE(result);
  CHECK(waited == std::chrono::milliseconds(0));
  auto rate = h.client->last_rate_limit();
  REQUIRE(rate);
  CHECK(rate->remaining == 59);
  CHECK(rate->used == 1);
}

TEST_CASE("server waits are capped by the rate limit ceiling") {
  ClientConfig config = fast_retry_config(2);
  RetryPolicy policy = config.retry();
  policy.max_rate_limit_wait = std::chrono::milliseconds(20);
  config.set_retry(policy);
  Harness h(config);
  h.transport->push(
      make_response(429, "", {"Retry-After: 9223372036854775807"}));
  h.transport->push(make_response(200, "{}"));
  std::chrono::milliseconds waited{-1};
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds delay, const Error &) {
        waited = delay;
      });
  REQUIRE(h.client->get("/repos/o/r"));
  CHECK(waited == std::chrono::milliseconds(20));
}

TEST_CASE("exhausted limit without reset backs off and retries") {
  Harness h;
  h.transport->push(make_response(
      403, R"({"message":"API rate limit exceeded"})",
      {"X-RateLimit-Limit: 60", "X-RateLimit-Remaining: 0"}));
  h.transport->push(make_response(200, "{}"));
  std::chrono::milliseconds waited{-1};
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds delay, const Error &error) {
        CHECK(error.kind == ErrorKind::RateLimited);
        waited = delay;
      });
  REQUIRE(h.client->get("/repos/o/r"));
  CHECK(h.transport->request_count() == 2);
  CHECK(waited >= std::chrono::milliseconds(5));
  CHECK(waited <= std::chrono::milliseconds(1000));
}

TEST_CASE("forbidden without rate limit headers is a client error") {
  Harness h;
  h.transport->push(make_response(403, R"({"message":"Must have admin"})"));
  auto result = h.client->get("/repos/o/r/hooks");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == ErrorKind::Client);
  CHECK(h.transport->request_count() == 1);
}

TEST_CASE("no content decodes to an empty value") {
  Harness h;
  h.transport->push(make_response(204));
  auto result = h.client->del("/repos/o/r/issues/1/lock");
  CHECK(result.ok());
  REQUIRE(h.transport->requests().size() == 1);
  CHECK(h.transport->requests()[0].method == Method::Delete);
}

TEST_CASE("decode failures keep the raw body") {
  Harness h;
  h.transport->push(make_response(200, "<html>oops</html>"));
  auto result = h.client->get("/repos/o/r");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == ErrorKind::Decode);
  CHECK(result.error().status == 200);
  CHECK(result.error().body == "<html>oops</html>");
}

TEST_CASE("retries can be disabled") {
  ClientConfig config = fast_retry_config();
  RetryPolicy policy = config.retry();
  policy.enabled = false;
  config.set_retry(policy);
  Harness h(config);
  h.transport->push(make_response(500));
  auto result = h.client->get("/repos/o/r");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == ErrorKind::Server);
  CHECK(h.transport->request_count() == 1);
}

TEST_CASE("cancellation stops waiting for a retry") {
  ClientConfig config = fast_retry_config(5);
  RetryPolicy policy = config.retry();
  policy.base_delay = std::chrono::milliseconds(10000);
  policy.max_delay = std::chrono::milliseconds(60000);
  config.set_retry(policy);
  Harness h(config);
  h.transport->push(make_response(500));
  h.transport->push(make_response(200, "{}"));
  CancellationToken cancel;
  h.client->set_retry_observer(
      [&](int, std::chrono::milliseconds, const Error &) { cancel.cancel(); });

  auto start = std::chrono::steady_clock::now();
  auto result =
      h.client->send<nlohmann::json>(h.client->build(Method::Get, "/x"), cancel);
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE_FALSE(result);
  CHECK(result.error().status == 500);
  CHECK(h.transport->request_count() == 1);
  CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("installation tokens are exchanged once and reused") {
  ClientConfig config = fast_retry_config();
  config.set_token({});
  config.set_app_id("42");
  config.set_private_key(testing::test_private_key());
  config.set_installation_id(7);
  Harness h(config);

  int exchanges = 0;
  bool reject_next_user = false;
  h.transport->set_handler([&](const Request &request) {
    if (request.url ==
        "https://api.github.com/app/installations/7/access_tokens") {
      ++exchanges;
      CHECK(request.method == Method::Post);
      auto auth = request.header("Authorization");
      REQUIRE(auth);
      CHECK(std::count(auth->begin(), auth->end(), '.') == 2);
      return make_response(
          201, R"({"token":"ghs_)" + std::to_string(exchanges) +
                   R"(","expires_at":"2099-01-01T00:00:00Z"})");
    }
    if (reject_next_user) {
      reject_next_user = false;
      return make_response(401, R"({"message":"Bad credentials"})");
    }
    return make_response(200, "{}");
  });

  REQUIRE(h.client->get("/installation/repositories"));
  REQUIRE(h.client->get("/installation/repositories"));
  CHECK(exchanges == 1);
  auto requests = h.transport->requests();
  CHECK(requests.back().header("Authorization") == "Bearer ghs_1");

  reject_next_user = true;
  auto rejected = h.client->get("/installation/repositories");
  REQUIRE_FALSE(rejected);
  CHECK(rejected.error().status == 401);

  REQUIRE(h.client->get("/installation/repositories"));
  CHECK(exchanges == 2);
  CHECK(h.transport->requests().back().header("Authorization") ==
        "Bearer ghs_2");
}

TEST_CASE("failed installation exchange surfaces an auth error") {
  ClientConfig config = fast_retry_config();
  config.set_token({});
  config.set_app_id("42");
  config.set_private_key(testing::test_private_key());
  config.set_installation_id(9);
  Harness h(config);
  h.transport->push(make_response(401, R"({"message":"A JSON web token could not be decoded"})"));
  auto result = h.client->get("/installation/repositories");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == ErrorKind::Auth);
  CHECK(result.error().is_auth_error());
  CHECK(h.transport->request_count() == 1);
}

TEST_CASE("graphql requests go to the graphql endpoint") {
  ClientConfig config = fast_retry_config();
  config.set_api_base("https://ghe.example.com/api/v3");
  config.set_graphql_base("https://ghe.example.com/api");
  Harness h(config);
  h.transport->push(make_response(200, R"({"data":{"viewer":{"login":"me"}}})"));
  auto result = h.client->graphql(nlohmann::json{{"query", "{ viewer { login } }"}});
  REQUIRE(result);
  CHECK(result.value()["data"]["viewer"]["login"] == "me");
  auto request = h.transport->requests().at(0);
  CHECK(request.method == Method::Post);
  CHECK(request.url == "https://ghe.example.com/api/graphql");
  CHECK(request.header("Authorization") == "Bearer ghp_test");
}

TEST_CASE("redirects to other hosts drop authorization") {
  Harness h;
  h.transport->push(make_response(
      302, "", {"Location: https://objects.githubusercontent.com/blob?sig=1"}));
  h.transport->push(make_response(200, "archive-bytes"));
  auto data = h.client->follow_location_to_data("/repos/o/r/zipball/main");
  REQUIRE(data);
  CHECK(data.value() == "archive-bytes");
  auto requests = h.transport->requests();
  REQUIRE(requests.size() == 2);
  CHECK(requests[0].url == "https://api.github.com/repos/o/r/zipball/main");
  CHECK(requests[0].has_header("Authorization"));
  CHECK(requests[1].url == "https://objects.githubusercontent.com/blob?sig=1");
  CHECK_FALSE(requests[1].has_header("Authorization"));
}

TEST_CASE("redirect chains are bounded") {
  Harness h;
  h.transport->set_handler([](const Request &) {
    return make_response(301, "", {"Location: /loop"});
  });
  auto data = h.client->follow_location_to_data("/loop");
  REQUIRE_FALSE(data);
  CHECK(data.error().kind == ErrorKind::Client);
  CHECK(h.transport->request_count() == kMaxRedirects + 1);
}

TEST_CASE("relative locations resolve against the redirecting url") {
  Harness h;
  h.transport->push(make_response(302, "", {"Location: archive.zip?v=2"}));
  h.transport->push(make_response(302, "", {"Location: assets/abc"}));
  h.transport->push(make_response(302, "", {"Location: ?page=3"}));
  h.transport->push(make_response(200, "bytes"));
  auto data = h.client->follow_location_to_data("/repos/o/r/releases/1");
  REQUIRE(data);
  CHECK(data.value() == "bytes");
  auto requests = h.transport->requests();
  REQUIRE(requests.size() == 4);
  CHECK(requests[1].url == "https://api.github.com/repos/o/r/releases/archive.zip?v=2");
  CHECK(requests[2].url == "https://api.github.com/repos/o/r/releases/assets/abc");
  CHECK(requests[3].url == "https://api.github.com/repos/o/r/releases/assets/abc?page=3");
}

TEST_CASE("plain requests surface redirects as errors") {
  Harness h;
  h.transport->push(make_response(302, "", {"Location: /elsewhere"}));
  auto result = h.client->get("/repos/o/r/tarball");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == ErrorKind::Client);
  CHECK(result.error().status == 302);
}

TEST_CASE("rate limit endpoint is decoded") {
  Harness h;
  h.transport->push(make_response(
      200, R"({"resources":{"core":{"limit":5000,"remaining":4990,)"
           R"("used":10,"reset":1700000000}}})"));
  auto rate = h.client->rate_limit();
  REQUIRE(rate);
  CHECK(rate.value().limit == 5000);
  CHECK(rate.value().remaining == 4990);
  CHECK(rate.value().used == 10);
  CHECK(rate.value().reset == std::chrono::system_clock::time_point(
                                  std::chrono::seconds(1700000000)));
  CHECK(h.transport->requests().at(0).url == "https://api.github.com/rate_limit");
}

TEST_CASE("conditional requests serve cached bodies on 304") {
  ClientConfig config = fast_retry_config();
  config.set_cache_enabled(true);
  Harness h(config);
  h.transport->push(make_response(200, R"([{"id":1}])", {"ETag: \"v1\""}));
  h.transport->push(make_response(304));
  auto first = h.client->get("/repos/o/r/pulls");
  REQUIRE(first);
  auto second = h.client->get("/repos/o/r/pulls");
  REQUIRE(second);
  CHECK(second.value() == first.value());
  auto requests = h.transport->requests();
  REQUIRE(requests.size() == 2);
  CHECK_FALSE(requests[0].has_header("If-None-Match"));
  CHECK(requests[1].header("If-None-Match") == "\"v1\"");
}

TEST_CASE("asynchronous dispatch resolves on the worker pool") {
  Harness h;
  h.transport->push(make_response(200, R"({"login":"octocat"})"));
  auto future =
      h.client->send_async<nlohmann::json>(h.client->build(Method::Get, "/user"));
  auto result = future.get();
  REQUIRE(result);
  CHECK(result.value()["login"] == "octocat");
}
