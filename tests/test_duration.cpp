#include "errors.hpp"
#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace octo;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2d3h4m5s") ==
        seconds{2 * 86400 + 3 * 3600 + 4 * 60 + 5});
  CHECK(parse_duration("1s500ms") == milliseconds{1500});
  CHECK(parse_duration("") == milliseconds{0});
}

TEST_CASE("plain numbers are milliseconds") {
  CHECK(parse_duration("250") == milliseconds{250});
  CHECK(parse_duration("0") == milliseconds{0});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1h30"), ConfigError);
  CHECK_THROWS_AS(parse_duration("10m5"), ConfigError);
  CHECK_THROWS_AS(parse_duration("abc"), ConfigError);
  CHECK_THROWS_AS(parse_duration("1.5h"), ConfigError);
  CHECK_THROWS_AS(parse_duration("3w"), ConfigError);
}
