#include "catch2/catch_test_macros.hpp"

#include "hotset/cache/cache_config.hpp"
#include "hotset/cache/lru_cache.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace hotset {
namespace cache {

namespace {

std::string WriteTempConfig(const std::string& name, const std::string& contents) {
  std::string path = "./" + name;
  std::ofstream out{path};
  out << contents;
  return path;
}

}

TEST_CASE("CacheConfig defaults", "[config]") {
  CacheConfig config;
  REQUIRE(config.capacity == HOTSET_DEFAULT_CAPACITY);
  REQUIRE(config.delimiter == HOTSET_ORDER_DELIMITER);
  REQUIRE(config.log_level == LogLevel::INFO);
}

TEST_CASE("ParseCacheConfig without a cache stanza", "[config]") {
  auto config = ParseCacheConfig(JSON::parse(R"({"other": {"capacity": 3}})"));
  REQUIRE(config.capacity == HOTSET_DEFAULT_CAPACITY);
  REQUIRE(config.delimiter == HOTSET_ORDER_DELIMITER);
}

TEST_CASE("ParseCacheConfig reads every setting", "[config]") {
  auto config = ParseCacheConfig(JSON::parse(R"({
    "cache": {"capacity": 32, "delimiter": " | ", "log_level": "warn"}
  })"));
  REQUIRE(config.capacity == 32);
  REQUIRE(config.delimiter == " | ");
  REQUIRE(config.log_level == LogLevel::WARN);

  LRUCache<std::string, int> cache(config);
  cache.Put("a", 1);
  cache.Put("b", 2);
  REQUIRE(cache.Limit() == 32);
  REQUIRE(cache.ToString(config.delimiter) == "a:1 | b:2");
}

TEST_CASE("ParseCacheConfig keeps defaults for missing keys", "[config]") {
  auto config = ParseCacheConfig(JSON::parse(R"({"cache": {"capacity": 2}})"));
  REQUIRE(config.capacity == 2);
  REQUIRE(config.delimiter == HOTSET_ORDER_DELIMITER);
  REQUIRE(config.log_level == LogLevel::INFO);
}

TEST_CASE("ParseCacheConfig with a custom stanza name", "[config]") {
  auto config = ParseCacheConfig(JSON::parse(R"({"sessions": {"capacity": 5}})"), "sessions");
  REQUIRE(config.capacity == 5);
}

TEST_CASE("ParseCacheConfig rejects bad values", "[config]") {
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"capacity": 0}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"capacity": -4}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"capacity": 2.5}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"capacity": "big"}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"delimiter": 3}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": {"log_level": "loud"}})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"({"cache": [1, 2]})")), std::runtime_error);
  REQUIRE_THROWS_AS(ParseCacheConfig(JSON::parse(R"([1, 2])")), std::runtime_error);
}

TEST_CASE("LoadCacheConfig reads a file", "[config]") {
  auto path = WriteTempConfig("hotset_config_test.json", R"({"cache": {"capacity": 9}})");
  auto config = LoadCacheConfig(path);
  REQUIRE(config.capacity == 9);
  std::remove(path.c_str());
}

TEST_CASE("LoadCacheConfig failures", "[config]") {
  REQUIRE_THROWS_AS(LoadCacheConfig("./no_such_hotset_config.json"), std::runtime_error);

  auto path = WriteTempConfig("hotset_config_broken.json", R"({"cache": )");
  REQUIRE_THROWS_AS(LoadCacheConfig(path), std::runtime_error);
  std::remove(path.c_str());
}

} // namespace cache
} // namespace hotset
