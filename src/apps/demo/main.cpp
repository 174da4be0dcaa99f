#include "hotset/cache/cache_config.hpp"
#include "hotset/cache/lru_cache.hpp"
#include "hotset/cache/lru_cache_json.hpp"
#include "hotset/system/logger.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <exception>
#include <string>
#include <vector>

using namespace hotset;
using namespace hotset::cache;

namespace {

using AgeCache = LRUCache<std::string, int>;

bool ExpectOrder(const AgeCache& cache, const CacheConfig& config,
                 const std::vector<std::string>& pairs) {
  auto expected = fmt::format("{}", fmt::join(pairs, config.delimiter));
  auto actual = cache.ToString(config.delimiter);
  if (actual != expected) {
    LOG_ERRORF("expected \"{}\" but cache holds \"{}\"", expected, actual);
    return false;
  }
  LOG_INFOF("cache: {}", actual);
  return true;
}

bool ExpectValue(AgeCache& cache, const std::string& key, int expected) {
  const int* value = cache.Get(key);
  if (value == nullptr || *value != expected) {
    LOG_ERRORF("get({}) did not return {}", key, expected);
    return false;
  }
  return true;
}

bool RunAgesScenario(const CacheConfig& config) {
  LOG_INFO("=== ages scenario, limit 4 ===");
  AgeCache cache(4, [](const std::string& key, int& value) {
    LOG_INFOF("evicted {}:{}", key, value);
  });

  cache.Put("adam", 29);
  cache.Put("john", 26);
  cache.Put("angela", 24);
  cache.Put("bob", 48);
  bool ok = ExpectOrder(cache, config, {"adam:29", "john:26", "angela:24", "bob:48"});

  // touching every key in insertion order leaves the order as it was
  ok &= ExpectValue(cache, "adam", 29);
  ok &= ExpectValue(cache, "john", 26);
  ok &= ExpectValue(cache, "angela", 24);
  ok &= ExpectValue(cache, "bob", 48);
  ok &= ExpectOrder(cache, config, {"adam:29", "john:26", "angela:24", "bob:48"});

  ok &= ExpectValue(cache, "angela", 24);
  ok &= ExpectOrder(cache, config, {"adam:29", "john:26", "bob:48", "angela:24"});

  auto evicted = cache.Put("ygwie", 81);
  if (!evicted || evicted->key != "adam") {
    LOG_ERROR("put(ygwie) should have evicted adam");
    ok = false;
  }
  ok &= ExpectOrder(cache, config, {"john:26", "bob:48", "angela:24", "ygwie:81"});
  if (cache.Get("adam") != nullptr) {
    LOG_ERROR("adam is still cached after eviction");
    ok = false;
  }

  // updating an existing key replaces its value in place
  cache.Put("john", 11);
  ok &= ExpectOrder(cache, config, {"bob:48", "angela:24", "ygwie:81", "john:11"});
  ok &= ExpectValue(cache, "john", 11);

  LOG_INFOF("snapshot: {}", ToJSON(cache).dump());
  return ok;
}

bool RunSingleSlotScenario(const CacheConfig& config) {
  LOG_INFO("=== single slot scenario, limit 1 ===");
  LRUCache<std::string, int> cache(1);
  cache.Put("x", 1);
  auto evicted = cache.Put("y", 2);

  bool ok = evicted && evicted->key == "x" && evicted->value == 1;
  ok &= cache.Size() == 1 && cache.Get("x") == nullptr;
  ok &= ExpectOrder(cache, config, {"y:2"});
  if (!ok) {
    LOG_ERROR("single slot cache did not hold exactly y:2");
  }
  return ok;
}

bool RunFillScenario(const CacheConfig& config) {
  LOG_INFOF("=== fill scenario, limit {} ===", config.capacity);
  size_t evictions = 0;
  LRUCache<size_t, size_t> cache(config, [&evictions](const size_t&, size_t&) {
    evictions++;
  });

  size_t puts = config.capacity * 2;
  for (size_t i = 0; i < puts; ++i) {
    cache.Put(i, i * i);
  }

  const auto* oldest = cache.Oldest();
  bool ok = cache.Size() == config.capacity && evictions == puts - config.capacity;
  ok &= oldest != nullptr && oldest->key == puts - config.capacity;
  LOG_INFOF("{} puts, {} evictions, size {}", puts, evictions, cache.Size());
  if (!ok) {
    LOG_ERROR("fill scenario did not evict in insertion order");
  }
  return ok;
}

} // namespace

int main(int argc, char* argv[]) {
  try {
    CacheConfig config;
    if (argc > 1) {
      config = LoadCacheConfig(argv[1]);
    }
    Logger::getInstance().setLogLevel(config.log_level);

    bool ok = RunAgesScenario(config);
    ok &= RunSingleSlotScenario(config);
    ok &= RunFillScenario(config);

    if (!ok) {
      LOG_ERROR("demo finished with mismatches");
      return 1;
    }
    LOG_INFO("demo finished");
  } catch (const std::exception& e) {
    LOG_ERRORF("demo failed: {}", e.what());
    return 1;
  }
  return 0;
}
