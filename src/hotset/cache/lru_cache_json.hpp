#pragma once

#include "lru_cache.hpp"

#include "hotset/system/json.hpp"

namespace hotset {
namespace cache {

/// @brief Snapshot a cache as a json array of {"key", "value"} objects, oldest first
///
/// Key and Value need nlohmann::json conversions (to_json or a built-in).
template <typename Key, typename Value, typename Hash, typename KeyEqual>
JSON ToJSON(const LRUCache<Key, Value, Hash, KeyEqual>& cache) {
  JSON snapshot = JSON::array();
  for (const auto& entry : cache.Entries()) {
    JSON item;
    item["key"] = entry.key;
    item["value"] = entry.value;
    snapshot.push_back(std::move(item));
  }
  return snapshot;
}

} // namespace cache
} // namespace hotset
