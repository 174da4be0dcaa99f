#pragma once

#include "config.h"
#include "hotset/system/logger.hpp"

#include <cstddef>
#include <string>

namespace hotset {
namespace cache {

template <typename Key, typename Value>
struct CacheEntry {
  Key key;
  Value value;
};

struct CacheConfig {
  size_t capacity = HOTSET_DEFAULT_CAPACITY;
  std::string delimiter = HOTSET_ORDER_DELIMITER;
  LogLevel log_level = LogLevel::INFO;
};

} // namespace cache
} // namespace hotset
