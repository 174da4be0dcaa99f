#include "cache_config.hpp"

#include "hotset/system/logger.hpp"

#include <fstream>
#include <stdexcept>

namespace hotset {
namespace cache {

CacheConfig ParseCacheConfig(const JSON& config, std::string_view stanza_name) {
  if (!config.is_object()) {
    throw std::runtime_error("Error parsing cache config: document is not a json object");
  }

  CacheConfig cache_config;
  const std::string name{stanza_name};
  if (!config.count(name)) {
    LOG_DEBUGF("No '{}' stanza in config, using defaults", name);
    return cache_config;
  }

  const auto& stanza = config.at(name);
  try {
    if (!stanza.is_object()) {
      throw std::invalid_argument("'" + name + "' must be a json object");
    }
    if (stanza.count("capacity")) {
      const auto& capacity = stanza["capacity"];
      if (!capacity.is_number_integer()) {
        throw std::invalid_argument("capacity must be an integer");
      }
      if (capacity.get<int64_t>() < 1) {
        throw std::invalid_argument("capacity must be at least 1");
      }
      cache_config.capacity = capacity.get<size_t>();
    }
    if (stanza.count("delimiter")) {
      cache_config.delimiter = stanza["delimiter"].get<std::string>();
    }
    if (stanza.count("log_level")) {
      cache_config.log_level = ParseLogLevel(stanza["log_level"].get<std::string>());
    }
  } catch (const std::exception& e) {
    throw std::runtime_error("Error parsing cache config: " + std::string(e.what()));
  }
  return cache_config;
}

CacheConfig LoadCacheConfig(const std::string& path, std::string_view stanza_name) {
  std::ifstream config_fstream{path};
  if (!config_fstream.is_open()) {
    LOG_ERRORF("Failed to open config file: {}", path);
    throw std::runtime_error("Failed to open config file: " + path);
  }

  JSON config;
  try {
    config_fstream >> config;
  } catch (const JSON::parse_error& e) {
    throw std::runtime_error("Error parsing cache config: " + std::string(e.what()));
  }

  auto cache_config = ParseCacheConfig(config, stanza_name);
  LOG_INFOF("Loaded cache config from {}: capacity={}", path, cache_config.capacity);
  return cache_config;
}

} // namespace cache
} // namespace hotset
