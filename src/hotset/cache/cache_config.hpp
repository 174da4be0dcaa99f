#pragma once

#include "types.hpp"

#include "hotset/system/json.hpp"

#include <string>
#include <string_view>

namespace hotset {
namespace cache {

/// @brief Build a CacheConfig from the named stanza of a parsed config document
/// @param config the whole config document, must be a json object
/// @param stanza_name the key of the object holding the cache settings
/// @return defaults for every setting the stanza leaves out, or all defaults if the stanza is absent
CacheConfig ParseCacheConfig(const JSON& config,
                             std::string_view stanza_name = HOTSET_DEFAULT_CONFIG_STANZA);

/// @brief Read and parse a json config file
CacheConfig LoadCacheConfig(const std::string& path,
                            std::string_view stanza_name = HOTSET_DEFAULT_CONFIG_STANZA);

} // namespace cache
} // namespace hotset
