#pragma once

/**
 * File contains compile time defaults for the cache and the demo app
 */
#include <cstddef>


namespace hotset {

static constexpr size_t HOTSET_DEFAULT_CAPACITY = 128;

// separator used when rendering a cache oldest to newest
static constexpr const char* HOTSET_ORDER_DELIMITER = " < ";

// name of the json object holding cache settings in a config file
static constexpr const char* HOTSET_DEFAULT_CONFIG_STANZA = "cache";

} // namespace hotset
