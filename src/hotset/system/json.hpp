#pragma once

#include <nlohmann/json.hpp>

namespace hotset {

using JSON = nlohmann::json;

} // namespace hotset
