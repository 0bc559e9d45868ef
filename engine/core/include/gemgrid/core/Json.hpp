#pragma once

#include <nlohmann/json.hpp>

namespace gemgrid::core {

using Json = nlohmann::json;

}  // namespace gemgrid::core
