#pragma once

#include <nlohmann/json.hpp>

namespace archmcp {

using Json = nlohmann::json;

}  // namespace archmcp
