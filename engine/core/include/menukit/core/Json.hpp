#pragma once

#include <nlohmann/json.hpp>

namespace menukit::core {

using Json = nlohmann::json;

}  // namespace menukit::core
