#pragma once

#include <nlohmann/json.hpp>

namespace lansocial {
using json = nlohmann::json;
} // namespace lansocial
