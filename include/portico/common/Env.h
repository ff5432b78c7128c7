#pragma once

#include <optional>
#include <string>

namespace portico {
namespace common {

// Process environment lookup. Unset variables yield std::nullopt, set-but-empty yields "".
std::optional<std::string> GetEnv(const std::string& name);

} // namespace common
} // namespace portico
