#include "portico/common/Env.h"

#include <cstdlib>

namespace portico {
namespace common {

std::optional<std::string> GetEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

} // namespace common
} // namespace portico
