#include "portico/adapter/RequestContext.h"
#include "portico/common/Env.h"

namespace portico {
namespace adapter {

std::optional<std::string> RequestContext::Env(const std::string& name) const {
    return common::GetEnv(name);
}

} // namespace adapter
} // namespace portico
