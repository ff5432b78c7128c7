#pragma once

#include <string>

namespace portico {
namespace adapter {

// Formats a raw peer address. 4 bytes give a dotted quad; 16 bytes give eight colon
// separated hex groups without zero compression, or a dotted quad for IPv4-mapped
// addresses. Any other length gives an empty string.
std::string IpAddressBytesToString(const std::string& bytes);

} // namespace adapter
} // namespace portico
