#pragma once

#include <cctype>
#include <string>

namespace portico {
namespace protocol {

inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string TrimSpace(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Whether a comma separated header value lists token (case-insensitive).
inline bool HasToken(const std::string& value, const std::string& token) {
    size_t begin = 0;
    for (;;) {
        const size_t comma = value.find(',', begin);
        const size_t end = comma == std::string::npos ? value.size() : comma;
        if (EqualsIgnoreCase(TrimSpace(value.substr(begin, end - begin)), token)) {
            return true;
        }
        if (comma == std::string::npos) {
            return false;
        }
        begin = comma + 1;
    }
}

} // namespace protocol
} // namespace portico
