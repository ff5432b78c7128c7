#include "portico/http/Headers.h"

#include <algorithm>
#include <cctype>

namespace portico {
namespace http {

Headers::Headers(std::initializer_list<Entry> entries) {
    for (const auto& e : entries) {
        Append(e.first, e.second);
    }
}

std::string Headers::ToLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

void Headers::Append(const std::string& name, const std::string& value) {
    entries_.emplace_back(ToLower(name), value);
}

void Headers::Set(const std::string& name, const std::string& value) {
    Remove(name);
    Append(name, value);
}

void Headers::Remove(const std::string& name) {
    const std::string key = ToLower(name);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&key](const Entry& e) { return e.first == key; }),
                   entries_.end());
}

std::optional<std::string> Headers::Get(const std::string& name) const {
    const std::string key = ToLower(name);
    for (const auto& e : entries_) {
        if (e.first == key) return e.second;
    }
    return std::nullopt;
}

std::vector<std::string> Headers::GetAll(const std::string& name) const {
    const std::string key = ToLower(name);
    std::vector<std::string> values;
    for (const auto& e : entries_) {
        if (e.first == key) values.push_back(e.second);
    }
    return values;
}

bool Headers::Has(const std::string& name) const {
    return Get(name).has_value();
}

} // namespace http
} // namespace portico
