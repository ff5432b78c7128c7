#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace portico {
namespace http {

// Header multimap. Names are stored lowercase; values repeat in insertion order.
class Headers {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<Entry> entries);

    // Adds a value, keeping existing ones.
    void Append(const std::string& name, const std::string& value);
    // Replaces all values of name.
    void Set(const std::string& name, const std::string& value);
    void Remove(const std::string& name);

    std::optional<std::string> Get(const std::string& name) const;
    std::vector<std::string> GetAll(const std::string& name) const;
    bool Has(const std::string& name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    static std::string ToLower(const std::string& s);

private:
    std::vector<Entry> entries_;
};

} // namespace http
} // namespace portico
