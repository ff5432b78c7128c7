#pragma once

#include "portico/common/noncopyable.h"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace portico {
namespace common {

// Process-wide INI settings. Read once at startup; request paths only see values copied out of it.
//
//   ; comment          # comment
//   key = value        (before any [section] this lands in [global])
//   [section]
//   key = value
//
// Typed getters fall back to their default when the key is missing or does not parse.
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Replaces the settings; the loaded filename is left as it was.
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    void Clear();

    std::optional<std::string> LoadedFilename() const;
    bool Has(const std::string& section, const std::string& key) const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off in any case.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    using Section = std::map<std::string, std::string>;
    using Settings = std::map<std::string, Section>;

    Config() = default;

    static Settings Parse(std::istream& in, const std::string& source);
    std::optional<std::string> Lookup(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace portico
