#include "portico/common/Config.h"
#include "portico/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace portico {
namespace common {

namespace {

const char kDefaultSection[] = "global";

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

Config::Settings Config::Parse(std::istream& in, const std::string& source) {
    Settings parsed;
    std::string section = kDefaultSection;
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN << source << ":" << lineNo << " unterminated section header ignored";
                continue;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }
        const size_t eq = line.find('=');
        const std::string key = eq == std::string::npos ? std::string() : Trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN << source << ":" << lineNo << " expected key = value";
            continue;
        }
        parsed[section][key] = Trim(line.substr(eq + 1));
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR << "Cannot open config file " << filename;
        return false;
    }
    Settings parsed = Parse(file, filename);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    Settings parsed = Parse(in, "<string>");
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) {
        return std::nullopt;
    }
    return loadedFilename_;
}

std::optional<std::string> Config::Lookup(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) {
        return std::nullopt;
    }
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) {
        return std::nullopt;
    }
    return kit->second;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    return Lookup(section, key).has_value();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    return Lookup(section, key).value_or(defaultVal);
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    const auto value = Lookup(section, key);
    if (!value || value->empty()) {
        return defaultVal;
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(value->c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << *value << " is not an integer";
        return defaultVal;
    }
    return static_cast<int>(parsed);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    const auto value = Lookup(section, key);
    if (!value || value->empty()) {
        return defaultVal;
    }
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(value->c_str(), &end);
    if (*end != '\0' || errno == ERANGE) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << *value << " is not a number";
        return defaultVal;
    }
    return parsed;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    const auto value = Lookup(section, key);
    if (!value || value->empty()) {
        return defaultVal;
    }
    const std::string v = Lower(*value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    LOG_WARN << "Config [" << section << "] " << key << "=" << *value << " is not a boolean";
    return defaultVal;
}

} // namespace common
} // namespace portico
