#pragma once

#include <string>
#include <map>
#include <mutex>
#include "wsproxy/common/noncopyable.h"

namespace wsproxy {
namespace common {

// INI style settings: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys before the first header belong to "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings.
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");

    // Get value as int
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);

    // Get value as double
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0);

private:
    using SettingsMap = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static void Parse(std::istream& in, SettingsMap* out);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    SettingsMap settings_;
};

} // namespace common
} // namespace wsproxy
