#include "wsproxy/common/Config.h"
#include "wsproxy/common/Logger.h"
#include <fstream>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace wsproxy {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), isspace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

void Config::Parse(std::istream& in, SettingsMap* out) {
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) (*out)[section][key] = value;
        }
    }
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    SettingsMap parsed;
    Parse(file, &parsed);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;

    SettingsMap parsed;
    Parse(in, &parsed);

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::exception& e) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer (" << e.what()
                 << "), using " << defaultVal;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception& e) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not a number (" << e.what()
                 << "), using " << defaultVal;
        return defaultVal;
    }
}

} // namespace common
} // namespace wsproxy
