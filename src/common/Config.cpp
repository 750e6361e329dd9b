#include "vrcproxy/common/Config.h"
#include "vrcproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vrcproxy {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::map<std::string, std::map<std::string, std::string>> Config::Parse(std::istream& in) {
    std::map<std::string, std::map<std::string, std::string>> parsed;
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
            if (!key.empty()) parsed[section][key] = value;
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    auto parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;

    auto parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
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
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;

    errno = 0;
    char* endp = nullptr;
    const long v = std::strtol(val.c_str(), &endp, 10);
    if (endp == val.c_str() || *endp != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        LOG_WARN << "Config [" << section << "] " << key << " = '" << val
                 << "' is not an integer, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<int>(v);
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    LOG_WARN << "Config [" << section << "] " << key << " = '" << val
             << "' is not a boolean, using " << (defaultVal ? "true" : "false");
    return defaultVal;
}

} // namespace common
} // namespace vrcproxy
