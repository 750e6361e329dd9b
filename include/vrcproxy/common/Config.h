#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "vrcproxy/common/noncopyable.h"

namespace vrcproxy {
namespace common {

// INI-style settings store: "[section]" headers and "key = value" lines.
// Keys outside any section land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    void Clear();

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static std::map<std::string, std::map<std::string, std::string>> Parse(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, std::map<std::string, std::string>> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace vrcproxy
