#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace vrcproxy {
namespace common {
class Config;
}

namespace pipeline {

// Attribution attached to every JSON body the proxy emits. Built once at startup.
struct Notice {
    std::string readme;
    std::string authors;
    std::string text;
    std::string examplePath;

    static Notice Default();
    // Reads [notice]; an empty `text` is derived from readme and authors.
    static Notice FromConfig(const vrcproxy::common::Config& conf);

    // {"_readme": text, "_authors": authors}, in that order.
    nlohmann::ordered_json ToJson() const;

    static std::string DefaultText(const std::string& readme, const std::string& authors);
};

} // namespace pipeline
} // namespace vrcproxy
