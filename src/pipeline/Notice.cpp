#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/common/Config.h"

namespace vrcproxy {
namespace pipeline {

namespace {
const char kDefaultReadme[] = "https://github.com/ariesclark/vrchat-proxy";
const char kDefaultAuthors[] = "ariesclark.com";
const char kDefaultExamplePath[] = "/1/config";
}

std::string Notice::DefaultText(const std::string& readme, const std::string& authors) {
    return "This is a readonly proxy for the VRChat API. \n"
           "It is not affiliated with VRChat or VRChat Inc. Software written & distributed by " +
           authors + ". \nFor more information, visit " + readme + ".";
}

Notice Notice::Default() {
    Notice n;
    n.readme = kDefaultReadme;
    n.authors = kDefaultAuthors;
    n.text = DefaultText(n.readme, n.authors);
    n.examplePath = kDefaultExamplePath;
    return n;
}

Notice Notice::FromConfig(const vrcproxy::common::Config& conf) {
    Notice n;
    n.readme = conf.GetString("notice", "readme", kDefaultReadme);
    n.authors = conf.GetString("notice", "authors", kDefaultAuthors);
    n.text = conf.GetString("notice", "text", "");
    for (size_t pos = n.text.find("\\n"); pos != std::string::npos; pos = n.text.find("\\n", pos + 1)) {
        n.text.replace(pos, 2, "\n");
    }
    if (n.text.empty()) {
        n.text = DefaultText(n.readme, n.authors);
    }
    n.examplePath = conf.GetString("notice", "example_path", kDefaultExamplePath);
    if (n.examplePath.empty() || n.examplePath[0] != '/') {
        n.examplePath.insert(n.examplePath.begin(), '/');
    }
    return n;
}

nlohmann::ordered_json Notice::ToJson() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["_readme"] = text;
    j["_authors"] = authors;
    return j;
}

} // namespace pipeline
} // namespace vrcproxy
