#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vrcproxy {
namespace protocol {

inline std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

inline bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// True when the comma separated header value lists `token` (case-insensitive).
inline bool HeaderHasToken(const std::string& value, const std::string& token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        size_t b = pos;
        size_t e = comma;
        while (b < e && std::isspace(static_cast<unsigned char>(value[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
        if (IEquals(value.substr(b, e - b), token)) return true;
        pos = comma + 1;
    }
    return false;
}

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

// Inbound header mapping. Field names compare case-insensitively; assigning an
// existing name overwrites its value.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Upstream response headers keep wire order and duplicates (Set-Cookie).
using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline const std::string* FindHeader(const HeaderList& headers, const std::string& field) {
    for (const auto& h : headers) {
        if (IEquals(h.first, field)) return &h.second;
    }
    return nullptr;
}

} // namespace protocol
} // namespace vrcproxy
