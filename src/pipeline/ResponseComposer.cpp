#include "vrcproxy/pipeline/ResponseComposer.h"

namespace vrcproxy {
namespace pipeline {

using vrcproxy::protocol::HttpResponse;
using json = nlohmann::ordered_json;

bool ResponseComposer::IsJsonContentType(const std::string& contentType) {
    return contentType.compare(0, 16, "application/json") == 0;
}

HttpResponse ResponseComposer::ComposeRoot(const std::string& origin) const {
    json body = notice_.ToJson();
    body["example"] = origin + notice_.examplePath;

    HttpResponse response;
    response.setStatusCode(HttpResponse::k200Ok);
    response.setStatusMessage("OK");
    response.setContentType("application/json");
    response.setBody(body.dump());
    return response;
}

json ResponseComposer::MergeWithNotice(const json& upstream) const {
    json merged = notice_.ToJson();
    if (upstream.is_object()) {
        for (auto it = upstream.begin(); it != upstream.end(); ++it) {
            if (!merged.contains(it.key())) {
                merged[it.key()] = it.value();
            }
        }
    } else if (upstream.is_array()) {
        for (size_t i = 0; i < upstream.size(); ++i) {
            const std::string key = std::to_string(i);
            if (!merged.contains(key)) {
                merged[key] = upstream[i];
            }
        }
    } else if (upstream.is_string()) {
        // One key per character; UTF-8 continuation bytes stay with their lead byte.
        const std::string& text = upstream.get_ref<const std::string&>();
        size_t index = 0;
        for (size_t pos = 0; pos < text.size();) {
            size_t end = pos + 1;
            while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
                ++end;
            }
            const std::string key = std::to_string(index++);
            if (!merged.contains(key)) {
                merged[key] = text.substr(pos, end - pos);
            }
            pos = end;
        }
    }
    return merged;
}

bool ResponseComposer::ComposeProxied(const vrcproxy::upstream::UpstreamResult& upstream,
                                      HttpResponse* out) const {
    const std::string* declared = vrcproxy::protocol::FindHeader(upstream.headers, "Content-Type");
    const std::string contentType = (declared && !declared->empty()) ? *declared : std::string("text/plain");

    HttpResponse response;
    response.setStatusCode(upstream.status);
    response.setStatusMessage(upstream.reason);
    for (const auto& h : upstream.headers) {
        response.addHeader(h.first, h.second);
    }
    response.setContentType(contentType);

    const bool bodyless = upstream.status == 204 || upstream.status == 304;
    if (IsJsonContentType(contentType) && !bodyless) {
        json parsed = json::parse(upstream.body, nullptr, false);
        if (parsed.is_discarded()) {
            return false;
        }
        response.setBody(MergeWithNotice(parsed).dump(2, ' ', false, json::error_handler_t::replace));
    } else {
        response.setBody(upstream.body);
    }
    *out = std::move(response);
    return true;
}

} // namespace pipeline
} // namespace vrcproxy
