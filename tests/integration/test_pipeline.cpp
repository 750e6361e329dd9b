#include "vrcproxy/pipeline/RequestPipeline.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

using namespace vrcproxy::pipeline;
using namespace vrcproxy::protocol;
using namespace vrcproxy::upstream;
using namespace vrcproxy::network;
using namespace vrcproxy::common;
using json = nlohmann::ordered_json;

// Records every dispatch and answers with a canned result on the next loop turn.
class ScriptedDispatcher : public UpstreamDispatcher {
public:
    void Dispatch(EventLoop* loop, const UpstreamRequest& request, DoneCallback done) override {
        calls.push_back(request);
        UpstreamResult result = next;
        loop->QueueInLoop([result, done]() { done(result); });
    }

    std::vector<UpstreamRequest> calls;
    UpstreamResult next;
};

static UpstreamResult okJson(const std::string& body) {
    UpstreamResult r;
    r.outcome = UpstreamResult::kOk;
    r.status = 200;
    r.reason = "OK";
    r.headers.emplace_back("Content-Type", "application/json");
    r.headers.emplace_back("Cache-Control", "private");
    r.body = body;
    return r;
}

static HttpRequest makeRequest(const std::string& method, const std::string& path, const std::string& query = "") {
    HttpRequest req;
    req.setMethod(method);
    req.setVersion(HttpRequest::kHttp11);
    req.setPath(path);
    req.setQuery(query);
    req.setHeader("Host", "localhost:3000");
    req.setHeader("User-Agent", "vrcproxy-test/1.0");
    return req;
}

struct Fixture {
    Fixture()
        : dispatcher(std::make_shared<ScriptedDispatcher>()),
          pipeline(Notice::Default(), UpstreamConfig(), dispatcher) {}

    // Runs one request through the pipeline on a fresh loop and spins it until answered.
    HttpResponse run(const HttpRequest& req) {
        EventLoop loop;
        HttpResponse out;
        int answers = 0;
        pipeline.Handle(&loop, req, [&](HttpResponse resp) {
            assert(loop.IsInLoopThread());
            out = std::move(resp);
            ++answers;
            loop.Quit();
        });
        if (answers == 0) {
            // The answer was queued from outside an iteration; poke the poller.
            loop.WakeUp();
            loop.Loop();
        }
        assert(answers == 1);
        return out;
    }

    std::shared_ptr<ScriptedDispatcher> dispatcher;
    RequestPipeline pipeline;
};

void testRootNeverDispatches() {
    Fixture f;
    HttpResponse resp = f.run(makeRequest("GET", "/"));
    assert(resp.statusCode() == 200);
    assert(f.dispatcher->calls.empty());
    json body = json::parse(resp.body());
    assert(body["example"] == "http://localhost:3000/1/config");

    // The root answers whatever the method or credentials.
    HttpRequest post = makeRequest("POST", "/");
    post.setHeader("Authorization", "Bearer x");
    assert(f.run(post).statusCode() == 200);
    assert(f.dispatcher->calls.empty());
    LOG_INFO << "Root PASS";
}

void testRejectionsNeverDispatch() {
    Fixture f;
    HttpResponse resp = f.run(makeRequest("POST", "/1/config"));
    assert(resp.statusCode() == 405);
    json body = json::parse(resp.body());
    assert(body["error"]["_comment"] == "Only GET requests are allowed.");
    assert(body["error"]["status_code"] == 405);

    HttpRequest postman = makeRequest("GET", "/1/config");
    postman.setHeader("User-Agent", "PostmanRuntime/7.32.3");
    assert(f.run(postman).statusCode() == 400);

    HttpRequest cookie = makeRequest("GET", "/1/auth/user");
    cookie.setHeader("Cookie", "auth=authcookie_x");
    resp = f.run(cookie);
    assert(resp.statusCode() == 400);
    assert(json::parse(resp.body())["error"]["_comment"] == "Requests with credentials are not allowed.");

    assert(f.dispatcher->calls.empty());
    LOG_INFO << "Rejections PASS";
}

void testForwardedRequestShape() {
    Fixture f;
    f.dispatcher->next = okJson("{}");
    HttpRequest req = makeRequest("get", "/1/worlds", "?featured=true&n=2");
    req.setHeader("Referer", "https://example.com/");
    req.setHeader("Accept-Language", "en");
    assert(f.run(req).statusCode() == 200);

    assert(f.dispatcher->calls.size() == 1);
    const UpstreamRequest& sent = f.dispatcher->calls[0];
    assert(sent.method == "GET");
    assert(sent.target.url() == "https://api.vrchat.cloud/api/1/1/worlds?featured=true&n=2");
    assert(sent.headers.count("Referer") == 0);
    assert(sent.headers.at("accept-language") == "en");
    assert(sent.headers.at("User-Agent") == "vrcproxy-test/1.0");
    LOG_INFO << "Forwarded Shape PASS";
}

void testConfigDocumentMerged() {
    Fixture f;
    f.dispatcher->next = okJson(R"({"clientApiKey":"JlE5Jldo5Jibnk5O5hTx6XVqsJu4WJ26","_authors":"upstream"})");
    HttpResponse resp = f.run(makeRequest("GET", "/1/config"));
    assert(resp.statusCode() == 200);
    assert(resp.getHeader("Cache-Control") == "private");

    json body = json::parse(resp.body());
    std::vector<std::string> keys;
    for (auto it = body.begin(); it != body.end(); ++it) keys.push_back(it.key());
    assert((keys == std::vector<std::string>{"_readme", "_authors", "clientApiKey"}));
    assert(body["clientApiKey"] == "JlE5Jldo5Jibnk5O5hTx6XVqsJu4WJ26");
    assert(body["_authors"] == "ariesclark.com");

    // Same upstream answer, same bytes.
    HttpResponse again = f.run(makeRequest("GET", "/1/config"));
    assert(again.body() == resp.body());
    LOG_INFO << "Config Merge PASS";
}

void testUpstreamErrorsPassThroughMerged() {
    Fixture f;
    UpstreamResult r = okJson(R"({"error":{"message":"\"Missing Credentials\"","status_code":401}})");
    r.status = 401;
    r.reason = "Unauthorized";
    f.dispatcher->next = r;
    HttpResponse resp = f.run(makeRequest("GET", "/1/auth/user"));
    assert(resp.statusCode() == 401);
    json body = json::parse(resp.body());
    assert(body["error"]["status_code"] == 401);
    assert(body.contains("_readme"));
    LOG_INFO << "Upstream Error Passthrough PASS";
}

void testTimeoutAndFailureMapping() {
    Fixture f;
    UpstreamResult timeout;
    timeout.outcome = UpstreamResult::kTimeout;
    timeout.error = "deadline of 5000ms exceeded";
    f.dispatcher->next = timeout;
    HttpResponse resp = f.run(makeRequest("GET", "/1/visits"));
    assert(resp.statusCode() == 504);
    assert(json::parse(resp.body())["error"]["_comment"] == "The request timed out.");

    UpstreamResult failure;
    failure.outcome = UpstreamResult::kFailure;
    failure.error = "connect: Connection refused";
    f.dispatcher->next = failure;
    resp = f.run(makeRequest("GET", "/1/visits"));
    assert(resp.statusCode() == 500);
    assert(json::parse(resp.body())["error"]["message"] == "Internal Server Error");

    f.dispatcher->next = okJson("{\"cut\":");
    resp = f.run(makeRequest("GET", "/1/visits"));
    assert(resp.statusCode() == 500);
    assert(resp.getHeader("Content-Type") == "application/json");
    assert(f.dispatcher->calls.size() == 3);
    LOG_INFO << "Timeout/Failure Mapping PASS";
}

void testPublicOriginOverride() {
    auto dispatcher = std::make_shared<ScriptedDispatcher>();
    RequestPipeline pipeline(Notice::Default(), UpstreamConfig(), dispatcher, "https://vrchat.example.com/");
    HttpRequest req = makeRequest("GET", "/");
    assert(pipeline.OriginOf(req) == "https://vrchat.example.com");

    RequestPipeline hostBased(Notice::Default(), UpstreamConfig(), dispatcher);
    assert(hostBased.OriginOf(req) == "http://localhost:3000");
    req.removeHeader("Host");
    assert(hostBased.OriginOf(req) == "http://localhost");
    LOG_INFO << "Origin PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testRootNeverDispatches();
    testRejectionsNeverDispatch();
    testForwardedRequestShape();
    testConfigDocumentMerged();
    testUpstreamErrorsPassThroughMerged();
    testTimeoutAndFailureMapping();
    testPublicOriginOverride();
    return 0;
}
