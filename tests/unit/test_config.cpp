#include "vrcproxy/common/Config.h"
#include "vrcproxy/common/Logger.h"
#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/upstream/UpstreamConfig.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

using namespace vrcproxy::common;
using namespace vrcproxy::pipeline;
using namespace vrcproxy::upstream;

void testIniParsing() {
    Config& conf = Config::Instance();
    conf.Clear();
    assert(conf.LoadFromString(
        "; comment\n"
        "log_level = debug\n"
        "[upstream]\n"
        "  host =  example.test  \n"
        "# another comment\n"
        "timeout_ms = 250\n"
        "verify_peer = off\n"
        "port = eighty\n"));
    assert(conf.GetString("global", "log_level") == "debug");
    assert(conf.GetString("upstream", "host") == "example.test");
    assert(conf.GetInt("upstream", "timeout_ms", 1) == 250);
    assert(conf.GetInt("upstream", "port", 7) == 7);
    assert(!conf.GetBool("upstream", "verify_peer", true));
    assert(conf.GetString("upstream", "missing", "dflt") == "dflt");
    assert(Logger::ParseLevel("debug") == LogLevel::DEBUG);
    assert(Logger::ParseLevel("nonsense") == LogLevel::INFO);
    LOG_INFO << "INI Parsing PASS";
}

void testLoadFile() {
    Config& conf = Config::Instance();
    conf.Clear();
    assert(!conf.Load("/nonexistent/vrcproxy.conf"));

    const std::string path = "/tmp/vrcproxy_test_config.conf";
    {
        std::ofstream out(path);
        out << "[global]\nlisten_port = 3100\n";
    }
    assert(conf.Load(path));
    assert(conf.LoadedFilename() && *conf.LoadedFilename() == path);
    assert(conf.GetInt("global", "listen_port", 0) == 3100);
    std::remove(path.c_str());
    LOG_INFO << "Load File PASS";
}

void testUpstreamDefaults() {
    Config& conf = Config::Instance();
    conf.Clear();
    UpstreamConfig c;
    std::string error;
    assert(UpstreamConfig::FromConfig(conf, &c, &error));
    assert(c.scheme == "https");
    assert(c.host == "api.vrchat.cloud");
    assert(c.port == 443);
    assert(c.apiPrefix == "/api/1");
    assert(c.timeoutMs == 5000);
    assert(c.dnsCacheSeconds == 60);
    assert(c.verifyPeer);
    assert(c.useTls());
    LOG_INFO << "Upstream Defaults PASS";
}

void testUpstreamOverridesAndValidation() {
    Config& conf = Config::Instance();
    conf.Clear();
    conf.SetString("upstream", "scheme", "http");
    conf.SetString("upstream", "host", "127.0.0.1");
    conf.SetString("upstream", "api_prefix", "api/2/");
    UpstreamConfig c;
    std::string error;
    assert(UpstreamConfig::FromConfig(conf, &c, &error));
    assert(c.port == 80);
    assert(c.apiPrefix == "/api/2");
    assert(!c.useTls());

    conf.SetString("upstream", "scheme", "ftp");
    assert(!UpstreamConfig::FromConfig(conf, &c, &error));
    assert(error.find("scheme") != std::string::npos);

    conf.SetString("upstream", "scheme", "https");
    conf.SetString("upstream", "port", "70000");
    assert(!UpstreamConfig::FromConfig(conf, &c, &error));

    conf.SetString("upstream", "port", "443");
    conf.SetString("upstream", "timeout_ms", "0");
    assert(!UpstreamConfig::FromConfig(conf, &c, &error));
    assert(error.find("timeout_ms") != std::string::npos);

    conf.SetString("upstream", "timeout_ms", "5000");
    conf.SetString("upstream", "dns_cache_s", "-1");
    assert(!UpstreamConfig::FromConfig(conf, &c, &error));
    assert(error.find("dns_cache_s") != std::string::npos);
    LOG_INFO << "Upstream Validation PASS";
}

void testNoticeFromConfig() {
    Config& conf = Config::Instance();
    conf.Clear();
    Notice d = Notice::FromConfig(conf);
    assert(d.text == Notice::Default().text);
    assert(d.text.find("ariesclark.com") != std::string::npos);
    assert(d.examplePath == "/1/config");

    conf.SetString("notice", "authors", "example.org");
    conf.SetString("notice", "text", "line one\\nline two");
    conf.SetString("notice", "example_path", "1/worlds");
    Notice n = Notice::FromConfig(conf);
    assert(n.text == "line one\nline two");
    assert(n.examplePath == "/1/worlds");
    assert(n.ToJson().dump() == "{\"_readme\":\"line one\\nline two\",\"_authors\":\"example.org\"}");
    conf.Clear();
    LOG_INFO << "Notice PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testIniParsing();
    testLoadFile();
    testUpstreamDefaults();
    testUpstreamOverridesAndValidation();
    testNoticeFromConfig();
    return 0;
}
