#include "devproxy/router/ForwardSession.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/common/Logger.h"
#include "devproxy/network/Buffer.h"
#include "devproxy/protocol/HttpContext.h"
#include <cassert>
#include <string>
#include <vector>

using namespace devproxy::router;
using namespace devproxy::protocol;
using namespace devproxy::network;
using namespace devproxy::common;

static HttpRequest parse(const std::string& text) {
    HttpContext ctx;
    Buffer buf;
    buf.Append(text);
    assert(ctx.parseRequest(&buf));
    assert(ctx.gotHead());
    return ctx.request();
}

static ProxyRuleSetPtr single(ProxyRule rule) {
    std::vector<ProxyRule> rules;
    rules.push_back(std::move(rule));
    return ProxyRuleSet::Build(std::move(rules));
}

void testForwardedPath() {
    ProxyRule r;
    r.matchPrefix = "/api";
    r.target = "http://127.0.0.1:8089";
    r.rewrite.Add("^", "");
    auto set = single(r);
    const ProxyRule& rule = set->rules()[0];
    assert(rule.ForwardedPath("/api/users") == "/api/users");

    ProxyRule based;
    based.matchPrefix = "/api";
    based.target = "http://127.0.0.1:8089/v2";
    based.rewrite.Add("^/api", "");
    auto set2 = single(based);
    assert(set2->rules()[0].ForwardedPath("/api/users") == "/v2/users");
    assert(set2->rules()[0].ForwardedPath("/api") == "/v2/");
    LOG_INFO << "Forwarded Path PASS";
}

void testHeadPassThrough() {
    ProxyRule r;
    r.matchPrefix = "/api";
    r.target = "http://127.0.0.1:8089";
    auto set = single(r);
    const HttpRequest req = parse(
        "PATCH /api/items/7?dry=1 HTTP/1.0\r\n"
        "Host: localhost:8000\r\n"
        "Cookie: a=1\r\n"
        "cookie: b=2\r\n"
        "Content-Length: 2\r\n"
        "\r\n");
    const std::string head = ForwardSession::BuildRequestHead(set->rules()[0], req, "/api/items/7?dry=1",
                                                              InetAddress("127.0.0.1", 50000));
    assert(head ==
           "PATCH /api/items/7?dry=1 HTTP/1.1\r\n"
           "Host: localhost:8000\r\n"
           "Cookie: a=1\r\n"
           "cookie: b=2\r\n"
           "Content-Length: 2\r\n"
           "\r\n");
    LOG_INFO << "Head Pass-Through PASS";
}

void testChangeOriginAndExtraHeaders() {
    ProxyRule r;
    r.matchPrefix = "/api";
    r.target = "http://localhost:8089";
    r.changeOrigin = true;
    r.requestHeaders.push_back({"Authorization", "Bearer dev"});
    auto set = single(r);
    const HttpRequest req = parse(
        "GET /api HTTP/1.1\r\n"
        "Host: localhost:8000\r\n"
        "authorization: Basic x\r\n"
        "\r\n");
    const std::string head = ForwardSession::BuildRequestHead(set->rules()[0], req, "/api",
                                                              InetAddress("127.0.0.1", 50000));
    assert(head ==
           "GET /api HTTP/1.1\r\n"
           "Host: localhost:8089\r\n"
           "authorization: Bearer dev\r\n"
           "\r\n");

    ProxyRule plain;
    plain.matchPrefix = "/x";
    plain.target = "https://127.0.0.1";
    auto set2 = single(plain);
    const HttpRequest noHost = parse("GET /x HTTP/1.0\r\n\r\n");
    const std::string head2 = ForwardSession::BuildRequestHead(set2->rules()[0], noHost, "/x",
                                                               InetAddress("127.0.0.1", 50000));
    assert(head2 == "GET /x HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");
    LOG_INFO << "Change Origin PASS";
}

void testXForwarded() {
    ProxyRule r;
    r.matchPrefix = "/";
    r.target = "http://127.0.0.1:8089";
    r.xfwd = true;
    auto set = single(r);
    const HttpRequest req = parse(
        "GET /page HTTP/1.1\r\n"
        "Host: dev.local:3000\r\n"
        "X-Forwarded-For: 10.0.0.1\r\n"
        "\r\n");
    const std::string head = ForwardSession::BuildRequestHead(set->rules()[0], req, "/page",
                                                              InetAddress("192.168.1.5", 40000));
    assert(head.find("X-Forwarded-For: 10.0.0.1,192.168.1.5\r\n") != std::string::npos);
    assert(head.find("X-Forwarded-Port: 3000\r\n") != std::string::npos);
    assert(head.find("X-Forwarded-Proto: http\r\n") != std::string::npos);
    assert(head.find("X-Forwarded-Host: dev.local:3000\r\n") != std::string::npos);
    assert(head.find("Host: dev.local:3000\r\n") != std::string::npos);

    const HttpRequest bare = parse("GET / HTTP/1.1\r\nHost: dev.local\r\n\r\n");
    const std::string head2 = ForwardSession::BuildRequestHead(set->rules()[0], bare, "/",
                                                               InetAddress("192.168.1.5", 40000));
    assert(head2.find("X-Forwarded-Port: 80\r\n") != std::string::npos);
    LOG_INFO << "X-Forwarded PASS";
}

void testNames() {
    assert(std::string(ForwardSession::StateName(ForwardSession::kHeaderMutated)) == "HeaderMutated");
    assert(std::string(ForwardSession::ErrorName(ForwardSession::kUpstreamUnavailable)) == "upstream unavailable");
    LOG_INFO << "Names PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testForwardedPath();
    testHeadPassThrough();
    testChangeOriginAndExtraHeaders();
    testXForwarded();
    testNames();
    return 0;
}
