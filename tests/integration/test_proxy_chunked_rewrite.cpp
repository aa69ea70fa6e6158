#include "devproxy/DevServer.h"
#include "devproxy/common/Logger.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/router/ResponseInterceptor.h"

#include "test_net_util.h"

#include <signal.h>

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace testutil;
using devproxy::network::EventLoop;
using devproxy::network::InetAddress;
using devproxy::protocol::HttpHeaders;
using devproxy::router::FunctionInterceptor;
using devproxy::router::HeaderRewriteInterceptor;
using devproxy::router::ProxyRule;
using devproxy::router::ProxyRuleSet;

namespace {

// Answers by the last path segment; returns when the response is close-delimited.
void serveOrigin(int fd) {
    std::string pending;
    RawRequest req;
    while (readRequest(fd, &pending, &req)) {
        const std::string line = req.requestLine();
        if (line.find("/cl ") != std::string::npos) {
            const bool head = line.rfind("HEAD ", 0) == 0;
            sendAll(fd, std::string("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 11\r\n\r\n") +
                            (head ? "" : "hello world"));
        } else if (line.find("/chunked ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n");
        } else if (line.find("/empty ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 204 No Content\r\nX-Empty: 1\r\n\r\n");
        } else if (line.find("/close ") != std::string::npos) {
            sendAll(fd, "HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nuntil close");
            return;
        } else {
            sendAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
        }
    }
}

} // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    devproxy::common::Logger::Instance().SetLevel(devproxy::common::LogLevel::ERROR);

    ScriptedBackend backend(serveOrigin);
    assert(backend.port() != 0);
    const auto proxyPortOpt = reserveFreePort();
    assert(proxyPortOpt.has_value());
    const uint16_t proxyPort = *proxyPortOpt;
    const std::string target = "http://127.0.0.1:" + std::to_string(backend.port());

    std::vector<ProxyRule> rules(3);
    rules[0].matchPrefix = "/api";
    rules[0].target = target;
    auto forceChunked = std::make_shared<HeaderRewriteInterceptor>();
    forceChunked->SetHeader("Content-Encoding", "chunked");
    rules[0].onResponse = forceChunked;

    rules[1].matchPrefix = "/fn";
    rules[1].target = target;
    rules[1].onResponse = std::make_shared<FunctionInterceptor>([](int status, HttpHeaders* headers) {
        if (status == 200) headers->remove("Content-Length");
        headers->set("X-Intercepted", std::to_string(status));
    });

    rules[2].matchPrefix = "/boom";
    rules[2].target = target;
    rules[2].onResponse = std::make_shared<FunctionInterceptor>([](int, HttpHeaders*) {
        throw std::runtime_error("interceptor failure");
    });

    EventLoop loop;
    devproxy::DevServer server(&loop, InetAddress(proxyPort, true), ProxyRuleSet::Build(std::move(rules)),
                               "ChunkedRewriteTest");
    assert(server.Start());

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        int fd = connectTo(proxyPort);
        assert(fd >= 0);
        std::string pending;

        // Fixed-length upstream body re-framed as chunked.
        sendAll(fd, "GET /api/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
        HttpReply r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.head.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(!hasHeaderCI(r.head, "Content-Length"));
        assert(headerValueCI(r.head, "Transfer-Encoding") == "chunked");
        assert(headerValueCI(r.head, "Content-Encoding") == "chunked");
        assert(r.rawBody == "b\r\nhello world\r\n0\r\n\r\n");
        assert(r.body == "hello world");

        // Already chunked upstream: relayed untouched, no double encoding.
        sendAll(fd, "GET /api/chunked HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.rawBody == "5\r\nhello\r\n0\r\n\r\n");
        assert(headerValueCI(r.head, "Content-Encoding") == "chunked");

        // No body: nothing to frame.
        sendAll(fd, "GET /api/empty HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.status() == 204);
        assert(!hasHeaderCI(r.head, "Transfer-Encoding"));

        sendAll(fd, "HEAD /api/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending, true);
        assert(r.complete);
        assert(headerValueCI(r.head, "Content-Length") == "11");

        // Close-delimited HTTP/1.0 upstream: chunking gives the body an end,
        // so the client connection survives.
        sendAll(fd, "GET /api/close HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.head.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(r.body == "until close");

        // Interceptor dropping Content-Length forces chunking too.
        sendAll(fd, "GET /fn/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(headerValueCI(r.head, "X-Intercepted") == "200");
        assert(headerValueCI(r.head, "Transfer-Encoding") == "chunked");
        assert(r.body == "hello world");

        sendAll(fd, "GET /fn/missing HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.status() == 404);
        assert(headerValueCI(r.head, "X-Intercepted") == "404");
        assert(headerValueCI(r.head, "Content-Length") == "0");

        // A throwing interceptor fails the exchange before anything is sent.
        sendAll(fd, "GET /boom/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.status() == 502);
        assert(waitClosed(fd, 2000));
        ::close(fd);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    backend.Stop();
    return 0;
}
