#include "devproxy/DevServer.h"
#include "devproxy/common/Logger.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/router/ResponseInterceptor.h"

#include "test_net_util.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <memory>
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

void serveOrigin(int fd) {
    std::string pending;
    RawRequest req;
    while (readRequest(fd, &pending, &req)) {
        const std::string line = req.requestLine();
        if (line.find("/continue ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 100 Continue\r\n\r\n"
                        "HTTP/1.1 200 OK\r\nContent-Length: 11\r\n\r\nhello world");
        } else if (line.find("/cl ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: 11\r\n\r\nhello world");
        } else if (line.find("/chunked ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
        } else if (line.find("/upgrade ") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 101 Switching Protocols\r\nUpgrade: echo\r\nConnection: Upgrade\r\n\r\ntunnel data");
            return;
        } else {
            sendAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
        }
    }
}

// Reads until the peer closes; false if it stays open past timeoutMs.
bool readUntilClosed(int fd, std::string* pending, int timeoutMs) {
    while (recvMore(fd, pending, timeoutMs)) {
    }
    return waitClosed(fd, 100);
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

    std::atomic<int> hookCalls{0};
    std::atomic<int> lastStatus{0};

    std::vector<ProxyRule> rules(3);
    rules[0].matchPrefix = "/count";
    rules[0].target = target;
    rules[0].onResponse = std::make_shared<FunctionInterceptor>([&](int status, HttpHeaders* headers) {
        hookCalls.fetch_add(1);
        lastStatus.store(status);
        headers->set("X-Hook-Calls", std::to_string(hookCalls.load()));
    });

    rules[1].matchPrefix = "/api";
    rules[1].target = target;
    auto forceChunked = std::make_shared<HeaderRewriteInterceptor>();
    forceChunked->SetHeader("Content-Encoding", "chunked");
    rules[1].onResponse = forceChunked;

    rules[2].matchPrefix = "/ws";
    rules[2].target = target;

    EventLoop loop;
    devproxy::DevServer server(&loop, InetAddress(proxyPort, true), ProxyRuleSet::Build(std::move(rules)),
                               "ResponseHooksTest");
    assert(server.Start());

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        {
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            std::string pending;

            // The interim response is relayed but the hook only sees the final one.
            sendAll(fd, "GET /count/continue HTTP/1.1\r\nHost: localhost\r\n\r\n");
            HttpReply r = readResponse(fd, &pending);
            assert(r.complete);
            assert(r.status() == 100);
            r = readResponse(fd, &pending);
            assert(r.complete);
            assert(r.status() == 200);
            assert(r.body == "hello world");
            assert(hookCalls.load() == 1);
            assert(lastStatus.load() == 200);
            assert(headerValueCI(r.head, "X-Hook-Calls") == "1");

            // Two keep-alive exchanges on the pooled upstream connection: one call each.
            sendAll(fd, "GET /count/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
            r = readResponse(fd, &pending);
            assert(r.complete);
            assert(hookCalls.load() == 2);
            assert(headerValueCI(r.head, "X-Hook-Calls") == "2");

            sendAll(fd, "GET /count/cl HTTP/1.1\r\nHost: localhost\r\n\r\n");
            r = readResponse(fd, &pending);
            assert(r.complete);
            assert(hookCalls.load() == 3);
            assert(headerValueCI(r.head, "X-Hook-Calls") == "3");
            assert(backend.accepted() == 1);
            ::close(fd);
        }
        LOG_INFO << "Hook Once Per Response PASS";

        {
            // HTTP/1.0 client: no 1xx and no chunked coding, the close ends the body.
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            std::string pending;
            sendAll(fd, "GET /api/continue HTTP/1.0\r\nHost: localhost\r\n\r\n");
            HttpReply r = readResponse(fd, &pending);
            assert(r.status() == 200);
            assert(r.head.find("100 Continue") == std::string::npos);
            assert(!hasHeaderCI(r.head, "Transfer-Encoding"));
            assert(!hasHeaderCI(r.head, "Content-Length"));
            assert(headerValueCI(r.head, "Content-Encoding") == "chunked");
            assert(r.closed);
            assert(r.body == "hello world");
            ::close(fd);
        }

        {
            // Chunked upstream body handed to an HTTP/1.0 client as plain bytes.
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            std::string pending;
            sendAll(fd, "GET /api/chunked HTTP/1.0\r\nHost: localhost\r\n\r\n");
            HttpReply r = readResponse(fd, &pending);
            assert(r.status() == 200);
            assert(!hasHeaderCI(r.head, "Transfer-Encoding"));
            assert(r.closed);
            assert(r.body == "hello world");
            ::close(fd);
        }
        LOG_INFO << "HTTP/1.0 Client PASS";

        {
            // After 101 the client connection is not reused for HTTP.
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            std::string pending;
            sendAll(fd, "GET /ws/upgrade HTTP/1.1\r\nHost: localhost\r\n\r\n");
            HttpReply r = readResponse(fd, &pending);
            assert(r.complete);
            assert(r.status() == 101);
            assert(readUntilClosed(fd, &pending, 2000));
            assert(pending == "tunnel data");
            ::close(fd);
        }
        LOG_INFO << "Switching Protocols Close PASS";

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    backend.Stop();
    return 0;
}
