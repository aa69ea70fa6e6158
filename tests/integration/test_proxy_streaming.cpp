#include "devproxy/DevServer.h"
#include "devproxy/common/Logger.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/router/ProxyRuleSet.h"

#include "test_net_util.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace testutil;
using devproxy::network::EventLoop;
using devproxy::network::InetAddress;
using devproxy::router::ProxyRule;
using devproxy::router::ProxyRuleSet;

namespace {

const size_t kLargeBody = 4 * 1024 * 1024;

bool waitFlag(const std::atomic<bool>& flag, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!flag.load()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

std::string largePayload() {
    std::string s(kLargeBody, '\0');
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>('a' + (i * 7 + i / 4096) % 26);
    }
    return s;
}

} // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    devproxy::common::Logger::Instance().SetLevel(devproxy::common::LogLevel::ERROR);

    std::atomic<bool> clientSawFirstChunk{false};
    std::atomic<bool> backendSawPartialBody{false};
    std::atomic<bool> responseWasStreamed{false};
    std::atomic<bool> requestWasStreamed{false};
    const std::string large = largePayload();

    ScriptedBackend backend([&](int fd) {
        std::string pending;
        while (true) {
            size_t hdrEnd;
            while ((hdrEnd = pending.find("\r\n\r\n")) == std::string::npos) {
                if (!recvMore(fd, &pending, 3000)) return;
            }
            const std::string head = pending.substr(0, hdrEnd + 4);
            pending.erase(0, hdrEnd + 4);
            const std::string line = head.substr(0, head.find("\r\n"));

            if (line.find("/api/events ") != std::string::npos) {
                sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n"
                            "Transfer-Encoding: chunked\r\n\r\n5\r\nfirst\r\n");
                responseWasStreamed.store(waitFlag(clientSawFirstChunk, 3000));
                sendAll(fd, "6\r\nsecond\r\n0\r\n\r\n");
            } else if (line.find("/api/upload ") != std::string::npos) {
                const size_t need = std::stoul(headerValueCI(head, "Content-Length"));
                while (pending.size() < 5) {
                    if (!recvMore(fd, &pending, 3000)) return;
                }
                // Only part of the body has been sent at this point.
                requestWasStreamed.store(pending.size() < need);
                backendSawPartialBody.store(true);
                while (pending.size() < need) {
                    if (!recvMore(fd, &pending, 3000)) return;
                }
                const std::string body = pending.substr(0, need);
                pending.erase(0, need);
                sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
            } else if (line.find("/api/large ") != std::string::npos) {
                sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(large.size()) + "\r\n\r\n");
                sendAll(fd, large);
            } else {
                sendAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
            }
        }
    });
    assert(backend.port() != 0);
    const auto proxyPortOpt = reserveFreePort();
    assert(proxyPortOpt.has_value());
    const uint16_t proxyPort = *proxyPortOpt;

    std::vector<ProxyRule> rules(1);
    rules[0].matchPrefix = "/api";
    rules[0].target = "http://127.0.0.1:" + std::to_string(backend.port());

    devproxy::DevServer::Options opts;
    // Small watermark so the large transfer has to pause and resume.
    opts.router.session.highWaterMark = 64 * 1024;

    EventLoop loop;
    devproxy::DevServer server(&loop, InetAddress(proxyPort, true), ProxyRuleSet::Build(std::move(rules)), opts,
                               "StreamingTest");
    assert(server.Start());

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        int fd = connectTo(proxyPort);
        assert(fd >= 0);
        std::string pending;

        // Response chunks reach the client while the upstream is still sending.
        sendAll(fd, "GET /api/events HTTP/1.1\r\nHost: localhost\r\n\r\n");
        while (pending.find("first") == std::string::npos) {
            assert(recvMore(fd, &pending, 3000));
        }
        clientSawFirstChunk.store(true);
        HttpReply r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.body == "firstsecond");

        // Request body bytes reach the upstream before the client finishes sending.
        sendAll(fd, "POST /api/upload HTTP/1.1\r\nHost: localhost\r\nContent-Length: 10\r\n\r\nhello");
        assert(waitFlag(backendSawPartialBody, 3000));
        sendAll(fd, "world");
        r = readResponse(fd, &pending);
        assert(r.complete);
        assert(r.body == "helloworld");

        // Slow reader: the proxy must not lose or reorder bytes while pausing the upstream.
        sendAll(fd, "GET /api/large HTTP/1.1\r\nHost: localhost\r\n\r\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        r = readResponse(fd, &pending, false, 10000);
        assert(r.complete);
        assert(r.body.size() == large.size());
        assert(r.body == large);
        ::close(fd);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    backend.Stop();

    assert(responseWasStreamed.load());
    assert(requestWasStreamed.load());
    return 0;
}
