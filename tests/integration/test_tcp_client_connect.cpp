#include "devproxy/network/Connector.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/InetAddress.h"
#include "devproxy/network/TcpClient.h"
#include "devproxy/network/TcpServer.h"
#include "devproxy/common/Logger.h"

#include "test_net_util.h"

#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace devproxy::network;
using namespace devproxy::common;

// Echo round trip through TcpServer and TcpClient on separate loops.
void testEcho() {
    const auto portOpt = testutil::reserveFreePort();
    assert(portOpt.has_value());
    const uint16_t port = *portOpt;
    std::atomic<EventLoop*> serverLoop{nullptr};

    // One loop per thread: the server loop lives on its own thread.
    std::thread serverThread([&]() {
        EventLoop sloop;
        TcpServer server(&sloop, InetAddress(port, true), "EchoServer");
        server.SetMessageCallback([](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
            conn->Send(buf->RetrieveAllAsString());
        });
        assert(server.Start());
        serverLoop.store(&sloop);
        sloop.Loop();
    });
    for (int i = 0; i < 50 && !serverLoop.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(serverLoop.load() != nullptr);

    EventLoop loop;
    TcpClient client(&loop, InetAddress("127.0.0.1", port), "EchoClient");
    std::string received;
    client.SetConnectionCallback([](const TcpConnectionPtr& conn) {
        if (conn->connected()) conn->Send("Hello Upstream");
    });
    client.SetMessageCallback([&](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
        received += buf->RetrieveAllAsString();
        if (received == "Hello Upstream") {
            client.Disconnect();
            loop.Quit();
        }
    });
    client.Connect();
    loop.Loop();

    serverLoop.load()->Quit();
    serverThread.join();
    assert(received == "Hello Upstream");
    LOG_INFO << "Echo PASS";
}

// No retries: a refused connect is reported once through the failure callback.
void testConnectRefused() {
    const auto portOpt = testutil::reserveFreePort();
    assert(portOpt.has_value());

    EventLoop loop;
    TcpClient client(&loop, InetAddress("127.0.0.1", *portOpt), "RefusedClient");
    client.SetMaxConnectRetries(0);
    std::atomic<int> failures{0};
    std::atomic<int> lastErr{0};
    bool connected = false;
    client.SetConnectionCallback([&](const TcpConnectionPtr& conn) {
        if (conn->connected()) connected = true;
    });
    client.SetConnectFailedCallback([&](int err) {
        failures.fetch_add(1);
        lastErr.store(err);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });
    client.Connect();

    std::atomic<bool> done{false};
    std::thread guard([&]() {
        for (int i = 0; i < 60 && !done.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        loop.Quit();
    });
    loop.Loop();
    done.store(true);
    guard.join();

    assert(!connected);
    assert(failures.load() == 1);
    assert(lastErr.load() == ECONNREFUSED);
    LOG_INFO << "Connect Refused PASS";
}

// The first attempt fails, the timerfd back-off retries until a listener appears.
void testConnectorRetry() {
    const auto portOpt = testutil::reserveFreePort();
    assert(portOpt.has_value());
    const uint16_t port = *portOpt;
    std::atomic<bool> connected{false};

    EventLoop loop;
    auto connector = std::make_shared<Connector>(&loop, InetAddress("127.0.0.1", port));
    connector->SetMaxRetries(-1);
    connector->SetNewConnectionCallback([&](int sockfd) {
        connected.store(true);
        ::close(sockfd);
        loop.Quit();
    });
    connector->Start();

    std::thread serverThread([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(650));
        int listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(listenFd >= 0);
        int opt = 1;
        ::setsockopt(listenFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        InetAddress addr("127.0.0.1", port);
        assert(::bind(listenFd, addr.getSockAddr(), sizeof(sockaddr_in)) == 0);
        assert(::listen(listenFd, 16) == 0);
        if (testutil::pollReadable(listenFd, 5000)) {
            int connFd = ::accept(listenFd, nullptr, nullptr);
            if (connFd >= 0) ::close(connFd);
        }
        ::close(listenFd);
    });

    loop.Loop();
    serverThread.join();
    connector->Stop();
    assert(connected.load());
    LOG_INFO << "Connector Retry PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testEcho();
    testConnectRefused();
    testConnectorRetry();
    return 0;
}
