#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/TcpClient.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace devproxy {
namespace router {

struct ProxyRule;

// Keep-alive connections to upstream origins, kept per event loop and origin.
// One in-flight request per connection; a connection is only reused after a
// complete, cleanly framed exchange.
class UpstreamConnectionPool : devproxy::common::noncopyable {
public:
    struct Config {
        size_t maxIdlePerOrigin{16};
    };

    class Lease : devproxy::common::noncopyable {
    public:
        Lease(devproxy::network::EventLoop* loop,
              std::string originKey,
              std::shared_ptr<devproxy::network::TcpClient> client,
              UpstreamConnectionPool* pool,
              bool reused);
        ~Lease();

        devproxy::network::TcpConnectionPtr connection() const;
        const std::string& originKey() const { return originKey_; }
        // Taken from the idle list rather than freshly connected.
        bool reused() const { return reused_; }

        // keepAlive=true -> back to the idle list; else the connection is closed at once.
        void Release(bool keepAlive);

    private:
        devproxy::network::EventLoop* loop_;
        std::string originKey_;
        std::shared_ptr<devproxy::network::TcpClient> client_;
        UpstreamConnectionPool* pool_{nullptr};
        bool reused_;
        bool released_{false};
    };

    using LeasePtr = std::shared_ptr<Lease>;
    // lease is null on failure and err holds the connect errno.
    using AcquireCallback = std::function<void(LeasePtr lease, int err)>;

    // One outstanding Acquire call.
    class PendingAcquire : devproxy::common::noncopyable {
    public:
        explicit PendingAcquire(devproxy::network::EventLoop* loop) : loop_(loop) {}

        // Loop thread only. Aborts a connect in progress; the callback will not run.
        void Cancel();
        bool done() const { return done_; }

    private:
        friend class UpstreamConnectionPool;

        devproxy::network::EventLoop* loop_;
        AcquireCallback cb_;
        std::shared_ptr<devproxy::network::TcpClient> client_;
        bool done_{false};
    };

    using PendingAcquirePtr = std::shared_ptr<PendingAcquire>;

    UpstreamConnectionPool();
    explicit UpstreamConnectionPool(Config cfg);
    ~UpstreamConnectionPool() = default;

    // Must be called on loop's thread. cb always runs from a later loop turn,
    // unless the returned handle is cancelled first.
    PendingAcquirePtr Acquire(devproxy::network::EventLoop* loop, const ProxyRule& rule, AcquireCallback cb);

    size_t IdleCount(devproxy::network::EventLoop* loop, const std::string& originKey) const;
    // Drops every idle connection.
    void Clear();

    static std::string OriginKey(const ProxyRule& rule);

private:
    void ReleaseInternal(devproxy::network::EventLoop* loop,
                         const std::string& originKey,
                         std::shared_ptr<devproxy::network::TcpClient> client,
                         bool keepAlive);

    struct PerOrigin {
        std::vector<std::shared_ptr<devproxy::network::TcpClient>> idle;
    };

    struct PerLoop {
        std::unordered_map<std::string, PerOrigin> origins;
    };

    Config cfg_;
    mutable std::mutex mu_;
    std::unordered_map<devproxy::network::EventLoop*, PerLoop> pools_;
};

} // namespace router
} // namespace devproxy
