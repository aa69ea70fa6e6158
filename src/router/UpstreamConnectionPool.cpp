#include "devproxy/router/UpstreamConnectionPool.h"
#include "devproxy/router/ProxyRule.h"
#include "devproxy/network/TlsContext.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <utility>

namespace devproxy {
namespace router {

namespace {

// Bytes from an idle upstream can't belong to any request.
void OnIdleMessage(const devproxy::network::TcpConnectionPtr& conn,
                   devproxy::network::Buffer* buf,
                   std::chrono::system_clock::time_point) {
    LOG_DEBUG << "Idle upstream " << conn->name() << " sent " << buf->ReadableBytes() << " unexpected bytes";
    buf->RetrieveAll();
    conn->ForceClose();
}

} // namespace

UpstreamConnectionPool::Lease::Lease(devproxy::network::EventLoop* loop,
                                     std::string originKey,
                                     std::shared_ptr<devproxy::network::TcpClient> client,
                                     UpstreamConnectionPool* pool,
                                     bool reused)
    : loop_(loop), originKey_(std::move(originKey)), client_(std::move(client)), pool_(pool), reused_(reused) {
}

UpstreamConnectionPool::Lease::~Lease() {
    Release(false);
}

devproxy::network::TcpConnectionPtr UpstreamConnectionPool::Lease::connection() const {
    if (!client_) return {};
    return client_->connection();
}

void UpstreamConnectionPool::Lease::Release(bool keepAlive) {
    if (released_) return;
    released_ = true;
    if (!pool_) return;
    pool_->ReleaseInternal(loop_, originKey_, std::move(client_), keepAlive);
    client_.reset();
}

UpstreamConnectionPool::UpstreamConnectionPool() : cfg_() {}

UpstreamConnectionPool::UpstreamConnectionPool(Config cfg) : cfg_(cfg) {}

std::string UpstreamConnectionPool::OriginKey(const ProxyRule& rule) {
    std::string key = rule.targetUrl.origin();
    if (rule.targetUrl.isHttps() && !rule.secure) key += "|insecure";
    return key;
}

void UpstreamConnectionPool::PendingAcquire::Cancel() {
    if (done_) return;
    done_ = true;
    cb_ = nullptr;
    auto owner = std::move(client_);
    client_.reset();
    if (owner) {
        LOG_DEBUG << "Cancelling connect " << owner->name();
        owner->Stop();
        // Released after the connector has stopped on this loop.
        loop_->QueueInLoop([owner]() {});
    }
}

UpstreamConnectionPool::PendingAcquirePtr UpstreamConnectionPool::Acquire(devproxy::network::EventLoop* loop,
                                                                          const ProxyRule& rule,
                                                                          AcquireCallback cb) {
    const std::string key = OriginKey(rule);
    auto pending = std::make_shared<PendingAcquire>(loop);
    pending->cb_ = std::move(cb);

    // Fast path: reuse an idle connection of this loop.
    LeasePtr reusedLease;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto& po = pools_[loop].origins[key];
        while (!po.idle.empty()) {
            auto client = po.idle.back();
            po.idle.pop_back();
            if (!client) continue;
            auto conn = client->connection();
            if (conn && conn->connected()) {
                reusedLease = std::make_shared<Lease>(loop, key, client, this, true);
                break;
            }
        }
    }
    if (reusedLease) {
        LOG_DEBUG << "Reusing upstream connection for " << key;
        loop->QueueInLoop([pending, reusedLease]() {
            if (pending->done_) {
                // Nobody used it; straight back to the idle list.
                reusedLease->Release(true);
                return;
            }
            pending->done_ = true;
            AcquireCallback done = std::move(pending->cb_);
            pending->cb_ = nullptr;
            done(reusedLease, 0);
        });
        return pending;
    }

    auto client = std::make_shared<devproxy::network::TcpClient>(loop, rule.targetAddr, "Upstream-" + key);
    client->SetMaxConnectRetries(0);
    client->SetConnectTimeoutMs(rule.connectTimeoutMs);
    if (rule.tls) {
        client->EnableTls(rule.tls->ctx(), rule.targetUrl.host, rule.secure);
    }
    pending->client_ = client;

    client->SetConnectionCallback([this, loop, key, pending](const devproxy::network::TcpConnectionPtr& c) {
        // Later events on the connection belong to the lease holder.
        if (pending->done_) return;
        pending->done_ = true;
        AcquireCallback done = std::move(pending->cb_);
        auto owner = std::move(pending->client_);
        pending->cb_ = nullptr;
        pending->client_.reset();
        if (!c->connected()) {
            loop->QueueInLoop([done, owner]() { done(nullptr, ECONNRESET); });
            return;
        }
        auto lease = std::make_shared<Lease>(loop, key, owner, this, false);
        loop->QueueInLoop([done, lease, c]() {
            if (!c->connected()) {
                lease->Release(false);
                done(nullptr, ECONNRESET);
                return;
            }
            done(lease, 0);
        });
    });
    client->SetConnectFailedCallback([loop, key, pending](int err) {
        if (pending->done_) return;
        pending->done_ = true;
        AcquireCallback done = std::move(pending->cb_);
        auto owner = std::move(pending->client_);
        pending->cb_ = nullptr;
        pending->client_.reset();
        LOG_WARN << "Upstream " << key << " unavailable: " << std::strerror(err);
        // owner rides along so the client is not destroyed inside its own connector.
        loop->QueueInLoop([done, owner, err]() { done(nullptr, err); });
    });
    client->Connect();
    return pending;
}

void UpstreamConnectionPool::ReleaseInternal(devproxy::network::EventLoop* loop,
                                             const std::string& originKey,
                                             std::shared_ptr<devproxy::network::TcpClient> client,
                                             bool keepAlive) {
    if (!loop || !client) return;
    // Deferred: the caller may be running inside one of the connection's own callbacks.
    loop->QueueInLoop([this, loop, originKey, client, keepAlive]() {
        auto conn = client->connection();
        if (conn) {
            conn->SetConnectionCallback(nullptr);
            conn->SetHighWaterMarkCallback(nullptr, 0);
            conn->SetWriteCompleteCallback(nullptr);
            conn->SetMessageCallback(OnIdleMessage);
        }
        if (!keepAlive || !conn || !conn->connected()) {
            if (conn) conn->ForceClose();
            return;
        }
        conn->StartRead();

        std::lock_guard<std::mutex> lock(mu_);
        auto& po = pools_[loop].origins[originKey];
        if (po.idle.size() >= cfg_.maxIdlePerOrigin) {
            conn->ForceClose();
            return;
        }
        po.idle.push_back(client);
    });
}

size_t UpstreamConnectionPool::IdleCount(devproxy::network::EventLoop* loop, const std::string& originKey) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto lit = pools_.find(loop);
    if (lit == pools_.end()) return 0;
    auto oit = lit->second.origins.find(originKey);
    if (oit == lit->second.origins.end()) return 0;
    size_t n = 0;
    for (const auto& client : oit->second.idle) {
        auto conn = client ? client->connection() : nullptr;
        if (conn && conn->connected()) ++n;
    }
    return n;
}

void UpstreamConnectionPool::Clear() {
    std::unordered_map<devproxy::network::EventLoop*, PerLoop> drop;
    {
        std::lock_guard<std::mutex> lock(mu_);
        drop.swap(pools_);
    }
}

} // namespace router
} // namespace devproxy
