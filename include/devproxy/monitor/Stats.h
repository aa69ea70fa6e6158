#pragma once

#include <atomic>
#include <string>

namespace devproxy {
namespace monitor {

// Process-wide relaxed counters. Summary() is logged when the server stops.
class Stats {
public:
    static Stats& Instance();

    void IncTotalRequests() { totalRequests_.fetch_add(1, std::memory_order_relaxed); }
    long GetTotalRequests() const { return totalRequests_.load(std::memory_order_relaxed); }

    void IncUnmatchedRequests() { unmatchedRequests_.fetch_add(1, std::memory_order_relaxed); }
    long GetUnmatchedRequests() const { return unmatchedRequests_.load(std::memory_order_relaxed); }

    void IncForwardedRequests() { forwardedRequests_.fetch_add(1, std::memory_order_relaxed); }
    long GetForwardedRequests() const { return forwardedRequests_.load(std::memory_order_relaxed); }

    void IncUpstreamUnavailable() { upstreamUnavailable_.fetch_add(1, std::memory_order_relaxed); }
    long GetUpstreamUnavailable() const { return upstreamUnavailable_.load(std::memory_order_relaxed); }

    void IncUpstreamStreamErrors() { upstreamStreamErrors_.fetch_add(1, std::memory_order_relaxed); }
    long GetUpstreamStreamErrors() const { return upstreamStreamErrors_.load(std::memory_order_relaxed); }

    void IncClientAborts() { clientAborts_.fetch_add(1, std::memory_order_relaxed); }
    long GetClientAborts() const { return clientAborts_.load(std::memory_order_relaxed); }

    void IncActiveConnections() { activeConnections_.fetch_add(1, std::memory_order_relaxed); }
    void DecActiveConnections() { activeConnections_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveConnections() const { return activeConnections_.load(std::memory_order_relaxed); }

    void AddBytesIn(long long n) { bytesIn_.fetch_add(n, std::memory_order_relaxed); }
    void AddBytesOut(long long n) { bytesOut_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesIn() const { return bytesIn_.load(std::memory_order_relaxed); }
    long long GetBytesOut() const { return bytesOut_.load(std::memory_order_relaxed); }

    std::string Summary() const;

    // Tests only.
    void Reset();

private:
    Stats() = default;

    std::atomic<long> totalRequests_{0};
    std::atomic<long> unmatchedRequests_{0};
    std::atomic<long> forwardedRequests_{0};
    std::atomic<long> upstreamUnavailable_{0};
    std::atomic<long> upstreamStreamErrors_{0};
    std::atomic<long> clientAborts_{0};
    std::atomic<long> activeConnections_{0};
    std::atomic<long long> bytesIn_{0};
    std::atomic<long long> bytesOut_{0};
};

} // namespace monitor
} // namespace devproxy
