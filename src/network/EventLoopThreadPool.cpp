#include "devproxy/network/EventLoopThreadPool.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/common/Logger.h"

#include <algorithm>

namespace devproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& name)
    : baseLoop_(baseLoop), name_(name), numThreads_(0), next_(0) {}

EventLoopThreadPool::~EventLoopThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (EventLoop* loop : loops_) {
            if (loop) loop->Quit();
        }
    }
    for (std::thread& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void EventLoopThreadPool::Start() {
    const size_t n = static_cast<size_t>(std::max(numThreads_, 0));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loops_.assign(n, nullptr);
    }
    for (size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this, i]() { RunWorker(i); });
    }
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() {
        return std::find(loops_.begin(), loops_.end(), nullptr) == loops_.end();
    });
}

void EventLoopThreadPool::RunWorker(size_t index) {
    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loops_[index] = &loop;
    }
    ready_.notify_all();
    LOG_DEBUG << "worker loop " << name_ << index << " running";
    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loops_[index] = nullptr;
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) return baseLoop_;
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace devproxy
