#pragma once

#include "devproxy/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace devproxy {
namespace network {

class EventLoop;

// Worker loops for accepted connections. Each worker thread owns its
// EventLoop on its own stack; the pool only keeps pointers.
class EventLoopThreadPool : devproxy::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& name);
    // Quits every worker loop and joins its thread.
    ~EventLoopThreadPool();

    // 0 threads: every connection runs on the base loop.
    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }

    // Returns once every worker loop is running.
    void Start();

    // Round robin over worker loops.
    EventLoop* GetNextLoop();

private:
    void RunWorker(size_t index);

    EventLoop* baseLoop_;
    std::string name_;
    int numThreads_;
    size_t next_;

    std::mutex mutex_;
    std::condition_variable ready_;
    std::vector<EventLoop*> loops_;
    std::vector<std::thread> threads_;
};

} // namespace network
} // namespace devproxy
