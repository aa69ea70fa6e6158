#include "devproxy/network/EventLoop.h"
#include "devproxy/network/Channel.h"
#include "devproxy/network/EpollPoller.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <sys/eventfd.h>
#include <unistd.h>

namespace devproxy {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

int CreateWakeupFd() {
    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "eventfd");
    return fd;
}

} // namespace

EventLoop::EventLoop()
    : quit_(false),
      runningFunctors_(false),
      threadId_(std::this_thread::get_id()) {
    if (t_loopInThisThread) {
        throw std::logic_error("EventLoop: this thread already runs a loop");
    }
    poller_.reset(new EpollPoller());
    wakeupFd_ = CreateWakeupFd();
    wakeupChannel_.reset(new Channel(this, wakeupFd_));
    t_loopInThisThread = this;

    wakeupChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeup(); });
    wakeupChannel_->EnableReading();
    LOG_DEBUG << "EventLoop " << this << " created in thread " << threadId_;
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    quit_ = false;
    while (!quit_) {
        activeChannels_.clear();
        const auto receiveTime = poller_->Poll(kPollTimeMs, &activeChannels_);
        for (Channel* channel : activeChannels_) {
            channel->HandleEvent(receiveTime);
        }
        RunPendingFunctors();
    }
    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) WakeUp();
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFunctors_.push_back(std::move(cb));
    }
    // Functors queued while the batch runs belong to the next iteration,
    // which must not wait out the poll timeout.
    if (!IsInLoopThread() || runningFunctors_) WakeUp();
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop::WakeUp write failed errno=" << errno;
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop::DrainWakeup read failed errno=" << errno;
    }
}

void EventLoop::RunPendingFunctors() {
    std::vector<Functor> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pendingFunctors_);
    }
    runningFunctors_ = true;
    for (const Functor& fn : batch) fn();
    runningFunctors_ = false;
}

} // namespace network
} // namespace devproxy
