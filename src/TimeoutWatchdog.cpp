#include "TimeoutWatchdog.hpp"
#include "ProcessHandle.hpp"
#include "TerminationController.hpp"

TimeoutWatchdog::TimeoutWatchdog(TerminationController& terminator)
    : terminator_(terminator)
{}

TimeoutWatchdog::~TimeoutWatchdog() {
    cancel();
}

void TimeoutWatchdog::arm(ProcessHandle& proc, std::chrono::milliseconds timeout) {
    cancel();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        state_ = State::Armed;
        cancelRequested_ = false;
    }
    watchThread_ = std::thread(&TimeoutWatchdog::watchFunc, this, &proc, timeout);
}

bool TimeoutWatchdog::cancel() {
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancelRequested_ = true;
        if (state_ == State::Armed) {
            state_ = State::Cancelled;
            cancelled = true;
        }
    }
    cv_.notify_all();
    if (watchThread_.joinable())
        watchThread_.join();
    return cancelled;
}

TimeoutWatchdog::State TimeoutWatchdog::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

void TimeoutWatchdog::watchFunc(ProcessHandle* proc, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lk(mutex_);
        if (cv_.wait_for(lk, timeout, [this] { return cancelRequested_; }))
            return;
        state_ = State::Fired;
    }
    terminator_.terminate(*proc, true);
}
