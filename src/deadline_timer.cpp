// CPU Benchmark - Deadline timer

#include "deadline_timer.hpp"
#include "debug_log.hpp"

DeadlineTimer::DeadlineTimer(std::chrono::steady_clock::duration duration)
    : deadline_(std::chrono::steady_clock::now() + duration)
    , fired_(false)
    , cancelled_(false)
{
    if (duration <= std::chrono::steady_clock::duration::zero()) {
        fired_.store(true, std::memory_order_release);
        return;
    }
    thread_ = std::thread(&DeadlineTimer::wait_loop, this);
}

DeadlineTimer::~DeadlineTimer() {
    cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DeadlineTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void DeadlineTimer::wait_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    // wait_until returns on spurious wakeups too, hence the predicate
    if (!cv_.wait_until(lock, deadline_, [this] { return cancelled_; })) {
        debug_log("Stop signal");
        fired_.store(true, std::memory_order_release);
    }
}
