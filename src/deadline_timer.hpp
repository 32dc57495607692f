#pragma once
// CPU Benchmark - Deadline timer
//
// Arms a background thread that raises a flag once the duration has elapsed.
// The benchmark loop polls fired() without blocking.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class DeadlineTimer {
public:
    // Starts the timer immediately. A zero duration fires right away.
    explicit DeadlineTimer(std::chrono::steady_clock::duration duration);

    // Cancels the timer if still pending and joins the thread
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    bool fired() const { return fired_.load(std::memory_order_acquire); }

    // Stop waiting; fired() stays false if the deadline had not passed
    void cancel();

    std::chrono::steady_clock::time_point deadline() const { return deadline_; }

private:
    void wait_loop();

    std::chrono::steady_clock::time_point deadline_;
    std::atomic<bool> fired_;
    bool cancelled_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};
