#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative cancellation shared by the coordinator and every task thread.
// Sleeps taken through sleep_for() wake up as soon as cancel() is called.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool is_cancelled() const { return cancelled_.load(); }

    // Returns false when the sleep was cut short by cancellation.
    bool sleep_for(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
