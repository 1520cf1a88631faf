#pragma once
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include <functional>

class Latch {
public:
    using StopPredicate = std::function<bool()>;

    explicit Latch(std::size_t count);

    void count_down();

    void wait();

    // Returns true once the count reached zero, false on timeout or stop.
    bool wait_for(std::chrono::milliseconds timeout, const StopPredicate& stop_condition);

    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::size_t count_;
};
