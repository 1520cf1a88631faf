#include "Latch.hpp"

Latch::Latch(std::size_t count) : count_(count) {}

void Latch::count_down() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (count_ > 0) {
        if (--count_ == 0) {
            cond_.notify_all();
        }
    }
}

void Latch::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return count_ == 0; });
}

bool Latch::wait_for(std::chrono::milliseconds timeout, const StopPredicate& stop_condition) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout, [this, &stop_condition] { return count_ == 0 || stop_condition(); });
    return count_ == 0;
}

std::size_t Latch::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}
