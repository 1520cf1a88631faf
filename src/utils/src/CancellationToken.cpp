#include "CancellationToken.hpp"

void CancellationToken::cancel() {
    {
        // Held so a sleeper between its predicate check and blocking cannot miss the wakeup
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}
