#include "SignalManager.hpp"
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <cstring>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::mutex cb_mutex;
static std::atomic<int> received_signal{0};

// Self-pipe: the handler writes the signal number, the watcher thread reads it
static std::atomic<int> wake_write_fd{-1};
static int wake_read_fd = -1;
static std::thread watcher;

// Only async-signal-safe work here
static void signal_handler(int signum) {
    const int saved_errno = errno;
    received_signal.store(signum);
    const int fd = wake_write_fd.load();
    if (fd >= 0) {
        const unsigned char byte = static_cast<unsigned char>(signum);
        ssize_t written = ::write(fd, &byte, 1);
        (void)written;
    }
    errno = saved_errno;
}

static void dispatch(int signum) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    auto it = callbacks.find(signum);
    if (it == callbacks.end()) {
        return;
    }
    for (auto& cb : it->second.normal_callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        it->second.final_callback.value()(signum);
    }
}

static void watch(int read_fd) {
    while (true) {
        unsigned char byte = 0;
        const ssize_t n = ::read(read_fd, &byte, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // Zero byte is the stop request from reset()
        if (n <= 0 || byte == 0) {
            return;
        }
        dispatch(byte);
    }
}

static void start_watcher() {
    if (watcher.joinable()) {
        return;
    }
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create signal pipe: ") + std::strerror(errno));
    }
    // The handler must never block on a full pipe
    ::fcntl(fds[1], F_SETFL, ::fcntl(fds[1], F_GETFL) | O_NONBLOCK);
    wake_read_fd = fds[0];
    wake_write_fd.store(fds[1]);
    watcher = std::thread(watch, wake_read_fd);
}

static void stop_watcher() {
    if (!watcher.joinable()) {
        return;
    }
    const int fd = wake_write_fd.exchange(-1);
    const unsigned char stop = 0;
    ssize_t written = ::write(fd, &stop, 1);
    (void)written;
    watcher.join();
    ::close(fd);
    ::close(wake_read_fd);
    wake_read_fd = -1;
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    start_watcher();
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, signal_handler);
    }
}

void reset() {
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        for (const auto& kv : callbacks) {
            std::signal(kv.first, SIG_DFL);
        }
    }
    // Signals already queued are still dispatched before the watcher exits
    stop_watcher();

    std::lock_guard<std::mutex> lock(cb_mutex);
    callbacks.clear();
    received_signal = 0;
}

int last_signal() {
    return received_signal.load();
}

}
