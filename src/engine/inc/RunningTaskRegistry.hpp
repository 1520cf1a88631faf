#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "WorkerClient.hpp"

struct RunningTask {
    std::string name;
    int port = 0;
    std::shared_ptr<WorkerClient> worker;
    std::chrono::system_clock::time_point started_at;
};

// Tasks whose worker is alive, plus the port counter. Every access goes through one mutex.
// The {name: port} view is mirrored to a JSON file so other invocations can monitor a run.
class RunningTaskRegistry {
public:
    // An empty state_file disables persistence
    explicit RunningTaskRegistry(int base_port = 3284, std::string state_file = default_state_file());

    RunningTaskRegistry(const RunningTaskRegistry&) = delete;
    RunningTaskRegistry& operator=(const RunningTaskRegistry&) = delete;

    // Monotonic, never reused. No probe against ports already taken on the host.
    int allocate_port();

    void add(RunningTask task);

    // Removes the entry and hands its worker to the caller, who must stop it.
    // nullptr when the task is not registered (already removed by someone else).
    std::shared_ptr<WorkerClient> remove(const std::string& name);

    std::vector<RunningTask> list() const;
    size_t size() const;
    bool contains(const std::string& name) const;

    // Removes and stops every registered worker
    void stop_all();

    void clear_state_file();

    const std::string& state_file() const { return state_file_; }

    static std::string default_state_file();

    // Throws std::runtime_error when the file is missing or malformed
    static std::map<std::string, int> load_state(const std::string& path = default_state_file());

private:
    void save_locked() const;

    mutable std::mutex mutex_;
    std::map<std::string, RunningTask> tasks_;
    int next_port_;
    std::string state_file_;
};
