#include "RunningTaskRegistry.hpp"
#include "LogUtils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

RunningTaskRegistry::RunningTaskRegistry(int base_port, std::string state_file)
    : next_port_(base_port), state_file_(std::move(state_file)) {}

std::string RunningTaskRegistry::default_state_file() {
    std::error_code ec;
    fs::path temp_dir = fs::temp_directory_path(ec);
    if (ec) {
        temp_dir = "/tmp";
    }
    return (temp_dir / "agentpipe-state.json").string();
}

int RunningTaskRegistry::allocate_port() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_port_++;
}

void RunningTaskRegistry::add(RunningTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = task.name;
    tasks_[name] = std::move(task);
    save_locked();
}

std::shared_ptr<WorkerClient> RunningTaskRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return nullptr;
    }
    auto worker = std::move(it->second.worker);
    tasks_.erase(it);
    save_locked();
    return worker;
}

std::vector<RunningTask> RunningTaskRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RunningTask> result;
    result.reserve(tasks_.size());
    for (const auto& kv : tasks_) {
        result.push_back(kv.second);
    }
    return result;
}

size_t RunningTaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool RunningTaskRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(name) > 0;
}

void RunningTaskRegistry::stop_all() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : tasks_) {
            names.push_back(kv.first);
        }
    }

    for (const auto& name : names) {
        if (auto worker = remove(name)) {
            LogUtils::info("Stopping worker for {} (port {})", name, worker->port());
            worker->stop();
        }
    }
}

void RunningTaskRegistry::clear_state_file() {
    if (state_file_.empty()) return;
    std::error_code ec;
    fs::remove(state_file_, ec);
}

void RunningTaskRegistry::save_locked() const {
    if (state_file_.empty()) return;

    nlohmann::json state = nlohmann::json::object();
    for (const auto& kv : tasks_) {
        state[kv.first] = kv.second.port;
    }

    std::ofstream ofs(state_file_, std::ios::trunc);
    if (!ofs) {
        LogUtils::warn("Failed to write running task state: {}", state_file_);
        return;
    }
    ofs << state.dump() << std::endl;
}

std::map<std::string, int> RunningTaskRegistry::load_state(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("No running task state at " + path);
    }

    nlohmann::json state;
    try {
        ifs >> state;
        return state.get<std::map<std::string, int>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed running task state " + path + ": " + e.what());
    }
}
