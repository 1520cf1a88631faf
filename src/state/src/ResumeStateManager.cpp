#include "ResumeStateManager.hpp"
#include "HashUtils.hpp"
#include "LogUtils.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

ResumeStateManager::ResumeStateManager(const std::string& output_dir)
    : state_path_((fs::path(output_dir) / STATE_FILE).string()) {}

bool ResumeStateManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ResumeState{};

    std::error_code ec;
    if (!fs::exists(state_path_, ec)) {
        LogUtils::debug("No resume state at {}, starting fresh", state_path_);
        return true;
    }

    std::ifstream ifs(state_path_);
    if (!ifs) {
        LogUtils::warn("Failed to read resume state {}, regenerating everything", state_path_);
        return false;
    }

    try {
        nlohmann::json json_data;
        ifs >> json_data;
        state_ = json_data.get<ResumeState>();
    } catch (const std::exception& e) {
        state_ = ResumeState{};
        LogUtils::warn("Failed to parse resume state {}: {}, regenerating everything", state_path_, e.what());
        return false;
    }

    LogUtils::debug("Loaded resume state with {} recorded outputs", state_.task_outputs.size());
    return true;
}

bool ResumeStateManager::save() const {
    // Task threads of one level save concurrently; writes must not interleave
    // and an older snapshot must never replace a newer one.
    std::lock_guard<std::mutex> save_lock(save_mutex_);

    nlohmann::json json_data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        json_data = state_;
    }

    std::error_code ec;
    fs::create_directories(fs::path(state_path_).parent_path(), ec);
    if (ec) {
        LogUtils::warn("Failed to create state directory for {}: {}", state_path_, ec.message());
        return false;
    }

    const std::string tmp_path = state_path_ + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs) {
            LogUtils::warn("Failed to open resume state for writing: {}", tmp_path);
            return false;
        }
        ofs << json_data.dump(2) << std::endl;
        if (!ofs) {
            LogUtils::warn("Failed to write resume state: {}", tmp_path);
            fs::remove(tmp_path, ec);
            return false;
        }
    }

    fs::rename(tmp_path, state_path_, ec);
    if (ec) {
        LogUtils::warn("Failed to replace resume state {}: {}", state_path_, ec.message());
        std::error_code remove_ec;
        fs::remove(tmp_path, remove_ec);
        return false;
    }
    return true;
}

void ResumeStateManager::update_input_hash(const std::vector<std::string>& files, const std::string& base_dir) {
    std::string hash = HashUtils::hash_files(files, base_dir);
    std::lock_guard<std::mutex> lock(mutex_);
    state_.input_hash = std::move(hash);
}

std::string ResumeStateManager::hash_profile(const ProjectProfile& profile) {
    // nlohmann::json objects keep keys sorted, so the dump is deterministic
    nlohmann::json config_data = {
        {"persona", profile.persona},
        {"stack", profile.stack},
        {"preferences", profile.preferences}
    };
    return HashUtils::sha256_hex(config_data.dump());
}

void ResumeStateManager::update_config_hash(const ProjectProfile& profile) {
    std::string hash = hash_profile(profile);
    std::lock_guard<std::mutex> lock(mutex_);
    state_.config_hash = std::move(hash);
}

void ResumeStateManager::record_output(const std::string& task_name,
                                       const std::string& output_path,
                                       const std::vector<std::string>& dependency_names) {
    std::string output_hash = HashUtils::hash_file(output_path);

    std::lock_guard<std::mutex> lock(mutex_);
    TaskOutputRecord record;
    record.output_path = output_path;
    record.output_hash = std::move(output_hash);
    record.input_hash_at_generation = state_.input_hash;
    record.config_hash_at_generation = state_.config_hash;
    for (const auto& dep : dependency_names) {
        auto it = state_.task_outputs.find(dep);
        if (it != state_.task_outputs.end()) {
            record.dependency_hashes[dep] = it->second.output_hash;
        }
    }
    state_.task_outputs[task_name] = std::move(record);
}

RegenerationDecision ResumeStateManager::should_regenerate(const std::string& task_name,
                                                           const std::string& output_path,
                                                           const std::vector<std::string>& dependency_names) const {
    OutputSnapshot current;
    std::error_code ec;
    current.exists = fs::exists(output_path, ec);
    if (current.exists) {
        try {
            current.hash = HashUtils::hash_file(output_path);
        } catch (const std::exception& e) {
            current.hash_error = e.what();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return evaluate_regeneration(state_, task_name, current, dependency_names);
}

void ResumeStateManager::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ResumeState{};
    }

    std::error_code ec;
    fs::remove(state_path_, ec);
    if (ec) {
        LogUtils::warn("Failed to remove resume state {}: {}", state_path_, ec.message());
    }
}

ResumeState ResumeStateManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}
